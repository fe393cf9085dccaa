#include "CompiledExpression.h"
#include "Error.h"

#include <exprtk.hpp>
#include <mutex>

using namespace ensemble;


struct CompiledExpression::Impl {
    exprtk::symbol_table<double> symbols;
    exprtk::expression<double> expression;
    exprtk::parser<double> parser;
    std::mutex mutex; // guards the bound variables below

    double value = 0.0, base = 0.0, trial = 0.0;

    explicit Impl(const std::string& expr) {
        symbols.add_variable("value", value);
        symbols.add_variable("base", base);
        symbols.add_variable("trial", trial);
        symbols.add_constants(); // math constants (pi, e, etc.)
        expression.register_symbol_table(symbols);

        if (!parser.compile(expr, expression))
            throw ConfigurationError("ExprTk compile error in '" + expr + "': " + parser.error());
    }
};

CompiledExpression::CompiledExpression(const std::string& expr):
    expr_(expr), impl_(std::make_shared<Impl>(expr)) {}


double CompiledExpression::eval(const double base, const double value, const int64_t trial) const {
    auto& impl = *impl_;
    std::lock_guard<std::mutex> lock(impl.mutex);
    impl.base = base;
    impl.value = value;
    impl.trial = static_cast<double>(trial);

    return impl.expression.value();
}
