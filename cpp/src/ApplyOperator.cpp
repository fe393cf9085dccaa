#include "ApplyOperator.h"
#include "CompiledExpression.h"
#include "Error.h"

#include <stdexcept>

using namespace ensemble;

ApplyRegistry::ApplyRegistry() {
    const ApplyFunction replace = [](double, const double value, int64_t) { return value; };
    const ApplyFunction multiply = [](const double base, const double value, int64_t) { return base * value; };

    operators_["direct"] = {replace, 0.0};
    operators_["replace"] = {replace, 0.0};
    operators_["add"] = {[](const double base, const double value, int64_t) { return base + value; }, 0.0};
    operators_["multiply"] = {multiply, 1.0};
    operators_["mult"] = {multiply, 1.0};
}

void ApplyRegistry::registerOperator(const std::string& name, ApplyFunction fn, const double identity) {
    if (name.empty()) throw std::invalid_argument("ApplyRegistry: operator name must not be empty");
    if (!fn) throw std::invalid_argument("ApplyRegistry: empty function for operator " + name);
    operators_[name] = {std::move(fn), identity};
}

void ApplyRegistry::registerExpression(const std::string& name, const std::string& expr, const double identity) {
    const CompiledExpression compiled(expr);
    registerOperator(name, [compiled](const double base, const double value, const int64_t trial) {
        return compiled.eval(base, value, trial);
    }, identity);
}

bool ApplyRegistry::contains(const std::string& name) const noexcept {
    return operators_.count(name) > 0;
}

const ApplyFunction& ApplyRegistry::resolve(const std::string& name) const {
    const auto it = operators_.find(name);
    if (it == operators_.end()) throw ConfigurationError("Unknown apply operator '" + name + "'");
    return it->second.fn;
}

double ApplyRegistry::identity(const std::string& name) const {
    const auto it = operators_.find(name);
    if (it == operators_.end()) throw ConfigurationError("Unknown apply operator '" + name + "'");
    return it->second.identity;
}

std::vector<std::string> ApplyRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(operators_.size());
    for (const auto& kv : operators_) out.push_back(kv.first);
    return out;
}
