#pragma once
/**
 * @file CompiledExpression.h
 * @brief An arithmetic expression evaluator for apply operators.
 */
#include <cstdint>
#include <memory>
#include <string>

namespace ensemble {
    /**
     * @brief Holds a compiled expression for fast repeated evaluation.
     *
     * The expression sees three variables: `value` (the draw), `base` (the value the
     * draw is applied to) and `trial` (the trial number).
     */
    class CompiledExpression {
    public:
        /**
         * @brief Compile a new expression from source.
         * @param expr  arithmetic expression over value, base and trial
         * @throws ConfigurationError if the expression does not compile
         */
        explicit CompiledExpression(const std::string& expr);

        ~CompiledExpression() = default;

        /**
         * @brief Evaluate for one draw. Safe to call from several threads.
         */
        double eval(double base, double value, int64_t trial) const;

        /** @brief Get the original source string. */
        std::string expr() const { return expr_; }

    private:
        const std::string expr_;
        struct Impl;
        std::shared_ptr<Impl> impl_;
    };
}
