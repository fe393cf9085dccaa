#pragma once
/**
 * @file ApplyOperator.h
 * @brief Named operators combining a parameter draw with the input it modifies.
 */
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace ensemble {
    /** f(base, value, trial) -> applied value */
    using ApplyFunction = std::function<double(double base, double value, int64_t trial)>;

    /**
     * @brief Table of apply operators, resolved once when a simulation is initialized.
     *
     * Built-ins: `direct` and `replace` (the draw overwrites the base), `add`,
     * `multiply` and its alias `mult`.
     */
    class ApplyRegistry {
    public:
        ApplyRegistry();

        /**
         * @brief Register (or replace) a custom operator.
         * @param identity  base value used when a parameter supplies none
         * @throws std::invalid_argument for an empty name or function
         */
        void registerOperator(const std::string& name, ApplyFunction fn, double identity = 0.0);

        /**
         * @brief Register an operator defined by an arithmetic expression over value, base and trial.
         * @throws ConfigurationError if the expression does not compile
         */
        void registerExpression(const std::string& name, const std::string& expr, double identity = 0.0);

        bool contains(const std::string& name) const noexcept;

        /**
         * @throws ConfigurationError for an unknown name
         */
        const ApplyFunction& resolve(const std::string& name) const;

        /** @brief Base value assumed when none is given (1 for multiply, 0 otherwise). */
        double identity(const std::string& name) const;

        std::vector<std::string> names() const;

        /** @brief Resolve, apply and return f(base, value, trial). */
        double apply(const std::string& name, double base, double value, int64_t trial) const {
            return resolve(name)(base, value, trial);
        }

    private:
        struct Entry {
            ApplyFunction fn;
            double identity;
        };
        std::map<std::string, Entry> operators_;
    };
}
