#pragma once
/**
 * @file ParameterCompiler.h
 * @brief Turns a parameter set into realized per-trial input values.
 */
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ApplyOperator.h"
#include "Correlation.h"
#include "Experiment.h"
#include "Parameter.h"

namespace ensemble {
    /**
     * @brief Realized value of one parameter for one trial.
     *
     * `experiment` is empty for shared parameters, whose value holds for every experiment.
     */
    struct InputValue {
        int trialNum;
        std::string parameter;
        std::string experiment;
        double value;
    };

    /**
     * @brief Lookup over compiled rows that falls back from experiment-specific to shared values.
     */
    class InputValueTable {
    public:
        explicit InputValueTable(const std::vector<InputValue>& rows);

        std::optional<double> value(int trialNum, const std::string& parameter, const std::string& experiment) const;

        /** @brief All parameter values seen by `experiment` in one trial. */
        std::map<std::string, double> valuesFor(int trialNum, const std::string& experiment) const;

    private:
        // (trial, parameter) -> experiment ("" for shared) -> value
        std::map<std::pair<int, std::string>, std::map<std::string, double>> values_;
    };

    /**
     * @brief Draws every active parameter for every trial.
     *
     * Construction validates the whole set so that configuration errors surface
     * before anything is persisted. Each (parameter, experiment) column draws from
     * its own stream derived from the seed, so compiling twice with the same seed
     * reproduces every value.
     */
    class ParameterCompiler {
    public:
        /**
         * @param params    parameter declarations; inactive ones are ignored
         * @param registry  apply operators available to the parameters
         * @param seed      master seed for all columns
         * @param method    percentile sampler, "lhs" or "random"
         * @throws ConfigurationError (or a subclass) for duplicate names, unknown apply
         *         operators, dangling or cyclic links and invalid correlations
         */
        ParameterCompiler(std::vector<Parameter> params, const ApplyRegistry& registry, uint64_t seed,
                          const std::string& method = "lhs");

        /**
         * @brief Compile all values for trials 0..trialCount-1.
         * @throws ConfigurationError if trialCount < 1 or the experiments lack a baseline
         */
        std::vector<InputValue> compile(int trialCount, const std::vector<Experiment>& experiments) const;

        /** @brief Active parameter names, each after the parameter it links to. */
        const std::vector<std::string>& order() const noexcept { return order_; }

        /** @brief Draw mode after inheriting through links. */
        DrawMode effectiveMode(const std::string& name) const;

        const std::vector<Parameter>& parameters() const noexcept { return params_; }

        const std::vector<CorrelationGroup>& correlationGroups() const noexcept { return groups_; }

        uint64_t seed() const noexcept { return seed_; }

    private:
        std::vector<Parameter> params_;
        const ApplyRegistry registry_;
        const uint64_t seed_;
        const std::string method_;

        std::map<std::string, size_t> index_;
        std::vector<std::string> order_;
        std::map<std::string, DrawMode> modes_;
        std::vector<CorrelationGroup> groups_;

        const Parameter& byName(const std::string& name) const { return params_[index_.at(name)]; }

        void resolveLinks();
    };
}
