#pragma once
/**
 * @file Distribution.h
 * @brief Probability distributions used to draw parameter values per trial.
 */
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace ensemble {
    enum class DistributionKind {
        Constant, Uniform, LogUniform, Normal, Lognormal, Triangle, Integers, Grid, Sequence, Binary, Linked
    };

    const char* toString(DistributionKind kind) noexcept;

    /**
     * @brief Everything a single draw may depend on.
     */
    struct SampleContext {
        int64_t trialNum = 0; /**< realization index, drives Grid and Sequence */
        double percentile = 0.5; /**< stratified (possibly rank-correlated) position in [0,1) */
        std::function<double(const std::string&)> linkedValue; /**< draw of another parameter, same trial */
    };

    /**
     * @brief One resolved distribution.
     *
     * Instances are created from a kind name and a set of named arguments; the pair
     * (kind, argument names) selects one of the supported signatures, e.g.
     * Triangle(min, max, mode) or Triangle(logfactor).
     */
    class Distribution {
    public:
        /**
         * @brief Resolve a distribution from its declaration.
         * @param kind    kind name, case-insensitive ("uniform", "Lognormal", ...)
         * @param args    named numeric arguments
         * @param values  the value list of a Sequence
         * @param linked  the target parameter of a Linked distribution
         * @throws DistributionSpecError on an unknown signature or invalid argument values
         */
        static Distribution fromArgs(const std::string& kind, const std::map<std::string, double>& args,
                                     const std::vector<double>& values = {}, const std::string& linked = "");

        static Distribution constant(double value);
        static Distribution uniform(double min, double max);
        static Distribution logUniform(double min, double max);
        static Distribution normal(double mean, double stdev);
        /** @brief Lognormal from the parameters of the underlying normal. */
        static Distribution lognormal(double logMean, double logStdev);
        static Distribution triangle(double min, double mode, double max);
        static Distribution integers(int64_t min, int64_t max);
        static Distribution grid(double min, double max, int count);
        static Distribution sequence(std::vector<double> values);
        static Distribution binary();
        static Distribution linked(const std::string& parameter);

        DistributionKind kind() const noexcept { return kind_; }

        /** @brief Does a draw consume a percentile? (false for Constant, Grid, Sequence, Linked) */
        bool isStochastic() const noexcept;

        /** @brief Target parameter of a Linked distribution, empty otherwise. */
        const std::string& linkedTo() const noexcept { return linked_; }

        /**
         * @brief Inverse CDF for stochastic kinds.
         * @param u  percentile in [0,1); clipped away from 0 and 1 for unbounded kinds
         */
        double ppf(double u) const;

        /**
         * @brief Produce the draw for one trial.
         * @throws std::logic_error if a Linked draw has no linkedValue callback
         */
        double sample(const SampleContext& ctx) const;

        /** @brief Canonical text form, e.g. "Triangle(min=0.8, mode=1, max=1.2)". */
        std::string describe() const;

    private:
        Distribution(DistributionKind kind, double a, double b, double c);

        DistributionKind kind_;
        double a_, b_, c_;
        std::vector<double> values_;
        std::string linked_;
    };
}
