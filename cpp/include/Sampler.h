#pragma once
/**
 * @file Sampler.h
 * @brief Abstract and concrete percentile samplers.
 */
#include <memory>
#include <string>
#include <vector>
#include "RngEngine.h"

namespace ensemble {
    /**
     * @brief Abstract base class for all percentile samplers.
     *
     * A sampler turns a trial count into one percentile per trial for a single
     * parameter column; the Distribution maps it through its inverse CDF.
     */
    class Sampler {
    public:
        virtual ~Sampler() = default;

        /**
         * @brief Fork this prototype onto a new random stream.
         * @param rng  The stream the copy draws from.
         */
        virtual std::unique_ptr<Sampler> clone(const RngEngine& rng) const = 0;

        /**
         * @brief Percentiles for `n` trials, in trial order.
         * @param n  Number of trials.
         * @return   `n` values in [0,1).
         */
        virtual std::vector<double> percentiles(int n) = 0;

        /**
         * @brief Percentiles for `n` trials in ascending order.
         *
         * Used when a rank-correlation step decides the trial order afterwards.
         */
        virtual std::vector<double> sortedPercentiles(int n) = 0;
    };


    /**
     * @brief Latin-Hypercube sampler: one uniform draw inside each of n equal strata.
     *
     * Samples uniformly within strata, optionally scrambled across trials.
     */
    class LatinHypercubeSampler final : public Sampler {
    public:
        /**
         * @param rng       RngEngine for shuffle and uniforms.
         * @param scramble  If true, shuffle strata across trials.
         */
        explicit LatinHypercubeSampler(const RngEngine& rng, bool scramble = true)
            : rng_(rng), scramble_(scramble) {}

        std::unique_ptr<Sampler> clone(const RngEngine& rng) const override {
            return std::make_unique<LatinHypercubeSampler>(rng, scramble_);
        }

        std::vector<double> percentiles(int n) override;

        std::vector<double> sortedPercentiles(int n) override;

    private:
        RngEngine rng_;
        const bool scramble_;

        /**
         * @brief Generate a random permutation of 0…n-1.
         */
        std::vector<int> shuffledIndices(int n);
    };

    /**
     * @brief Plain Monte Carlo: independent uniform percentiles.
     */
    class SimpleRandomSampler final : public Sampler {
    public:
        explicit SimpleRandomSampler(const RngEngine& rng) : rng_(rng) {}

        std::unique_ptr<Sampler> clone(const RngEngine& rng) const override {
            return std::make_unique<SimpleRandomSampler>(rng);
        }

        std::vector<double> percentiles(int n) override;

        std::vector<double> sortedPercentiles(int n) override;

    private:
        RngEngine rng_;
    };

    /**
     * @brief Build the sampler prototype named by a configuration value ("lhs" or "random").
     * @throws ConfigurationError for any other name
     */
    std::unique_ptr<Sampler> makeSampler(const std::string& method, const RngEngine& rng);
}
