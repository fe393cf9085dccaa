#pragma once
/**
 * @file Parameter.h
 * @brief Describes one uncertain model input: its distribution and how draws are applied.
 */
#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Distribution.h"
#include "Error.h"

namespace ensemble {
    /** @brief Shared parameters draw once per trial, independent ones once per (trial, experiment). */
    enum class DrawMode { Shared, Independent };

    /** @brief Target rank correlation with another parameter. */
    struct Correlation {
        std::string with;
        double coefficient;
    };

    /**
     * @brief One dimension of the trial ensemble.
     */
    struct Parameter {
        std::string name;
        Distribution distribution;
        DrawMode mode = DrawMode::Shared;
        std::string apply = "direct"; /**< apply operator name, resolved in an ApplyRegistry */
        std::optional<double> lowBound; /**< clamp applied after the operator */
        std::optional<double> highBound;
        std::optional<double> baseValue; /**< value the operator combines with; the operator's identity if unset */
        std::vector<Correlation> correlations;
        bool active = true;
        std::string description;

        /**
         * @param name_          unique parameter name
         * @param distribution_  resolved distribution
         * @throws ConfigurationError if name_ is empty
         */
        Parameter(std::string name_, Distribution distribution_)
            : name(std::move(name_)), distribution(std::move(distribution_)) {
            if (name.empty()) throw ConfigurationError("Parameter: name must not be empty");
        }

        /**
         * @brief Set both bounds.
         * @throws ConfigurationError if low > high
         */
        Parameter& bounds(const std::optional<double> low, const std::optional<double> high) {
            if (low && high && *low > *high)
                throw ConfigurationError("Parameter " + name + ": lowbound must be <= highbound");
            lowBound = low;
            highBound = high;
            return *this;
        }

        /** @brief Clamp `v` into [lowBound, highBound]. */
        double clamp(double v) const noexcept {
            if (lowBound) v = std::max(v, *lowBound);
            if (highBound) v = std::min(v, *highBound);
            return v;
        }

        bool isLinked() const noexcept { return distribution.kind() == DistributionKind::Linked; }
    };

    inline const char* toString(const DrawMode mode) noexcept {
        return mode == DrawMode::Shared ? "shared" : "independent";
    }
}
