#pragma once
/**
 * @file Experiment.h
 * @brief A named scenario evaluated on every trial of a simulation.
 */
#include <cstdint>
#include <string>
#include <vector>

namespace ensemble {
    /** @brief Policy experiments depend on the single baseline of their simulation. */
    enum class ExperimentRole { Baseline, Policy };

    struct Experiment {
        int64_t id = 0; /**< store id, 0 until persisted */
        std::string name;
        ExperimentRole role = ExperimentRole::Policy;
        std::string group; /**< scenario group, matched by step group patterns */
        std::string description;

        bool isBaseline() const noexcept { return role == ExperimentRole::Baseline; }
    };

    inline const char* toString(const ExperimentRole role) noexcept {
        return role == ExperimentRole::Baseline ? "baseline" : "policy";
    }

    /**
     * @brief The unique baseline of `experiments`.
     * @throws MissingBaselineError if there is none, ConfigurationError if there are several
     */
    const Experiment& findBaseline(const std::vector<Experiment>& experiments);

    ExperimentRole experimentRoleFromString(const std::string& text);
}
