#include "Experiment.h"
#include "Error.h"

using namespace ensemble;

const Experiment& ensemble::findBaseline(const std::vector<Experiment>& experiments) {
    const Experiment* found = nullptr;
    for (const auto& e : experiments) {
        if (!e.isBaseline()) continue;
        if (found)
            throw ConfigurationError("Only one baseline experiment is allowed, found " + found->name + " and " + e.name);
        found = &e;
    }
    if (!found) throw MissingBaselineError("No baseline experiment declared");
    return *found;
}

ExperimentRole ensemble::experimentRoleFromString(const std::string& text) {
    if (text == "baseline") return ExperimentRole::Baseline;
    if (text == "policy") return ExperimentRole::Policy;
    throw ConfigurationError("Unknown experiment role '" + text + "' (expected baseline or policy)");
}
