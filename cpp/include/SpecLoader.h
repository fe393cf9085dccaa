#pragma once
/**
 * @file SpecLoader.h
 * @brief Reads simulation specification files (parameters, results, experiments, variables, steps).
 */
#include <string>
#include <vector>

#include "Experiment.h"
#include "Parameter.h"
#include "ResultCollector.h"
#include "StepScheduler.h"

namespace ensemble {
    /**
     * @brief Everything a simulation is declared with.
     */
    struct SimulationSpec {
        std::vector<Parameter> parameters;
        std::vector<ResultDef> results;
        std::vector<Experiment> experiments;
        std::vector<Variable> vars;
        StepList steps;
    };

    /**
     * @brief Parse a YAML specification.
     *
     * Unknown keys are rejected so that misspellings do not pass silently.
     * @throws ConfigurationError naming the offending element
     */
    SimulationSpec loadSpecString(const std::string& yamlText);

    /** @throws ConfigurationError if the file cannot be read or is invalid */
    SimulationSpec loadSpecFile(const std::string& path);
}
