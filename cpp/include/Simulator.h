#pragma once
/**
 * @file Simulator.h
 * @brief Facade tying specification, compiler, store, dispatcher and result collection together.
 */
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ApplyOperator.h"
#include "Config.h"
#include "Dispatcher.h"
#include "ParameterCompiler.h"
#include "ResultCollector.h"
#include "SpecLoader.h"
#include "StateStore.h"

namespace ensemble {
    /**
     * @brief Orchestrates one project's simulations: initialization, execution and result collection.
     */
    class Simulator {
    public:
        /**
         * @param config    configuration; copied
         * @param spec      parameters, results, experiments, variables and steps
         * @param registry  apply operators available to the parameters
         * @param project   name bound to {project} in step templates
         * @throws ConfigurationError (or a subclass) for any invalid declaration
         * @throws StoreError if MCS.DbPath cannot be opened
         */
        Simulator(const Config& config, SimulationSpec spec, ApplyRegistry registry = ApplyRegistry(),
                  std::string project = "ensemble");

        /**
         * @brief Validate everything, compile all input values and persist the simulation.
         *
         * All writes happen in one transaction: a configuration error leaves the store untouched.
         * @return the new simulation id
         */
        int64_t initialize(const std::string& name, int trialCount, const std::string& description = "");

        /**
         * @brief Recompile with the stored seed and write any input values that are missing.
         * @return number of rows written
         */
        int64_t resume(int64_t simId);

        /**
         * @brief Schedule `trials` (all trials when empty) and run them to completion on local workers.
         * @throws ConfigurationError if the store is in-memory, which workers cannot share
         */
        DispatchSummary run(int64_t simId, const ModelRunner& runner, const std::vector<int>& trials = {});

        /** @brief Rerun the (trial, experiment) pairs whose latest attempt has one of `statuses`. */
        DispatchSummary redo(int64_t simId, const ModelRunner& runner, const std::vector<RunStatus>& statuses);

        /**
         * @brief Collect results of every successful run.
         * @param source  where query results are read; files under MCS.RunSimsDir when null
         */
        int collect(int64_t simId, std::shared_ptr<const ResultSource> source = nullptr);

        /** @brief Stop the simulation currently running, if any. Thread-safe. */
        void requestStop();

        /** @brief Steps `experiment` would execute for `trialNum`, rendered. */
        std::vector<ResolvedStep> previewSteps(const std::string& experiment, int64_t simId = 0, int trialNum = 0) const;

        StateStore& store() noexcept { return store_; }
        const Config& config() const noexcept { return config_; }
        const SimulationSpec& spec() const noexcept { return spec_; }
        std::shared_ptr<const WorkflowPlan> workflow() const noexcept { return plan_; }

    private:
        const Config config_;
        SimulationSpec spec_;
        const ApplyRegistry registry_;
        StateStore store_;
        std::shared_ptr<WorkflowPlan> plan_;

        std::mutex mtx_;
        Dispatcher* active_ = nullptr;

        ParameterCompiler makeCompiler(uint64_t seed) const;
        DispatchSummary execute(int64_t simId, const ModelRunner& runner,
                                const std::function<void(Dispatcher&)>& schedule);
    };
}
