#pragma once
/**
 * @file Dispatcher.h
 * @brief Run scheduling: workers claiming runs, and the controller driving them.
 */
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "ClusterManager.h"
#include "Config.h"
#include "StateStore.h"
#include "StepScheduler.h"

namespace ensemble {
    /**
     * @brief Everything the model needs to know about the run being executed.
     */
    struct RunContext {
        int64_t simId;
        int64_t runId;
        int trialNum;
        std::string experiment;
        ExperimentRole role;
        std::string trialDir;
        std::map<std::string, double> inputs; /**< parameter values seen by this experiment */
    };

    /**
     * @brief Executes one rendered step of a run.
     * @return exit status; anything but 0 fails the run
     */
    using ModelRunner = std::function<int(const RunContext& run, const ResolvedStep& step)>;

    /**
     * @brief Workflow shared by all workers of a simulation.
     */
    struct WorkflowPlan {
        std::string project;
        StepList steps;
        VariableEnvironment vars; /**< user variables; run variables are added per run */
        StepFilter filter;
        std::string simsDir = "sims";
        int maxSimDirs = 1000;
    };

    struct WorkerOptions {
        int pollMillis = 200;
        bool exitWhenIdle = true; /**< return once no PENDING run is left */
    };

    /**
     * @brief Claims runs of one simulation and executes their steps.
     *
     * A worker owns its own store connection, so workers may run on separate threads.
     */
    class Worker {
    public:
        /** @throws StoreError if the store cannot be opened, MissingBaselineError if the simulation has no baseline */
        Worker(const std::string& dbPath, int64_t simId, std::string workerId,
               std::shared_ptr<const WorkflowPlan> plan, ModelRunner runner, WorkerOptions opts = {});

        /**
         * @brief Claim and execute at most one run.
         * @return false if no run could be claimed
         */
        bool runOnce(const std::atomic<bool>& cancelled);

        /**
         * @brief Keep claiming runs until cancelled, or until idle when exitWhenIdle is set.
         * @return number of runs executed
         */
        int runUntilIdle(const std::atomic<bool>& cancelled);

        const std::string& id() const noexcept { return workerId_; }
        StateStore& store() noexcept { return store_; }

    private:
        StateStore store_;
        const int64_t simId_;
        const std::string workerId_;
        const std::shared_ptr<const WorkflowPlan> plan_;
        const ModelRunner runner_;
        const WorkerOptions opts_;
        std::map<int64_t, Experiment> experiments_; // by expId
        std::string baseline_;

        void execute(const RunRecord& run, const std::atomic<bool>& cancelled);
        void perform(const RunRecord& run, const std::string& tag, const std::atomic<bool>& cancelled);
        void finish(int64_t runId, RunStatus to, const std::string& cause);
    };

    struct DispatcherOptions {
        int maxWorkers = 8;
        int maxRetries = 0;
        int64_t runTimeoutMs = 0; /**< 0 disables the timeout */
        int pollMillis = 200;
        bool shutdownWhenIdle = true;

        /** @brief From MCS.MaxWorkers, MaxRetries, RunTimeoutSecs, PollMillis and ShutdownWhenIdle. */
        static DispatcherOptions fromConfig(const Config& config);
    };

    /**
     * @brief Outcome of a simulation: latest-attempt counts and the trials needing attention.
     */
    struct DispatchSummary {
        std::map<RunStatus, int64_t> counts;
        std::vector<int> failedTrials;
        std::vector<int> abortedTrials;

        int64_t count(RunStatus status) const;
        std::string describe() const;
    };

    /**
     * @brief Controller of one simulation: creates runs, retries failures, cascades
     * baseline failures and sizes the worker pool.
     */
    class Dispatcher {
    public:
        Dispatcher(StateStore& store, int64_t simId, ClusterManager& cluster, DispatcherOptions opts);

        /**
         * @brief Append a PENDING run for every experiment of each trial lacking an active run.
         * @return number of runs created
         */
        int scheduleTrials(const std::vector<int>& trials);

        /**
         * @brief Reschedule (trial, experiment) pairs whose latest attempt has one of `statuses`.
         *
         * Redoing a baseline also redoes the policy runs aborted with it.
         * @return number of runs created
         */
        int redo(const std::vector<RunStatus>& statuses);

        /**
         * @brief One control pass: timeouts, retries and cascades, then worker scaling.
         * @return true while PENDING, QUEUED or RUNNING runs remain
         */
        bool step();

        /**
         * @brief Call step() every pollMillis until no work remains or stop() is called.
         *
         * Returns only after every worker job has ended, so the summary holds terminal statuses only.
         */
        DispatchSummary runUntilDone();

        /**
         * @brief PENDING/QUEUED runs → ABORTED and every worker job cancelled.
         *
         * Must be called from the thread driving the dispatcher; other threads use requestStop().
         */
        void stop(const std::string& cause);

        /** @brief Make runUntilDone() call stop() at its next pass. Thread-safe. */
        void requestStop() noexcept { stopRequested_ = true; }

        DispatchSummary summary() const;

        /** @brief Jobs submitted by this dispatcher that are still active. */
        std::vector<std::string> activeJobs() const;

    private:
        StateStore& store_;
        const int64_t simId_;
        ClusterManager& cluster_;
        const DispatcherOptions opts_;
        std::set<std::string> jobs_;
        std::map<std::string, std::string> jobWorkers_; // jobId -> workerId
        std::set<int64_t> settled_;                     // failed runs already retried or cascaded
        std::atomic<bool> stopping_{false};
        std::atomic<bool> stopRequested_{false};
        int nextWorker_ = 1;

        void expireTimedOut();
        void settleFailures();
        void scaleWorkers();
        void drainWorkers();
    };
}
