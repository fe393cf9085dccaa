#pragma once
/**
 * @file StateStore.h
 * @brief Relational store for simulations, experiments, trials, runs and their values.
 */
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "Experiment.h"
#include "Parameter.h"
#include "ParameterCompiler.h"
#include "RunStatus.h"

struct sqlite3;

namespace ensemble {
    struct SimulationRecord {
        int64_t id = 0;
        std::string name;
        int trialCount = 0;
        std::string description;
        uint64_t seed = 0;     /**< compiler seed, needed to resume compilation */
        int64_t createdAt = 0; /**< epoch ms */
    };

    /** One row of the run table joined with its experiment. Timestamps are epoch ms, 0 when unset. */
    struct RunRecord {
        int64_t runId = 0;
        int64_t simId = 0;
        int64_t expId = 0;
        std::string experiment;
        ExperimentRole role = ExperimentRole::Policy;
        int trialNum = 0;
        RunStatus status = RunStatus::PENDING;
        std::string workerId;
        int64_t queuedAt = 0;
        int64_t startedAt = 0;
        int64_t endedAt = 0;
        int retryCount = 0;
        std::string cause;
    };

    struct StatusCount {
        std::string experiment;
        RunStatus status;
        int64_t count;
    };

    /** One row of the `result` view. */
    struct OutputRecord {
        int64_t runId;
        int trialNum;
        std::string experiment;
        std::string result;
        double value;
    };

    /** Source of "now" in epoch milliseconds. */
    using Clock = std::function<int64_t()>;

    /** @brief Wall clock in epoch milliseconds. */
    int64_t systemMillis();

    /**
     * @brief SQLite-backed state of every simulation.
     *
     * Each instance owns one connection and must be used from one thread at a time;
     * concurrent workers open their own instance on the same file. All run status
     * changes are single-row compare-and-set updates, and a partial unique index
     * allows at most one PENDING, QUEUED or RUNNING row per (simulation, experiment, trial).
     */
    class StateStore {
    public:
        /**
         * @param path           database file, created if missing (":memory:" for a private store)
         * @param busyTimeoutMs  how long a statement waits on a lock held by another connection
         * @throws StoreError if the database cannot be opened or the schema cannot be created
         */
        explicit StateStore(const std::string& path, int busyTimeoutMs = 10000);
        ~StateStore();

        StateStore(const StateStore&) = delete;
        StateStore& operator=(const StateStore&) = delete;

        const std::string& path() const noexcept { return path_; }

        /** @brief Replace the clock used for run timestamps. */
        void setClock(Clock clock) { clock_ = std::move(clock); }

        int64_t now() const { return clock_(); }

        /**
         * @brief `BEGIN IMMEDIATE` scope, rolled back unless committed.
         */
        class Transaction {
        public:
            explicit Transaction(StateStore& store);
            ~Transaction();
            Transaction(const Transaction&) = delete;
            Transaction& operator=(const Transaction&) = delete;

            void commit();

        private:
            StateStore& store_;
            bool done_ = false;
        };

        // --- simulation setup ---

        int64_t createSimulation(const std::string& name, int trialCount, const std::string& description = "",
                                 uint64_t seed = 0);
        std::optional<SimulationRecord> simulation(int64_t simId) const;

        /** @throws StoreError on a duplicate name or a second baseline */
        int64_t createExperiment(int64_t simId, const Experiment& exp);
        std::vector<Experiment> experiments(int64_t simId) const;

        void createTrials(int64_t simId, int trialCount);
        int trialCount(int64_t simId) const;

        int64_t saveParameter(int64_t simId, const Parameter& param, DrawMode effectiveMode);
        std::map<std::string, int64_t> parameterIds(int64_t simId) const;

        /**
         * @brief Insert rows that are not present yet; existing rows are never changed.
         * @return number of rows written
         */
        int64_t insertInputValues(int64_t simId, const std::vector<InputValue>& rows);
        std::vector<InputValue> inputValues(int64_t simId) const;
        std::vector<InputValue> inputValues(int64_t simId, int trialNum) const;

        // --- runs ---

        /**
         * @brief Append a PENDING run.
         * @throws StoreError if the pair already has an active run
         */
        int64_t createRun(int64_t simId, int64_t expId, int trialNum, int retryCount = 0);
        std::optional<RunRecord> run(int64_t runId) const;
        std::vector<RunRecord> runs(int64_t simId, std::optional<RunStatus> status = std::nullopt) const;

        /** @brief The newest attempt of each (experiment, trial) pair. */
        std::vector<RunRecord> latestRuns(int64_t simId) const;

        /**
         * @brief PENDING runs whose dependency is satisfied, baselines first, by trial.
         */
        std::vector<RunRecord> claimCandidates(int64_t simId, int limit) const;

        /**
         * @brief Atomically move a PENDING run to QUEUED for `workerId`.
         *
         * Policy runs are only claimable once the baseline of the same trial SUCCEEDED.
         * @return false if another worker claimed it first or the dependency is unmet
         */
        bool claimRun(int64_t runId, const std::string& workerId);

        /**
         * @brief Compare-and-set the status of one run, stamping the matching timestamp.
         * @return false if the run was no longer in `from`
         * @throws StoreError for a transition outside the run state machine
         */
        bool transition(int64_t runId, RunStatus from, RunStatus to, const std::string& cause = "");

        /** @brief PENDING/QUEUED policy runs of one trial → ABORTED. */
        int abortDependents(int64_t simId, int trialNum, const std::string& cause);

        /** @brief PENDING/QUEUED (and optionally RUNNING) runs → ABORTED. */
        int abortActive(int64_t simId, const std::string& cause, bool includeRunning = false);

        /** @brief RUNNING runs started more than `timeoutMs` ago. */
        std::vector<RunRecord> timedOutRuns(int64_t simId, int64_t timeoutMs) const;

        int64_t countRuns(int64_t simId, const std::vector<RunStatus>& statuses) const;

        /** @brief Workers currently holding a QUEUED or RUNNING run. */
        std::vector<std::string> busyWorkers(int64_t simId) const;

        /** @brief Latest-attempt counts per experiment and status. */
        std::vector<StatusCount> statusSummary(int64_t simId) const;

        /** @brief Trials whose latest attempt, in any experiment, has one of `statuses`. */
        std::vector<int> trialsWithStatus(int64_t simId, const std::vector<RunStatus>& statuses) const;

        // --- results ---

        /** @brief Register a result name (idempotent) and return its id. */
        int64_t defineOutput(const std::string& name, const std::string& description = "",
                             const std::string& units = "");

        /**
         * @brief Write one output value.
         * @return false if the run already has a value for this result
         */
        bool saveOutputValue(int64_t runId, const std::string& result, double value);
        std::optional<double> outputValue(int64_t runId, const std::string& result) const;

        void saveTimeSeries(int64_t runId, const std::string& result, const std::string& region,
                            const std::map<int, double>& series);
        std::map<int, double> timeSeries(int64_t runId, const std::string& result) const;

        std::vector<OutputRecord> results(int64_t simId, const std::string& result) const;

        /** @brief Run raw SQL without results. */
        void exec(const std::string& sql);

    private:
        sqlite3* db_ = nullptr;
        std::string path_;
        Clock clock_;

        void initSchema();
    };
}
