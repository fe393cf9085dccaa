#pragma once
/**
 * @file ClusterManager.h
 * @brief Worker job submission: the cluster interface, an in-process pool and batch commands.
 */
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "Config.h"

namespace ensemble {
    enum class JobState { Pending, Running, Finished, Cancelled };

    std::string toString(JobState state);

    /** A request to start one worker. */
    struct JobRequest {
        std::string jobName;
        int64_t simId = 0;
        std::string workerId;
    };

    /**
     * @brief Narrow interface to whatever starts worker processes.
     */
    class ClusterManager {
    public:
        virtual ~ClusterManager() = default;

        /**
         * @brief Start a worker job.
         * @return job id
         * @throws ExecutionError if the job cannot be started
         */
        virtual std::string submit(const JobRequest& request) = 0;

        /** @brief Ask a job to stop; unknown or finished jobs are ignored. */
        virtual void cancel(const std::string& jobId) = 0;

        /** @throws std::out_of_range for an unknown job id */
        virtual JobState poll(const std::string& jobId) const = 0;

        /** @brief How many more jobs could be started now. */
        virtual int availableSlots() const = 0;

        /** @brief Ids of Pending or Running jobs. */
        virtual std::vector<std::string> activeJobs() const = 0;
    };

    /** Body of a local job; it should return soon after `cancelled` turns true. */
    using JobBody = std::function<void(const JobRequest& request, const std::atomic<bool>& cancelled)>;

    /**
     * @brief ClusterManager running each job on its own thread.
     *
     * The destructor cancels every job and joins its thread.
     */
    class LocalCluster final : public ClusterManager {
    public:
        /**
         * @param slots  maximum number of concurrently running jobs
         * @param body   work done by every job
         */
        LocalCluster(int slots, JobBody body);
        ~LocalCluster() override;

        LocalCluster(const LocalCluster&) = delete;
        LocalCluster& operator=(const LocalCluster&) = delete;

        std::string submit(const JobRequest& request) override;
        void cancel(const std::string& jobId) override;
        JobState poll(const std::string& jobId) const override;
        int availableSlots() const override;
        std::vector<std::string> activeJobs() const override;

        /** @brief Block until every submitted job has returned. */
        void waitAll();

        /** @brief Jobs whose thread is still held; returned jobs are joined and dropped. */
        std::size_t liveJobs() const;

    private:
        struct Job {
            JobRequest request;
            std::atomic<bool> cancelled{false};
            std::atomic<JobState> state{JobState::Pending};
            std::thread thread;
        };

        const int slots_;
        const JobBody body_;
        mutable std::mutex mtx_;
        std::map<std::string, std::unique_ptr<Job>> jobs_;
        std::map<std::string, JobState> ended_; // final state of reaped jobs
        int64_t nextId_ = 1;

        int activeCount() const;
        void reap();
    };

    /**
     * @brief Sizing of one batch submission.
     */
    struct BatchPlan {
        int engines;
        int nodes;
        int minutesPerEngine;
        std::string walltime; /**< HH:MM:00 */
    };

    /**
     * @brief engines = min(trials, maxEngines), nodes = ceil(engines / tasksPerNode),
     * walltime = minutesPerRun × ceil(trials / engines).
     * @throws std::invalid_argument unless every argument is positive
     */
    BatchPlan planBatch(int trials, int maxEngines, int tasksPerNode, int minutesPerRun);

    /**
     * @brief Renders submission commands from `<MCS.BatchSystem>.BatchCommand` templates.
     *
     * Templates may use {jobName}, {walltime}, {logFile}, {nodes}, {engines},
     * {tasksPerNode}, {partition} (SLURM.Partition) and {queue} (PBS.Queue).
     */
    class BatchCommandBuilder {
    public:
        explicit BatchCommandBuilder(const ConfigSource& config);

        /** @throws ConfigurationError if the batch system has no template or a placeholder is unbound */
        std::string render(const BatchPlan& plan, const std::string& jobName, const std::string& logFile) const;

    private:
        const ConfigSource& config_;
    };
}
