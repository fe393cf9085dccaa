#include "ClusterManager.h"
#include "Error.h"
#include "Logging.h"
#include "StepScheduler.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <stdexcept>

using namespace ensemble;

std::string ensemble::toString(const JobState state) {
    switch (state) {
        case JobState::Pending: return "pending";
        case JobState::Running: return "running";
        case JobState::Finished: return "finished";
        case JobState::Cancelled: return "cancelled";
    }
    return "pending";
}

//---- LocalCluster ----
LocalCluster::LocalCluster(const int slots, JobBody body) : slots_(slots), body_(std::move(body)) {
    if (slots_ <= 0) throw std::invalid_argument("LocalCluster needs at least one slot");
    if (!body_) throw std::invalid_argument("LocalCluster needs a job body");
}

LocalCluster::~LocalCluster() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto& kv : jobs_) kv.second->cancelled = true;
    }
    waitAll();
}

int LocalCluster::activeCount() const {
    return static_cast<int>(std::count_if(jobs_.begin(), jobs_.end(), [](const auto& kv) {
        const JobState s = kv.second->state.load();
        return s == JobState::Pending || s == JobState::Running;
    }));
}

//---- reap(): join returned jobs and keep only their final state; caller holds mtx_ ----
void LocalCluster::reap() {
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        const JobState s = it->second->state.load();
        if (s == JobState::Pending || s == JobState::Running) {
            ++it;
            continue;
        }
        if (it->second->thread.joinable()) it->second->thread.join();
        ended_[it->first] = s;
        it = jobs_.erase(it);
    }
}

std::string LocalCluster::submit(const JobRequest& request) {
    std::lock_guard<std::mutex> lock(mtx_);
    reap();
    if (activeCount() >= slots_) throw ExecutionError("No free slot for job " + request.jobName);

    const std::string jobId = "local-" + std::to_string(nextId_++);
    auto job = std::make_unique<Job>();
    job->request = request;
    Job& wk = *job;
    jobs_.emplace(jobId, std::move(job));

    wk.thread = std::thread([&wk, jobId, this] {
        wk.state = JobState::Running;
        try {
            body_(wk.request, wk.cancelled);
        }
        catch (const std::exception& e) {
            logError("Job " + jobId + " (" + wk.request.workerId + ") failed: " + e.what());
        }
        wk.state = wk.cancelled ? JobState::Cancelled : JobState::Finished;
    });
    logDebug("Started job " + jobId + " for worker " + request.workerId);
    return jobId;
}

void LocalCluster::cancel(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mtx_);
    reap();
    const auto it = jobs_.find(jobId);
    if (it == jobs_.end()) return;
    it->second->cancelled = true;
}

JobState LocalCluster::poll(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = jobs_.find(jobId);
    if (it != jobs_.end()) return it->second->state.load();
    const auto ended = ended_.find(jobId);
    if (ended == ended_.end()) throw std::out_of_range("Unknown job " + jobId);
    return ended->second;
}

int LocalCluster::availableSlots() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return slots_ - activeCount();
}

std::vector<std::string> LocalCluster::activeJobs() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> ids;
    for (const auto& kv : jobs_) {
        const JobState s = kv.second->state.load();
        if (s == JobState::Pending || s == JobState::Running) ids.push_back(kv.first);
    }
    return ids;
}

void LocalCluster::waitAll() {
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            reap();
            if (jobs_.empty()) return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

std::size_t LocalCluster::liveJobs() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return jobs_.size();
}

//---- planBatch(): engines, nodes and walltime for one submission ----
BatchPlan ensemble::planBatch(const int trials, const int maxEngines, const int tasksPerNode, const int minutesPerRun) {
    if (trials <= 0 || maxEngines <= 0 || tasksPerNode <= 0 || minutesPerRun <= 0)
        throw std::invalid_argument("planBatch: all arguments must be positive");

    BatchPlan plan{};
    plan.engines = std::min(trials, maxEngines);
    plan.nodes = (plan.engines + tasksPerNode - 1) / tasksPerNode;
    plan.minutesPerEngine = minutesPerRun * ((trials + plan.engines - 1) / plan.engines);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:00", plan.minutesPerEngine / 60, plan.minutesPerEngine % 60);
    plan.walltime = buf;
    return plan;
}

//---- BatchCommandBuilder ----
BatchCommandBuilder::BatchCommandBuilder(const ConfigSource& config) : config_(config) {}

std::string BatchCommandBuilder::render(const BatchPlan& plan, const std::string& jobName,
                                        const std::string& logFile) const {
    const std::string system = config_.get("MCS.BatchSystem").value_or("SLURM");
    const auto tmpl = config_.get(system + ".BatchCommand");
    if (!tmpl) throw ConfigurationError("No " + system + ".BatchCommand template configured");

    VariableEnvironment env;
    env.set("jobName", jobName);
    env.set("walltime", plan.walltime);
    env.set("logFile", logFile);
    env.set("nodes", std::to_string(plan.nodes));
    env.set("engines", std::to_string(plan.engines));
    if (const auto tpn = config_.get("IPP.TasksPerNode")) env.set("tasksPerNode", *tpn);
    if (const auto partition = config_.get("SLURM.Partition")) env.set("partition", *partition);
    if (const auto queue = config_.get("PBS.Queue")) env.set("queue", *queue);
    return env.render(*tmpl);
}
