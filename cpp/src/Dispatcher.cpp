#include "Dispatcher.h"
#include "Error.h"
#include "Logging.h"
#include "ParameterCompiler.h"
#include "Trials.h"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <thread>

using namespace ensemble;

namespace {
    void pause(const int millis, const std::atomic<bool>& cancelled) {
        const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(millis);
        while (!cancelled && std::chrono::steady_clock::now() < until)
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(millis, 20)));
    }
}

//------------------------------------------------------------------------------
// Worker
//------------------------------------------------------------------------------
Worker::Worker(const std::string& dbPath, const int64_t simId, std::string workerId,
               std::shared_ptr<const WorkflowPlan> plan, ModelRunner runner, const WorkerOptions opts)
    : store_(dbPath),
      simId_(simId),
      workerId_(std::move(workerId)),
      plan_(std::move(plan)),
      runner_(std::move(runner)),
      opts_(opts) {
    if (!plan_) throw std::invalid_argument("Worker requires a workflow plan");
    if (!runner_) throw std::invalid_argument("Worker requires a model runner");

    const auto exps = store_.experiments(simId_);
    baseline_ = findBaseline(exps).name;
    for (const auto& e : exps) experiments_[e.id] = e;
}

bool Worker::runOnce(const std::atomic<bool>& cancelled) {
    for (const auto& candidate : store_.claimCandidates(simId_, 16)) {
        if (cancelled) return false;
        if (!store_.claimRun(candidate.runId, workerId_)) continue; // lost the race

        if (!store_.transition(candidate.runId, RunStatus::QUEUED, RunStatus::RUNNING)) {
            logWarn("Run " + std::to_string(candidate.runId) + " left QUEUED before " + workerId_ + " could start it");
            return true;
        }
        execute(candidate, cancelled);
        return true;
    }
    return false;
}

int Worker::runUntilIdle(const std::atomic<bool>& cancelled) {
    int executed = 0;
    while (!cancelled) {
        if (runOnce(cancelled)) {
            ++executed;
            continue;
        }
        if (opts_.exitWhenIdle && store_.countRuns(simId_, {RunStatus::PENDING}) == 0) break;
        pause(opts_.pollMillis, cancelled);
    }
    logDebug("Worker " + workerId_ + " exiting after " + std::to_string(executed) + " runs");
    return executed;
}

void Worker::finish(const int64_t runId, const RunStatus to, const std::string& cause) {
    if (!store_.transition(runId, RunStatus::RUNNING, to, cause))
        logWarn("Run " + std::to_string(runId) + " was no longer RUNNING; " + toString(to) + " not recorded");
}

//---- execute(): a RUNNING run always leaves with a terminal status or an exception from the store ----
void Worker::execute(const RunRecord& run, const std::atomic<bool>& cancelled) {
    const std::string tag = "Run " + std::to_string(run.runId) + " (trial " + std::to_string(run.trialNum) + ", " +
                            run.experiment + ")";
    try {
        perform(run, tag, cancelled);
    }
    catch (const std::exception& e) {
        logError(tag + ": " + e.what());
        finish(run.runId, RunStatus::FAILED, e.what());
    }
}

//---- perform(): resolve the steps of one run and hand them to the runner ----
void Worker::perform(const RunRecord& run, const std::string& tag, const std::atomic<bool>& cancelled) {
    const auto exp = experiments_.find(run.expId);
    if (exp == experiments_.end())
        throw ConfigurationError("experiment " + run.experiment + " was added after worker " + workerId_ + " started");

    RunContext ctx{run.simId, run.runId, run.trialNum, run.experiment, run.role, "", {}};
    ctx.trialDir = trialDirectory(plan_->simsDir, run.simId, run.trialNum, plan_->maxSimDirs);
    ctx.inputs =
        InputValueTable(store_.inputValues(run.simId, run.trialNum)).valuesFor(run.trialNum, exp->second.name);

    VariableEnvironment env = plan_->vars;
    RunVariables rv;
    rv.project = plan_->project;
    rv.simId = run.simId;
    rv.trialNum = run.trialNum;
    rv.scenario = exp->second.name;
    rv.baseline = baseline_;
    rv.scenarioGroup = exp->second.group;
    rv.simsDir = plan_->simsDir;
    rv.trialDir = ctx.trialDir;
    bindRunVariables(env, rv);
    const std::vector<ResolvedStep> steps =
        resolveSteps(plan_->steps, run.role, std::move(env), plan_->filter, exp->second.group);

    logInfo(tag + " started by " + workerId_);
    for (const auto& step : steps) {
        if (cancelled) {
            finish(run.runId, RunStatus::ABORTED, "worker cancelled before step " + step.name);
            return;
        }
        const auto current = store_.run(run.runId);
        if (!current || current->status != RunStatus::RUNNING) {
            logWarn(tag + " was " + (current ? toString(current->status) : "removed") + " externally; stopping");
            return;
        }

        int status = 0;
        try {
            status = runner_(ctx, step);
        }
        catch (const std::exception& e) {
            logError(tag + ": step " + step.name + " threw: " + e.what());
            finish(run.runId, RunStatus::FAILED, "step " + step.name + ": " + e.what());
            return;
        }
        if (status != 0) {
            const std::string cause = "step " + step.name + " exited with status " + std::to_string(status);
            logError(tag + ": " + cause);
            finish(run.runId, RunStatus::FAILED, cause);
            return;
        }
    }
    finish(run.runId, RunStatus::SUCCEEDED, "");
    logInfo(tag + " succeeded");
}

//------------------------------------------------------------------------------
// DispatcherOptions / DispatchSummary
//------------------------------------------------------------------------------
DispatcherOptions DispatcherOptions::fromConfig(const Config& config) {
    DispatcherOptions opts;
    opts.maxWorkers = config.getInt("MCS.MaxWorkers");
    opts.maxRetries = config.getInt("MCS.MaxRetries");
    opts.runTimeoutMs = config.getInt64("MCS.RunTimeoutSecs") * 1000;
    opts.pollMillis = config.getInt("MCS.PollMillis");
    opts.shutdownWhenIdle = config.getBool("MCS.ShutdownWhenIdle");
    if (opts.maxWorkers < 1) throw ConfigurationError("MCS.MaxWorkers must be at least 1");
    if (opts.maxRetries < 0 || opts.runTimeoutMs < 0 || opts.pollMillis < 1)
        throw ConfigurationError("MCS.MaxRetries, RunTimeoutSecs and PollMillis must not be negative");
    return opts;
}

int64_t DispatchSummary::count(const RunStatus status) const {
    const auto it = counts.find(status);
    return it == counts.end() ? 0 : it->second;
}

std::string DispatchSummary::describe() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& kv : counts) {
        oss << (first ? "" : ", ") << toString(kv.first) << "=" << kv.second;
        first = false;
    }
    if (!failedTrials.empty()) oss << "; failed trials " << createTrialString(failedTrials);
    if (!abortedTrials.empty()) oss << "; aborted trials " << createTrialString(abortedTrials);
    return oss.str();
}

//------------------------------------------------------------------------------
// Dispatcher
//------------------------------------------------------------------------------
Dispatcher::Dispatcher(StateStore& store, const int64_t simId, ClusterManager& cluster, const DispatcherOptions opts)
    : store_(store), simId_(simId), cluster_(cluster), opts_(opts) {
    if (!store_.simulation(simId_)) throw std::out_of_range("No simulation with id " + std::to_string(simId_));
    if (opts_.maxWorkers < 1) throw std::invalid_argument("maxWorkers must be at least 1");
}

int Dispatcher::scheduleTrials(const std::vector<int>& trials) {
    const int trialCount = store_.trialCount(simId_);
    const auto exps = store_.experiments(simId_);
    findBaseline(exps);

    std::set<std::pair<int64_t, int>> active;
    for (const auto& r : store_.latestRuns(simId_))
        if (isActive(r.status)) active.emplace(r.expId, r.trialNum);

    int created = 0;
    StateStore::Transaction txn(store_);
    for (const int t : trials) {
        if (t < 0 || t >= trialCount)
            throw std::out_of_range("Trial " + std::to_string(t) + " is outside 0.." + std::to_string(trialCount - 1));
        for (const auto& e : exps) {
            if (active.count({e.id, t})) continue;
            store_.createRun(simId_, e.id, t);
            ++created;
        }
    }
    txn.commit();
    logInfo("Scheduled " + std::to_string(created) + " runs for trials " + createTrialString(trials));
    return created;
}

int Dispatcher::redo(const std::vector<RunStatus>& statuses) {
    for (const auto s : statuses)
        if (isActive(s)) throw std::invalid_argument(std::string("Cannot redo active status ") + toString(s));

    const auto latest = store_.latestRuns(simId_);
    std::set<int> redoneBaselines;
    for (const auto& r : latest)
        if (r.role == ExperimentRole::Baseline &&
            std::find(statuses.begin(), statuses.end(), r.status) != statuses.end())
            redoneBaselines.insert(r.trialNum);

    int created = 0;
    StateStore::Transaction txn(store_);
    for (const auto& r : latest) {
        const bool wanted = std::find(statuses.begin(), statuses.end(), r.status) != statuses.end();
        const bool dependent = r.role == ExperimentRole::Policy && r.status == RunStatus::ABORTED &&
                               redoneBaselines.count(r.trialNum);
        if (!wanted && !dependent) continue;
        store_.createRun(simId_, r.expId, r.trialNum);
        ++created;
    }
    txn.commit();
    logInfo("Rescheduled " + std::to_string(created) + " runs");
    return created;
}

void Dispatcher::expireTimedOut() {
    if (opts_.runTimeoutMs <= 0) return;
    for (const auto& r : store_.timedOutRuns(simId_, opts_.runTimeoutMs)) {
        const std::string cause = "timed out after " + std::to_string(opts_.runTimeoutMs / 1000) + "s";
        if (store_.transition(r.runId, RunStatus::RUNNING, RunStatus::FAILED, cause))
            logWarn("Run " + std::to_string(r.runId) + " (trial " + std::to_string(r.trialNum) + ", " + r.experiment +
                    ") " + cause);
    }
}

//---- settleFailures(): retry as a new row, or cascade a permanently failed baseline ----
void Dispatcher::settleFailures() {
    for (const auto& r : store_.latestRuns(simId_)) {
        if (r.status != RunStatus::FAILED && r.status != RunStatus::ABORTED) continue;
        if (settled_.count(r.runId)) continue;
        settled_.insert(r.runId);

        if (r.status == RunStatus::FAILED && r.retryCount < opts_.maxRetries && !stopping_) {
            store_.createRun(simId_, r.expId, r.trialNum, r.retryCount + 1);
            logInfo("Retrying trial " + std::to_string(r.trialNum) + ", " + r.experiment + " (attempt " +
                    std::to_string(r.retryCount + 2) + ")");
            continue;
        }
        if (r.role != ExperimentRole::Baseline) continue;

        const std::string cause = "baseline run " + std::to_string(r.runId) + " " + toString(r.status) +
                                  (r.cause.empty() ? "" : ": " + r.cause);
        const int aborted = store_.abortDependents(simId_, r.trialNum, cause);
        if (aborted > 0)
            logWarn("Trial " + std::to_string(r.trialNum) + ": aborted " + std::to_string(aborted) +
                    " policy runs (" + cause + ")");
    }
}

std::vector<std::string> Dispatcher::activeJobs() const {
    std::vector<std::string> ids;
    for (const auto& id : cluster_.activeJobs())
        if (jobs_.count(id)) ids.push_back(id);
    return ids;
}

//---- scaleWorkers(): required = PENDING + QUEUED, bounded by maxWorkers and free slots ----
void Dispatcher::scaleWorkers() {
    const auto waiting = store_.countRuns(simId_, {RunStatus::PENDING, RunStatus::QUEUED});
    const auto active = activeJobs();

    if (waiting == 0) {
        if (!opts_.shutdownWhenIdle) return;
        const auto busy = store_.busyWorkers(simId_);
        for (const auto& id : active) {
            const auto& worker = jobWorkers_[id];
            if (std::find(busy.begin(), busy.end(), worker) != busy.end()) continue;
            logDebug("Releasing idle worker " + worker);
            cluster_.cancel(id);
        }
        return;
    }

    const int64_t required = std::min<int64_t>(waiting, opts_.maxWorkers);
    int64_t toStart = std::min<int64_t>(required - static_cast<int64_t>(active.size()), cluster_.availableSlots());
    while (toStart-- > 0) {
        JobRequest req;
        req.simId = simId_;
        req.workerId = "s" + std::to_string(simId_) + "-w" + std::to_string(nextWorker_++);
        req.jobName = "ensemble-" + req.workerId;
        try {
            const std::string jobId = cluster_.submit(req);
            jobs_.insert(jobId);
            jobWorkers_[jobId] = req.workerId;
        }
        catch (const ExecutionError& e) {
            logWarn(std::string("Could not start worker: ") + e.what());
            break;
        }
    }
}

bool Dispatcher::step() {
    expireTimedOut();
    settleFailures();
    if (!stopping_) scaleWorkers();
    return store_.countRuns(simId_, {RunStatus::PENDING, RunStatus::QUEUED, RunStatus::RUNNING}) > 0;
}

DispatchSummary Dispatcher::runUntilDone() {
    while (!stopping_ && !stopRequested_ && step())
        pause(opts_.pollMillis, stopRequested_);
    if (stopRequested_ && !stopping_) stop("stop requested");

    drainWorkers();
    const auto result = summary();
    logInfo("Simulation " + std::to_string(simId_) + " finished: " + result.describe());
    return result;
}

//---- drainWorkers(): cancel every job, wait for it to return, then settle runs it left behind ----
void Dispatcher::drainWorkers() {
    for (const auto& id : activeJobs()) cluster_.cancel(id);
    while (!activeJobs().empty())
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(opts_.pollMillis, 20)));

    for (const auto& r : store_.runs(simId_, RunStatus::RUNNING))
        if (store_.transition(r.runId, RunStatus::RUNNING, RunStatus::ABORTED, "worker ended before the run finished"))
            logWarn("Run " + std::to_string(r.runId) + " (trial " + std::to_string(r.trialNum) + ", " + r.experiment +
                    ") lost its worker");
}

void Dispatcher::stop(const std::string& cause) {
    stopping_ = true;
    const int aborted = store_.abortActive(simId_, cause);
    for (const auto& id : activeJobs()) cluster_.cancel(id);
    logWarn("Simulation " + std::to_string(simId_) + " stopped (" + cause + "): aborted " + std::to_string(aborted) +
            " runs");
}

DispatchSummary Dispatcher::summary() const {
    DispatchSummary s;
    for (const auto& c : store_.statusSummary(simId_)) s.counts[c.status] += c.count;
    s.failedTrials = store_.trialsWithStatus(simId_, {RunStatus::FAILED});
    s.abortedTrials = store_.trialsWithStatus(simId_, {RunStatus::ABORTED});
    return s;
}
