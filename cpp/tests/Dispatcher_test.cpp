// Dispatcher_test.cpp
#include "gtest/gtest.h"
#include "Dispatcher.h"
#include "Error.h"
#include "Trials.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <set>
#include <thread>

using namespace ensemble;

/** Records submissions and cancellations without starting anything. */
class ManualCluster final : public ClusterManager {
public:
    explicit ManualCluster(int slots) : slots_(slots) {}

    std::string submit(const JobRequest& request) override {
        if (availableSlots() == 0) throw ExecutionError("no slots");
        const std::string id = "job-" + std::to_string(states_.size() + 1);
        states_[id] = JobState::Running;
        submitted.push_back(request);
        return id;
    }
    void cancel(const std::string& jobId) override {
        const auto it = states_.find(jobId);
        if (it == states_.end() || it->second != JobState::Running) return;
        it->second = JobState::Cancelled;
        cancelled.push_back(jobId);
    }
    JobState poll(const std::string& jobId) const override { return states_.at(jobId); }
    int availableSlots() const override { return slots_ - static_cast<int>(activeJobs().size()); }
    std::vector<std::string> activeJobs() const override {
        std::vector<std::string> out;
        for (const auto& kv : states_)
            if (kv.second == JobState::Running) out.push_back(kv.first);
        return out;
    }

    std::vector<JobRequest> submitted;
    std::vector<std::string> cancelled;

private:
    const int slots_;
    std::map<std::string, JobState> states_;
};

static std::string tempDb(const std::string& name) {
    const std::string path = ::testing::TempDir() + name + ".sqlite";
    for (const char* suffix : {"", "-wal", "-shm"}) std::remove((path + suffix).c_str());
    return path;
}

static int64_t makeSimulation(StateStore& store, int trials) {
    const int64_t simId = store.createSimulation("dispatch", trials);
    Experiment base;
    base.name = "base";
    base.role = ExperimentRole::Baseline;
    Experiment tax;
    tax.name = "tax";
    store.createExperiment(simId, base);
    store.createExperiment(simId, tax);
    store.createTrials(simId, trials);
    return simId;
}

static RunRecord latest(StateStore& store, int64_t simId, int trial, const std::string& experiment) {
    for (const auto& r : store.latestRuns(simId))
        if (r.trialNum == trial && r.experiment == experiment) return r;
    throw std::out_of_range("no run for trial " + std::to_string(trial) + " " + experiment);
}

static void fail(StateStore& store, int64_t runId, const std::string& cause) {
    ASSERT_TRUE(store.claimRun(runId, "w"));
    ASSERT_TRUE(store.transition(runId, RunStatus::QUEUED, RunStatus::RUNNING));
    ASSERT_TRUE(store.transition(runId, RunStatus::RUNNING, RunStatus::FAILED, cause));
}

static DispatcherOptions options() {
    DispatcherOptions opts;
    opts.maxWorkers = 3;
    opts.pollMillis = 5;
    return opts;
}

TEST(Dispatcher, ScheduleTrials) {
    StateStore store(":memory:");
    const int64_t simId = makeSimulation(store, 3);
    ManualCluster cluster(10);
    Dispatcher dispatcher(store, simId, cluster, options());

    EXPECT_EQ(dispatcher.scheduleTrials({0, 1, 2}), 6);
    EXPECT_EQ(dispatcher.scheduleTrials({1, 2}), 0); // already active
    EXPECT_THROW(dispatcher.scheduleTrials({3}), std::out_of_range);
    EXPECT_EQ(store.countRuns(simId, {RunStatus::PENDING}), 6);

    EXPECT_THROW(Dispatcher(store, simId + 1, cluster, options()), std::out_of_range);
}

TEST(Dispatcher, StartsWorkersForWaitingRuns) {
    StateStore store(":memory:");
    const int64_t simId = makeSimulation(store, 4);
    ManualCluster cluster(2);
    Dispatcher dispatcher(store, simId, cluster, options());
    dispatcher.scheduleTrials({0, 1, 2, 3});

    EXPECT_TRUE(dispatcher.step());
    ASSERT_EQ(cluster.submitted.size(), 2u); // bounded by free slots
    EXPECT_EQ(cluster.submitted[0].simId, simId);
    EXPECT_NE(cluster.submitted[0].workerId, cluster.submitted[1].workerId);
    EXPECT_TRUE(dispatcher.step());
    EXPECT_EQ(cluster.submitted.size(), 2u);

    dispatcher.stop("test over");
    EXPECT_EQ(cluster.cancelled.size(), 2u);
    EXPECT_TRUE(dispatcher.activeJobs().empty());
    EXPECT_EQ(store.countRuns(simId, {RunStatus::ABORTED}), 8);
    EXPECT_FALSE(dispatcher.step());
    EXPECT_EQ(cluster.submitted.size(), 2u);
}

TEST(Dispatcher, IdleWorkersAreReleased) {
    StateStore store(":memory:");
    const int64_t simId = makeSimulation(store, 1);
    ManualCluster cluster(4);
    Dispatcher dispatcher(store, simId, cluster, options());
    dispatcher.scheduleTrials({0});
    dispatcher.step();
    ASSERT_EQ(cluster.submitted.size(), 2u);

    // the first worker runs the baseline, then the policy that was waiting on it
    const std::string& busy = cluster.submitted[0].workerId;
    const int64_t base = latest(store, simId, 0, "base").runId;
    ASSERT_TRUE(store.claimRun(base, busy));
    ASSERT_TRUE(store.transition(base, RunStatus::QUEUED, RunStatus::RUNNING));
    EXPECT_TRUE(dispatcher.step());
    EXPECT_TRUE(cluster.cancelled.empty()); // the policy still waits
    ASSERT_TRUE(store.transition(base, RunStatus::RUNNING, RunStatus::SUCCEEDED));

    const int64_t tax = latest(store, simId, 0, "tax").runId;
    ASSERT_TRUE(store.claimRun(tax, busy));
    ASSERT_TRUE(store.transition(tax, RunStatus::QUEUED, RunStatus::RUNNING));

    // nothing waits, but the first worker is still running a model
    EXPECT_TRUE(dispatcher.step());
    ASSERT_EQ(cluster.cancelled.size(), 1u);
    EXPECT_EQ(cluster.cancelled[0], "job-2");

    ASSERT_TRUE(store.transition(tax, RunStatus::RUNNING, RunStatus::SUCCEEDED));
    EXPECT_FALSE(dispatcher.step());
    EXPECT_EQ(cluster.cancelled.size(), 2u);
    EXPECT_EQ(dispatcher.summary().count(RunStatus::SUCCEEDED), 2);
}

TEST(Dispatcher, BaselineFailureAbortsPolicies) {
    StateStore store(":memory:");
    const int64_t simId = makeSimulation(store, 2);
    ManualCluster cluster(4);
    Dispatcher dispatcher(store, simId, cluster, options());
    dispatcher.scheduleTrials({0, 1});

    fail(store, latest(store, simId, 0, "base").runId, "exit 1");
    EXPECT_TRUE(dispatcher.step());

    const auto policy = latest(store, simId, 0, "tax");
    EXPECT_EQ(policy.status, RunStatus::ABORTED);
    EXPECT_NE(policy.cause.find("exit 1"), std::string::npos);
    EXPECT_EQ(latest(store, simId, 1, "tax").status, RunStatus::PENDING);

    const auto s = dispatcher.summary();
    EXPECT_EQ(s.failedTrials, (std::vector<int>{0}));
    EXPECT_EQ(s.abortedTrials, (std::vector<int>{0}));
    EXPECT_EQ(s.count(RunStatus::PENDING), 2);
    EXPECT_NE(s.describe().find("failed trials 0"), std::string::npos);
}

TEST(Dispatcher, RetriesCreateANewAttempt) {
    StateStore store(":memory:");
    const int64_t simId = makeSimulation(store, 1);
    ManualCluster cluster(4);
    DispatcherOptions opts = options();
    opts.maxRetries = 1;
    Dispatcher dispatcher(store, simId, cluster, opts);
    dispatcher.scheduleTrials({0});

    const int64_t first = latest(store, simId, 0, "base").runId;
    fail(store, first, "crash");
    dispatcher.step();

    const auto retry = latest(store, simId, 0, "base");
    EXPECT_NE(retry.runId, first);
    EXPECT_EQ(retry.retryCount, 1);
    EXPECT_EQ(retry.status, RunStatus::PENDING);
    EXPECT_EQ(store.run(first)->status, RunStatus::FAILED);
    EXPECT_EQ(latest(store, simId, 0, "tax").status, RunStatus::PENDING);

    fail(store, retry.runId, "crash again");
    dispatcher.step();
    EXPECT_EQ(latest(store, simId, 0, "base").runId, retry.runId); // out of retries
    EXPECT_EQ(latest(store, simId, 0, "tax").status, RunStatus::ABORTED);
}

TEST(Dispatcher, TimedOutRunsFail) {
    StateStore store(":memory:");
    int64_t now = 50'000;
    store.setClock([&now] { return now; });
    const int64_t simId = makeSimulation(store, 1);
    ManualCluster cluster(4);
    DispatcherOptions opts = options();
    opts.runTimeoutMs = 2000;
    Dispatcher dispatcher(store, simId, cluster, opts);
    dispatcher.scheduleTrials({0});

    const int64_t runId = latest(store, simId, 0, "base").runId;
    ASSERT_TRUE(store.claimRun(runId, "w"));
    ASSERT_TRUE(store.transition(runId, RunStatus::QUEUED, RunStatus::RUNNING));

    now += 1000;
    dispatcher.step();
    EXPECT_EQ(store.run(runId)->status, RunStatus::RUNNING);

    now += 1500;
    dispatcher.step();
    EXPECT_EQ(store.run(runId)->status, RunStatus::FAILED);
    EXPECT_EQ(store.run(runId)->cause, "timed out after 2s");
    EXPECT_EQ(latest(store, simId, 0, "tax").status, RunStatus::ABORTED);
}

TEST(Dispatcher, RedoReschedulesFailuresWithTheirDependents) {
    StateStore store(":memory:");
    const int64_t simId = makeSimulation(store, 2);
    ManualCluster cluster(4);
    Dispatcher dispatcher(store, simId, cluster, options());
    dispatcher.scheduleTrials({0, 1});
    fail(store, latest(store, simId, 1, "base").runId, "bad input");
    dispatcher.step();
    ASSERT_EQ(latest(store, simId, 1, "tax").status, RunStatus::ABORTED);

    EXPECT_THROW(dispatcher.redo({RunStatus::RUNNING}), std::invalid_argument);
    EXPECT_EQ(dispatcher.redo({RunStatus::FAILED}), 2);
    EXPECT_EQ(latest(store, simId, 1, "base").status, RunStatus::PENDING);
    EXPECT_EQ(latest(store, simId, 1, "tax").status, RunStatus::PENDING);
    EXPECT_EQ(dispatcher.redo({RunStatus::FAILED}), 0);
}

TEST(DispatcherOptions, FromConfig) {
    Config cfg;
    cfg.set("MCS.MaxWorkers", "5");
    cfg.set("MCS.RunTimeoutSecs", "90");
    const auto opts = DispatcherOptions::fromConfig(cfg);
    EXPECT_EQ(opts.maxWorkers, 5);
    EXPECT_EQ(opts.runTimeoutMs, 90'000);

    cfg.set("MCS.MaxWorkers", "0");
    EXPECT_THROW(DispatcherOptions::fromConfig(cfg), ConfigurationError);
}

static std::shared_ptr<WorkflowPlan> plan() {
    auto p = std::make_shared<WorkflowPlan>();
    p->project = "demo";
    Step setup;
    setup.name = "setup";
    setup.seq = 1;
    setup.scope = StepScope::Baseline;
    setup.command = "prepare {scenario}";
    Step model;
    model.name = "model";
    model.seq = 2;
    model.command = "run {scenario} trial {trialNum}";
    p->steps.declare(setup);
    p->steps.declare(model);
    return p;
}

TEST(Worker, RunOnceExecutesTheRenderedSteps) {
    const std::string path = tempDb("ensemble_worker");
    int64_t simId = 0;
    {
        StateStore setup(path);
        simId = makeSimulation(setup, 1);
        setup.saveParameter(simId, Parameter("growth", Distribution::constant(0.02)), DrawMode::Shared);
        setup.insertInputValues(simId, {{0, "growth", "", 0.02}});
        for (const auto& e : setup.experiments(simId)) setup.createRun(simId, e.id, 0);
    }

    std::vector<std::string> commands;
    std::vector<RunContext> contexts;
    const ModelRunner runner = [&](const RunContext& ctx, const ResolvedStep& step) {
        commands.push_back(step.command);
        contexts.push_back(ctx);
        return ctx.experiment == "tax" ? 7 : 0;
    };
    Worker worker(path, simId, "w1", plan(), runner);
    const std::atomic<bool> cancelled{false};

    ASSERT_TRUE(worker.runOnce(cancelled));
    EXPECT_EQ(commands, (std::vector<std::string>{"prepare base", "run base trial 0"}));
    EXPECT_EQ(contexts[0].trialDir, trialDirectory("sims", simId, 0));
    EXPECT_DOUBLE_EQ(contexts[0].inputs.at("growth"), 0.02);

    ASSERT_TRUE(worker.runOnce(cancelled));
    EXPECT_EQ(commands.back(), "run tax trial 0");
    EXPECT_FALSE(worker.runOnce(cancelled));

    const auto runs = worker.store().latestRuns(simId);
    ASSERT_EQ(runs.size(), 2u);
    EXPECT_EQ(runs[0].status, RunStatus::SUCCEEDED);
    EXPECT_EQ(runs[0].workerId, "w1");
    EXPECT_EQ(runs[1].status, RunStatus::FAILED);
    EXPECT_EQ(runs[1].cause, "step model exited with status 7");

    EXPECT_THROW(Worker(path, simId, "w2", nullptr, runner), std::invalid_argument);
}

TEST(Worker, ThrowingRunnerFailsTheRun) {
    const std::string path = tempDb("ensemble_worker_throw");
    int64_t simId = 0;
    {
        StateStore setup(path);
        simId = makeSimulation(setup, 1);
        setup.createRun(simId, setup.experiments(simId)[0].id, 0);
    }
    Worker worker(path, simId, "w1", plan(), [](const RunContext&, const ResolvedStep&) -> int {
        throw ExecutionError("model binary missing");
    });
    const std::atomic<bool> cancelled{false};
    ASSERT_TRUE(worker.runOnce(cancelled));
    const auto run = worker.store().latestRuns(simId).at(0);
    EXPECT_EQ(run.status, RunStatus::FAILED);
    EXPECT_NE(run.cause.find("model binary missing"), std::string::npos);
}

TEST(Worker, StoreFailuresFailTheRun) {
    const std::string path = tempDb("ensemble_worker_store");
    int64_t simId = 0;
    {
        StateStore setup(path);
        simId = makeSimulation(setup, 1);
        setup.createRun(simId, setup.experiments(simId)[0].id, 0);
    }
    bool ran = false;
    Worker worker(path, simId, "w1", plan(), [&ran](const RunContext&, const ResolvedStep&) {
        ran = true;
        return 0;
    });
    // reading the trial's inputs now fails after the run went RUNNING
    worker.store().exec("DROP VIEW param");

    const std::atomic<bool> cancelled{false};
    ASSERT_TRUE(worker.runOnce(cancelled));
    EXPECT_FALSE(ran);
    const auto run = worker.store().latestRuns(simId).at(0);
    EXPECT_EQ(run.status, RunStatus::FAILED);
    EXPECT_NE(run.cause.find("param"), std::string::npos) << run.cause;
}

TEST(Dispatcher, LocalWorkersCompleteASimulation) {
    const std::string path = tempDb("ensemble_dispatch");
    StateStore store(path);
    const int64_t simId = makeSimulation(store, 3);

    std::mutex mtx;
    std::set<std::pair<int, std::string>> executed;
    const ModelRunner runner = [&](const RunContext& ctx, const ResolvedStep& step) {
        if (step.name != "model") return 0;
        std::lock_guard<std::mutex> lock(mtx);
        executed.emplace(ctx.trialNum, ctx.experiment);
        return ctx.trialNum == 1 && ctx.role == ExperimentRole::Baseline ? 1 : 0;
    };
    const auto workflow = plan();
    WorkerOptions wopts;
    wopts.pollMillis = 5;

    LocalCluster cluster(2, [&](const JobRequest& req, const std::atomic<bool>& cancelled) {
        Worker(path, req.simId, req.workerId, workflow, runner, wopts).runUntilIdle(cancelled);
    });
    Dispatcher dispatcher(store, simId, cluster, options());
    dispatcher.scheduleTrials({0, 1, 2});

    const DispatchSummary s = dispatcher.runUntilDone();
    cluster.waitAll();

    EXPECT_EQ(s.count(RunStatus::SUCCEEDED), 4);
    EXPECT_EQ(s.count(RunStatus::FAILED), 1);
    EXPECT_EQ(s.count(RunStatus::ABORTED), 1);
    EXPECT_EQ(s.failedTrials, (std::vector<int>{1}));
    EXPECT_EQ(executed.count({1, "tax"}), 0u);
    EXPECT_EQ(executed.size(), 5u);
}

TEST(Dispatcher, StopWaitsForRunningWorkers) {
    const std::string path = tempDb("ensemble_dispatch_stop");
    StateStore store(path);
    const int64_t simId = makeSimulation(store, 4);

    std::atomic<int> started{0};
    const ModelRunner runner = [&started](const RunContext&, const ResolvedStep& step) {
        if (step.name == "model") {
            ++started;
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
        }
        return 0;
    };
    const auto workflow = plan();
    WorkerOptions wopts;
    wopts.pollMillis = 5;
    LocalCluster cluster(2, [&](const JobRequest& req, const std::atomic<bool>& cancelled) {
        Worker(path, req.simId, req.workerId, workflow, runner, wopts).runUntilIdle(cancelled);
    });
    Dispatcher dispatcher(store, simId, cluster, options());
    dispatcher.scheduleTrials({0, 1, 2, 3});

    std::thread stopper([&] {
        while (started == 0) std::this_thread::sleep_for(std::chrono::milliseconds(2));
        dispatcher.requestStop();
    });
    const DispatchSummary s = dispatcher.runUntilDone();
    stopper.join();

    EXPECT_TRUE(dispatcher.activeJobs().empty());
    EXPECT_EQ(s.count(RunStatus::RUNNING), 0);
    EXPECT_EQ(s.count(RunStatus::QUEUED), 0);
    EXPECT_EQ(s.count(RunStatus::PENDING), 0);
    EXPECT_GT(s.count(RunStatus::ABORTED), 0);
    EXPECT_EQ(s.count(RunStatus::SUCCEEDED) + s.count(RunStatus::ABORTED), 8);

    // nothing changes once runUntilDone has returned
    cluster.waitAll();
    EXPECT_EQ(dispatcher.summary().counts, s.counts);
}
