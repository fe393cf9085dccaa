#include "Simulator.h"
#include "Error.h"
#include "Logging.h"
#include "RngEngine.h"
#include "Trials.h"

#include <algorithm>
#include <numeric>
#include <set>

using namespace ensemble;

Simulator::Simulator(const Config& config, SimulationSpec spec, ApplyRegistry registry, std::string project)
    : config_(config),
      spec_(std::move(spec)),
      registry_(std::move(registry)),
      store_(config.getString("MCS.DbPath")),
      plan_(std::make_shared<WorkflowPlan>()) {
    setLogLevel(parseLogLevel(config_.getString("MCS.LogLevel")));

    plan_->project = std::move(project);
    plan_->steps = spec_.steps;
    plan_->simsDir = config_.getString("MCS.RunSimsDir");
    plan_->maxSimDirs = config_.getInt("MCS.MaxSimDirs");
    for (const auto& var : spec_.vars) plan_->vars.define(var, config_);

    // fail fast on parameter errors
    makeCompiler(0);
}

ParameterCompiler Simulator::makeCompiler(const uint64_t seed) const {
    return ParameterCompiler(spec_.parameters, registry_, seed, config_.getString("MCS.SamplingMethod"));
}

std::vector<ResolvedStep> Simulator::previewSteps(const std::string& experiment, const int64_t simId,
                                                  const int trialNum) const {
    const Experiment& baseline = findBaseline(spec_.experiments);
    const auto it = std::find_if(spec_.experiments.begin(), spec_.experiments.end(),
                                 [&experiment](const Experiment& e) { return e.name == experiment; });
    if (it == spec_.experiments.end()) throw ConfigurationError("Unknown experiment " + experiment);

    VariableEnvironment env = plan_->vars;
    RunVariables rv;
    rv.project = plan_->project;
    rv.simId = simId;
    rv.trialNum = trialNum;
    rv.scenario = it->name;
    rv.baseline = baseline.name;
    rv.scenarioGroup = it->group;
    rv.simsDir = plan_->simsDir;
    rv.trialDir = trialDirectory(plan_->simsDir, simId, trialNum, plan_->maxSimDirs);
    bindRunVariables(env, rv);
    return resolveSteps(plan_->steps, it->role, std::move(env), plan_->filter, it->group);
}

//------------------------------------------------------------------------------
// initialize(): validate, compile, then persist everything in one transaction
//------------------------------------------------------------------------------
int64_t Simulator::initialize(const std::string& name, const int trialCount, const std::string& description) {
    findBaseline(spec_.experiments);
    std::set<std::string> names;
    for (const auto& e : spec_.experiments)
        if (!names.insert(e.name).second) throw ConfigurationError("Duplicate experiment " + e.name);
    for (const auto& e : spec_.experiments) previewSteps(e.name);

    names.clear();
    for (const auto& r : spec_.results) {
        r.validate();
        if (!names.insert(r.name).second) throw ConfigurationError("Duplicate result " + r.name);
    }

    uint64_t seed = static_cast<uint64_t>(config_.getInt64("MCS.Seed"));
    if (seed == 0) seed = RngEngine::defaultSeed();
    const ParameterCompiler compiler = makeCompiler(seed);
    const auto values = compiler.compile(trialCount, spec_.experiments);

    StateStore::Transaction txn(store_);
    const int64_t simId = store_.createSimulation(name, trialCount, description, seed);
    for (const auto& e : spec_.experiments) store_.createExperiment(simId, e);
    store_.createTrials(simId, trialCount);
    for (const auto& p : compiler.parameters())
        if (p.active) store_.saveParameter(simId, p, compiler.effectiveMode(p.name));
    for (const auto& r : spec_.results) store_.defineOutput(r.name, r.description);
    const int64_t written = store_.insertInputValues(simId, values);
    txn.commit();

    logInfo("Initialized simulation " + std::to_string(simId) + " '" + name + "': " + std::to_string(trialCount) +
            " trials, " + std::to_string(written) + " input values, seed " + std::to_string(seed));
    return simId;
}

int64_t Simulator::resume(const int64_t simId) {
    const auto sim = store_.simulation(simId);
    if (!sim) throw std::out_of_range("No simulation with id " + std::to_string(simId));

    const ParameterCompiler compiler = makeCompiler(sim->seed);
    const auto values = compiler.compile(sim->trialCount, store_.experiments(simId));

    StateStore::Transaction txn(store_);
    for (const auto& p : compiler.parameters())
        if (p.active) store_.saveParameter(simId, p, compiler.effectiveMode(p.name));
    const int64_t written = store_.insertInputValues(simId, values);
    txn.commit();

    logInfo("Resumed simulation " + std::to_string(simId) + ": wrote " + std::to_string(written) + " missing values");
    return written;
}

DispatchSummary Simulator::execute(const int64_t simId, const ModelRunner& runner,
                                   const std::function<void(Dispatcher&)>& schedule) {
    if (store_.path() == ":memory:" || store_.path().empty())
        throw ConfigurationError("Workers need a file-backed store; set MCS.DbPath");
    if (!runner) throw std::invalid_argument("run() requires a model runner");

    const DispatcherOptions opts = DispatcherOptions::fromConfig(config_);
    const WorkerOptions wopts{opts.pollMillis, opts.shutdownWhenIdle};
    const std::string dbPath = store_.path();
    const std::shared_ptr<const WorkflowPlan> plan = plan_;

    LocalCluster cluster(opts.maxWorkers, [dbPath, plan, runner, wopts](const JobRequest& req,
                                                                       const std::atomic<bool>& cancelled) {
        Worker worker(dbPath, req.simId, req.workerId, plan, runner, wopts);
        worker.runUntilIdle(cancelled);
    });
    Dispatcher dispatcher(store_, simId, cluster, opts);
    schedule(dispatcher);

    {
        std::lock_guard<std::mutex> lock(mtx_);
        active_ = &dispatcher;
    }
    DispatchSummary summary;
    try {
        summary = dispatcher.runUntilDone();
    }
    catch (const std::exception& e) {
        logError(std::string("Dispatcher failed: ") + e.what());
        std::lock_guard<std::mutex> lock(mtx_);
        active_ = nullptr;
        throw;
    }
    {
        std::lock_guard<std::mutex> lock(mtx_);
        active_ = nullptr;
    }
    cluster.waitAll();
    return summary;
}

DispatchSummary Simulator::run(const int64_t simId, const ModelRunner& runner, const std::vector<int>& trials) {
    return execute(simId, runner, [this, simId, &trials](Dispatcher& d) {
        if (!trials.empty()) {
            d.scheduleTrials(trials);
            return;
        }
        std::vector<int> all(static_cast<size_t>(store_.trialCount(simId)));
        std::iota(all.begin(), all.end(), 0);
        d.scheduleTrials(all);
    });
}

DispatchSummary Simulator::redo(const int64_t simId, const ModelRunner& runner,
                                const std::vector<RunStatus>& statuses) {
    return execute(simId, runner, [&statuses](Dispatcher& d) { d.redo(statuses); });
}

int Simulator::collect(const int64_t simId, std::shared_ptr<const ResultSource> source) {
    if (!source) source = std::make_shared<FileResultSource>(plan_->simsDir, plan_->maxSimDirs);
    ResultCollector collector(store_, spec_.results, std::move(source), parseYears(config_.getString("MCS.Years")));
    return collector.collectAll(simId);
}

void Simulator::requestStop() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (active_) active_->requestStop();
}
