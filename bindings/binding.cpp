#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "ApplyOperator.h"
#include "ClusterManager.h"
#include "CompiledExpression.h"
#include "Config.h"
#include "Distribution.h"
#include "Error.h"
#include "Logging.h"
#include "Parameter.h"
#include "ParameterCompiler.h"
#include "Sampler.h"
#include "Simulator.h"
#include "SpecLoader.h"
#include "StepScheduler.h"
#include "Trials.h"


namespace py = pybind11;
using namespace ensemble;


static DrawMode mode_from_name(const std::string& name) {
     if (name == "shared") return DrawMode::Shared;
     if (name == "independent") return DrawMode::Independent;
     throw py::value_error("Unknown draw mode '" + name + "'");
}


namespace ensemble {
     /**
      * Python-facing simulator: model runners are Python callables, so the GIL is
      * released while the workers run and re-acquired around each call.
      */
     struct PySimulator {
          std::unique_ptr<Simulator> core;

          PySimulator(const Config& config, SimulationSpec spec, ApplyRegistry registry, std::string project)
               : core(std::make_unique<Simulator>(config, std::move(spec), std::move(registry), std::move(project))) {}

          DispatchSummary run(const int64_t simId, const py::function& fn, const std::vector<int>& trials) const {
               // worker threads copy the runner without the GIL; only the shared_ptr is copied
               const auto callable = std::make_shared<py::function>(fn);
               const ModelRunner runner = [callable](const RunContext& ctx, const ResolvedStep& step) {
                    py::gil_scoped_acquire gil;
                    return (*callable)(ctx, step).cast<int>();
               };
               py::gil_scoped_release release;
               return core->run(simId, runner, trials);
          }

          std::map<std::string, std::map<std::string, int64_t>> statusSummary(const int64_t simId) const {
               std::map<std::string, std::map<std::string, int64_t>> out;
               for (const auto& c : core->store().statusSummary(simId))
                    out[c.experiment][toString(c.status)] += c.count;
               return out;
          }

          std::vector<std::tuple<int, std::string, double>> results(const int64_t simId, const std::string& name) const {
               std::vector<std::tuple<int, std::string, double>> out;
               for (const auto& r : core->store().results(simId, name))
                    out.emplace_back(r.trialNum, r.experiment, r.value);
               return out;
          }
     };
}


PYBIND11_MODULE(_ensemble, m) {
     m.doc() = "Monte Carlo trial-orchestration engine";

     py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
     py::register_exception<StoreError>(m, "StoreError", PyExc_RuntimeError);

     m.def("set_log_level", [](const std::string& level) { setLogLevel(parseLogLevel(level)); }, py::arg("level"));
     m.def("parse_trial_string", &parseTrialString, py::arg("text"));
     m.def("create_trial_string", &createTrialString, py::arg("trials"));
     m.def("trial_directory", &trialDirectory,
           py::arg("sims_dir"), py::arg("sim_id"), py::arg("trial_num"), py::arg("max_sim_dirs") = 1000);
     m.def("plan_batch", [](const int trials, const int maxEngines, const int tasksPerNode, const int minutes) {
                const BatchPlan p = planBatch(trials, maxEngines, tasksPerNode, minutes);
                return py::dict(py::arg("engines") = p.engines, py::arg("nodes") = p.nodes,
                                py::arg("walltime") = p.walltime);
           },
           py::arg("trials"), py::arg("max_engines"), py::arg("tasks_per_node"), py::arg("minutes_per_run"));

     // Config
     py::class_<Config>(m, "Config")
          .def(py::init<>())
          .def_static("from_yaml", &Config::fromYamlString, py::arg("text"))
          .def_static("from_file", &Config::fromYamlFile, py::arg("path"))
          .def("set", &Config::set, py::arg("key"), py::arg("value"))
          .def("get", [](const Config& c, const std::string& key) { return c.get(key); }, py::arg("key"))
          .def("values", &Config::values);

     // Distribution & Parameter
     py::class_<Distribution>(m, "Distribution")
          .def_static("from_args", &Distribution::fromArgs,
                      py::arg("kind"),
                      py::arg("args"),
                      py::arg("values") = std::vector<double>{},
                      py::arg("linked") = ""
          )
          .def("ppf", &Distribution::ppf, py::arg("u"))
          .def("is_stochastic", &Distribution::isStochastic)
          .def("kind", [](const Distribution& d) { return std::string(toString(d.kind())); })
          .def("__repr__", &Distribution::describe);

     py::class_<Parameter>(m, "Parameter")
          .def(py::init([](const std::string& name, const Distribution& dist, const std::string& mode,
                           const std::string& apply, std::optional<double> low, std::optional<double> high) {
                    Parameter p(name, dist);
                    p.mode = mode_from_name(mode);
                    p.apply = apply;
                    p.bounds(low, high);
                    return p;
               }),
               py::arg("name"),
               py::arg("distribution"),
               py::arg("mode") = "shared",
               py::arg("apply") = "direct",
               py::arg("lowbound") = py::none(),
               py::arg("highbound") = py::none()
          )
          .def_readonly("name", &Parameter::name)
          .def_readwrite("apply", &Parameter::apply)
          .def_readwrite("base", &Parameter::baseValue)
          .def_readwrite("active", &Parameter::active);

     py::class_<ApplyRegistry>(m, "ApplyRegistry")
          .def(py::init<>())
          .def("register_expression", &ApplyRegistry::registerExpression,
               py::arg("name"), py::arg("expr"), py::arg("identity") = 0.0)
          .def("names", &ApplyRegistry::names);

     py::class_<Experiment>(m, "Experiment")
          .def(py::init([](const std::string& name, const std::string& role, const std::string& group) {
                    Experiment e;
                    e.name = name;
                    e.role = experimentRoleFromString(role);
                    e.group = group;
                    return e;
               }),
               py::arg("name"), py::arg("role") = "policy", py::arg("group") = "")
          .def_readonly("name", &Experiment::name)
          .def_property_readonly("role", [](const Experiment& e) { return std::string(toString(e.role)); });

     // Samplers
     m.def("lhs_percentiles", [](const int n, const uint64_t seed, const bool scramble) {
               LatinHypercubeSampler sampler(RngEngine(seed), scramble);
               return sampler.percentiles(n);
          },
          py::arg("n"), py::arg("seed"), py::arg("scramble") = true);

     // Compiler
     py::class_<InputValue>(m, "InputValue")
          .def_readonly("trial", &InputValue::trialNum)
          .def_readonly("parameter", &InputValue::parameter)
          .def_readonly("experiment", &InputValue::experiment)
          .def_readonly("value", &InputValue::value);

     py::class_<ParameterCompiler>(m, "ParameterCompiler")
          .def(py::init<std::vector<Parameter>, const ApplyRegistry&, uint64_t, const std::string&>(),
               py::arg("parameters"), py::arg("registry"), py::arg("seed"), py::arg("method") = "lhs")
          .def("compile", &ParameterCompiler::compile, py::arg("trial_count"), py::arg("experiments"))
          .def("order", &ParameterCompiler::order);

     // Steps
     py::class_<ResolvedStep>(m, "ResolvedStep")
          .def_readonly("name", &ResolvedStep::name)
          .def_readonly("seq", &ResolvedStep::seq)
          .def_readonly("command", &ResolvedStep::command)
          .def_readonly("internal", &ResolvedStep::internal);

     py::class_<RunContext>(m, "RunContext")
          .def_readonly("sim_id", &RunContext::simId)
          .def_readonly("run_id", &RunContext::runId)
          .def_readonly("trial", &RunContext::trialNum)
          .def_readonly("experiment", &RunContext::experiment)
          .def_readonly("trial_dir", &RunContext::trialDir)
          .def_readonly("inputs", &RunContext::inputs);

     py::class_<DispatchSummary>(m, "DispatchSummary")
          .def_readonly("failed_trials", &DispatchSummary::failedTrials)
          .def_readonly("aborted_trials", &DispatchSummary::abortedTrials)
          .def("count", [](const DispatchSummary& s, const std::string& status) {
               return s.count(runStatusFromString(status));
          })
          .def("__repr__", &DispatchSummary::describe);

     py::class_<SimulationSpec>(m, "SimulationSpec")
          .def_static("from_yaml", &loadSpecString, py::arg("text"))
          .def_static("from_file", &loadSpecFile, py::arg("path"));

     // Simulator
     py::class_<PySimulator, std::shared_ptr<PySimulator>>(m, "Simulator")
          .def(py::init<const Config&, SimulationSpec, ApplyRegistry, std::string>(),
               py::arg("config"),
               py::arg("spec"),
               py::arg("registry") = ApplyRegistry(),
               py::arg("project") = "ensemble"
          )
          .def("initialize", [](PySimulator& s, const std::string& name, const int trials) {
                    return s.core->initialize(name, trials);
               },
               py::arg("name"), py::arg("trials"))
          .def("run", &PySimulator::run, py::arg("sim_id"), py::arg("runner"), py::arg("trials") = std::vector<int>{})
          .def("collect", [](PySimulator& s, const int64_t simId) { return s.core->collect(simId); },
               py::arg("sim_id"))
          .def("preview_steps", [](const PySimulator& s, const std::string& exp) { return s.core->previewSteps(exp); },
               py::arg("experiment"))
          .def("status_summary", &PySimulator::statusSummary, py::arg("sim_id"))
          .def("results", &PySimulator::results, py::arg("sim_id"), py::arg("name"));
}
