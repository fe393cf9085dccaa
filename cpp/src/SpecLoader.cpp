#include "SpecLoader.h"
#include "Error.h"
#include "Logging.h"

#include <fstream>
#include <set>
#include <sstream>

#include <yaml-cpp/yaml.h>

using namespace ensemble;

namespace {
    void checkKeys(const YAML::Node& node, const std::set<std::string>& allowed, const std::string& where) {
        if (!node.IsMap()) throw ConfigurationError(where + " must be a map");
        for (const auto& kv : node) {
            const auto key = kv.first.as<std::string>();
            if (!allowed.count(key)) throw ConfigurationError(where + ": unknown key '" + key + "'");
        }
    }

    template <typename T>
    T scalar(const YAML::Node& node, const std::string& key, const std::string& where) {
        try {
            return node[key].as<T>();
        }
        catch (const YAML::Exception&) {
            throw ConfigurationError(where + ": key '" + key + "' has the wrong type");
        }
    }

    template <typename T>
    T scalarOr(const YAML::Node& node, const std::string& key, const T& fallback, const std::string& where) {
        if (!node[key] || node[key].IsNull()) return fallback;
        return scalar<T>(node, key, where);
    }

    std::string required(const YAML::Node& node, const std::string& key, const std::string& where) {
        if (!node[key]) throw ConfigurationError(where + ": missing '" + key + "'");
        return scalar<std::string>(node, key, where);
    }

    std::optional<double> optionalReal(const YAML::Node& node, const std::string& key, const std::string& where) {
        if (!node[key] || node[key].IsNull()) return std::nullopt;
        return scalar<double>(node, key, where);
    }

    YAML::Node sequence(const YAML::Node& root, const std::string& key) {
        const YAML::Node node = root[key];
        if (!node || node.IsNull()) return YAML::Node(YAML::NodeType::Sequence);
        if (!node.IsSequence()) throw ConfigurationError("'" + key + "' must be a list");
        return node;
    }

    //---- distribution: { kind: <Kind>, <arg>: <number>, ... } ----
    Distribution parseDistribution(const YAML::Node& node, const std::string& where) {
        if (!node || !node.IsMap()) throw ConfigurationError(where + ": 'distribution' must be a map");
        const std::string kind = required(node, "kind", where + " distribution");

        std::map<std::string, double> args;
        std::vector<double> values;
        std::string linked;
        for (const auto& kv : node) {
            const auto key = kv.first.as<std::string>();
            if (key == "kind") continue;
            if (key == "values") {
                if (!kv.second.IsSequence()) throw ConfigurationError(where + ": 'values' must be a list");
                for (const auto& v : kv.second) {
                    try {
                        values.push_back(v.as<double>());
                    }
                    catch (const YAML::Exception&) {
                        throw ConfigurationError(where + ": 'values' must hold numbers");
                    }
                }
            }
            else if (key == "parameter") {
                linked = scalar<std::string>(node, key, where);
            }
            else {
                args[key] = scalar<double>(node, key, where);
            }
        }
        try {
            return Distribution::fromArgs(kind, args, values, linked);
        }
        catch (const DistributionSpecError& e) {
            throw DistributionSpecError(where + ": " + e.what());
        }
    }

    Parameter parseParameter(const YAML::Node& node, const size_t index) {
        const std::string where = "parameters[" + std::to_string(index) + "]";
        checkKeys(node, {"name", "mode", "active", "apply", "lowbound", "highbound", "base", "distribution",
                         "correlations", "description"}, where);
        const std::string name = required(node, "name", where);
        const std::string ctx = "Parameter " + name;

        Parameter p(name, parseDistribution(node["distribution"], ctx));
        const auto mode = scalarOr<std::string>(node, "mode", "shared", ctx);
        if (mode == "shared") p.mode = DrawMode::Shared;
        else if (mode == "independent") p.mode = DrawMode::Independent;
        else throw ConfigurationError(ctx + ": unknown mode '" + mode + "' (expected shared or independent)");

        p.active = scalarOr<bool>(node, "active", true, ctx);
        p.apply = scalarOr<std::string>(node, "apply", "direct", ctx);
        p.bounds(optionalReal(node, "lowbound", ctx), optionalReal(node, "highbound", ctx));
        p.baseValue = optionalReal(node, "base", ctx);
        p.description = scalarOr<std::string>(node, "description", "", ctx);

        if (const auto corr = node["correlations"]) {
            if (!corr.IsSequence()) throw ConfigurationError(ctx + ": 'correlations' must be a list");
            for (const auto& c : corr) {
                checkKeys(c, {"with", "coefficient"}, ctx + " correlation");
                p.correlations.push_back({required(c, "with", ctx), scalar<double>(c, "coefficient", ctx)});
            }
        }
        return p;
    }

    ResultDef parseResult(const YAML::Node& node, const size_t index) {
        const std::string where = "results[" + std::to_string(index) + "]";
        checkKeys(node, {"name", "type", "percentage", "cumulative", "file", "column", "constraints", "description"},
                  where);
        ResultDef def;
        def.name = required(node, "name", where);
        const std::string ctx = "Result " + def.name;
        def.type = resultTypeFromString(scalarOr<std::string>(node, "type", "scenario", ctx));
        def.percentage = scalarOr<bool>(node, "percentage", false, ctx);
        def.cumulative = scalarOr<bool>(node, "cumulative", false, ctx);
        def.file = required(node, "file", ctx);
        if (node["column"] && !node["column"].IsNull()) def.column = scalar<std::string>(node, "column", ctx);
        def.description = scalarOr<std::string>(node, "description", "", ctx);

        if (const auto cons = node["constraints"]) {
            if (!cons.IsSequence()) throw ConfigurationError(ctx + ": 'constraints' must be a list");
            for (const auto& c : cons) {
                checkKeys(c, {"column", "op", "value"}, ctx + " constraint");
                def.constraints.add(ColumnConstraint(required(c, "column", ctx),
                                                     constraintOpFromString(required(c, "op", ctx)),
                                                     required(c, "value", ctx)));
            }
        }
        def.validate();
        return def;
    }

    Experiment parseExperiment(const YAML::Node& node, const size_t index) {
        const std::string where = "experiments[" + std::to_string(index) + "]";
        checkKeys(node, {"name", "role", "group", "description"}, where);
        Experiment e;
        e.name = required(node, "name", where);
        e.role = experimentRoleFromString(scalarOr<std::string>(node, "role", "policy", "Experiment " + e.name));
        e.group = scalarOr<std::string>(node, "group", "", "Experiment " + e.name);
        e.description = scalarOr<std::string>(node, "description", "", "Experiment " + e.name);
        return e;
    }

    Variable parseVariable(const YAML::Node& node, const size_t index) {
        const std::string where = "vars[" + std::to_string(index) + "]";
        checkKeys(node, {"name", "value", "configVar", "eval"}, where);
        Variable v;
        v.name = required(node, "name", where);
        const std::string ctx = "Variable " + v.name;
        const bool hasValue = node["value"].IsDefined();
        const bool hasConfig = node["configVar"].IsDefined();
        if (hasValue == hasConfig) throw ConfigurationError(ctx + ": exactly one of 'value' or 'configVar' is required");
        v.value = scalarOr<std::string>(node, "value", "", ctx);
        v.configVar = scalarOr<std::string>(node, "configVar", "", ctx);
        v.eval = scalarOr<bool>(node, "eval", false, ctx);
        return v;
    }

    void declareStep(StepList& steps, const YAML::Node& node, const size_t index) {
        const std::string where = "steps[" + std::to_string(index) + "]";
        checkKeys(node, {"name", "seq", "runFor", "command", "group", "optional"}, where);
        Step step;
        step.name = required(node, "name", where);
        const std::string ctx = "Step " + step.name;
        step.scope = stepScopeFromString(scalarOr<std::string>(node, "runFor", "all", ctx));
        step.command = scalarOr<std::string>(node, "command", "", ctx);
        step.group = scalarOr<std::string>(node, "group", "", ctx);
        step.optional = scalarOr<bool>(node, "optional", false, ctx);
        if (node["seq"] && !node["seq"].IsNull()) {
            step.seq = scalar<int>(node, "seq", ctx);
            steps.declare(std::move(step));
        }
        else {
            steps.declareNext(std::move(step));
        }
    }
}

SimulationSpec ensemble::loadSpecString(const std::string& yamlText) {
    YAML::Node root;
    try {
        root = YAML::Load(yamlText);
    }
    catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Malformed specification: ") + e.what());
    }
    if (root.IsNull()) throw ConfigurationError("Empty specification");
    checkKeys(root, {"parameters", "results", "experiments", "vars", "steps"}, "specification");

    SimulationSpec spec;
    size_t i = 0;
    for (const auto& node : sequence(root, "parameters")) spec.parameters.push_back(parseParameter(node, i++));
    i = 0;
    for (const auto& node : sequence(root, "results")) spec.results.push_back(parseResult(node, i++));
    i = 0;
    for (const auto& node : sequence(root, "experiments")) spec.experiments.push_back(parseExperiment(node, i++));
    i = 0;
    for (const auto& node : sequence(root, "vars")) spec.vars.push_back(parseVariable(node, i++));
    i = 0;
    for (const auto& node : sequence(root, "steps")) declareStep(spec.steps, node, i++);

    logDebug("Loaded specification: " + std::to_string(spec.parameters.size()) + " parameters, " +
             std::to_string(spec.results.size()) + " results, " + std::to_string(spec.experiments.size()) +
             " experiments, " + std::to_string(spec.steps.size()) + " steps");
    return spec;
}

SimulationSpec ensemble::loadSpecFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("Cannot read specification file " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return loadSpecString(buffer.str());
}
