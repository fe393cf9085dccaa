#include "StepScheduler.h"
#include "Error.h"
#include "Logging.h"

#include <algorithm>
#include <iomanip>
#include <regex>
#include <sstream>

using namespace ensemble;

std::string ensemble::toString(const StepScope scope) {
    switch (scope) {
        case StepScope::Baseline: return "baseline";
        case StepScope::Policy: return "policy";
        case StepScope::All: return "all";
    }
    return "all";
}

StepScope ensemble::stepScopeFromString(const std::string& text) {
    if (text == "baseline") return StepScope::Baseline;
    if (text == "policy") return StepScope::Policy;
    if (text == "all" || text == "both" || text.empty()) return StepScope::All;
    throw ConfigurationError("Unknown step scope '" + text + "' (expected baseline, policy or both)");
}

//---- StepList::declare(): identity is (name, seq, scope) ----
void StepList::declare(Step step) {
    if (step.name.empty()) throw ConfigurationError("Workflow step without a name");

    const auto same = std::find_if(steps_.begin(), steps_.end(), [&step](const Step& s) {
        return s.name == step.name && s.seq == step.seq && s.scope == step.scope;
    });

    maxSeq_ = std::max(maxSeq_, step.seq);
    if (same != steps_.end()) {
        if (step.command.empty()) {
            logDebug("Deleting workflow step " + step.name);
            steps_.erase(same);
        }
        else {
            *same = std::move(step);
        }
        return;
    }
    if (step.command.empty()) {
        logWarn("Ignoring deletion of undeclared workflow step " + step.name);
        return;
    }
    steps_.push_back(std::move(step));
}

void StepList::declareNext(Step step) {
    step.seq = maxSeq_ + 1;
    declare(std::move(step));
}

//---- VariableEnvironment ----
void VariableEnvironment::define(const Variable& var, const ConfigSource& config) {
    if (var.name.empty()) throw ConfigurationError("Template variable without a name");
    if (var.configVar.empty()) {
        vars_[var.name] = {var.value, var.eval};
        return;
    }
    const auto v = config.get(var.configVar);
    if (!v) throw ConfigurationError("Variable " + var.name + " refers to unset configuration value " + var.configVar);
    vars_[var.name] = {*v, var.eval};
}

std::string VariableEnvironment::render(const std::string& text) const {
    std::set<std::string> expanding;
    return render(text, expanding);
}

std::string VariableEnvironment::render(const std::string& text, std::set<std::string>& expanding) const {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '{') {
            if (i + 1 < text.size() && text[i + 1] == '{') {
                out += '{';
                ++i;
                continue;
            }
            const auto close = text.find('}', i + 1);
            if (close == std::string::npos) throw ConfigurationError("Unterminated '{' in \"" + text + "\"");
            const std::string name = text.substr(i + 1, close - i - 1);
            if (name.empty()) throw ConfigurationError("Empty placeholder in \"" + text + "\"");
            out += lookup(name, expanding, text);
            i = close;
        }
        else if (c == '}') {
            if (i + 1 < text.size() && text[i + 1] == '}') {
                out += '}';
                ++i;
                continue;
            }
            throw ConfigurationError("Unmatched '}' in \"" + text + "\"");
        }
        else {
            out += c;
        }
    }
    return out;
}

std::string VariableEnvironment::lookup(const std::string& name, std::set<std::string>& expanding,
                                        const std::string& text) const {
    const auto it = vars_.find(name);
    if (it == vars_.end()) throw UnresolvedVariableError(name, text);
    if (!it->second.eval) return it->second.value;

    if (!expanding.insert(name).second)
        throw ConfigurationError("Variable '" + name + "' refers to itself");
    std::string value = render(it->second.value, expanding);
    expanding.erase(name);
    return value;
}

void ensemble::bindRunVariables(VariableEnvironment& env, const RunVariables& vars) {
    const std::string sep = "/";
    std::string simDir = vars.simDir;
    if (simDir.empty()) {
        std::ostringstream oss;
        oss << vars.simsDir << sep << 's' << std::setw(3) << std::setfill('0') << vars.simId;
        simDir = oss.str();
    }

    env.set("project", vars.project);
    env.set("simId", std::to_string(vars.simId));
    env.set("trialNum", std::to_string(vars.trialNum));
    env.set("scenario", vars.scenario);
    env.set("baseline", vars.baseline);
    env.set("scenarioGroup", vars.scenarioGroup);
    env.set("simsDir", vars.simsDir);
    env.set("simDir", simDir);
    env.set("trialDir", vars.trialDir);
    env.set("scenarioDir", vars.trialDir + sep + vars.scenario);
    env.set("baselineDir", vars.trialDir + sep + vars.baseline);
    env.set("diffsDir", vars.trialDir + sep + "diffs");
    env.set("SEP", sep);
    env.set("PSEP", ":");
}

//------------------------------------------------------------------------------
// resolveSteps(): scope and group filter, stable sort by seq, render
//------------------------------------------------------------------------------
std::vector<ResolvedStep> ensemble::resolveSteps(const StepList& steps, const ExperimentRole role,
                                                 VariableEnvironment env, const StepFilter& filter,
                                                 const std::string& scenarioGroup) {
    const StepScope excluded = role == ExperimentRole::Baseline ? StepScope::Policy : StepScope::Baseline;

    std::vector<const Step*> selected;
    for (const auto& step : steps.steps()) {
        if (step.scope == excluded) continue;
        if (filter.skip.count(step.name)) continue;
        if (filter.only.empty() ? step.optional : filter.only.count(step.name) == 0) continue;
        if (!step.group.empty()) {
            std::regex pattern;
            try {
                pattern = std::regex(step.group);
            }
            catch (const std::regex_error& e) {
                throw ConfigurationError("Invalid group pattern '" + step.group + "' for step " + step.name + ": " +
                                         e.what());
            }
            if (!std::regex_match(scenarioGroup, pattern)) continue;
        }
        selected.push_back(&step);
    }
    std::stable_sort(selected.begin(), selected.end(), [](const Step* a, const Step* b) { return a->seq < b->seq; });

    std::vector<ResolvedStep> resolved;
    resolved.reserve(selected.size());
    for (const Step* step : selected) {
        env.set("step", step->name);
        std::string command = env.render(step->command);
        const bool internal = !command.empty() && command.front() == '@';
        if (internal) command.erase(0, 1);
        resolved.push_back({step->name, step->seq, std::move(command), internal});
    }
    return resolved;
}
