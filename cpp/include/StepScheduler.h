#pragma once
/**
 * @file StepScheduler.h
 * @brief Workflow steps, template variables and per-experiment step resolution.
 */
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "Config.h"
#include "Experiment.h"

namespace ensemble {
    /** Which experiments a step runs for. */
    enum class StepScope { Baseline, Policy, All };

    std::string toString(StepScope scope);

    /** @brief "both", "all" and "" all mean StepScope::All. @throws ConfigurationError otherwise */
    StepScope stepScopeFromString(const std::string& text);

    /**
     * @brief One declared workflow step.
     *
     * (name, seq, scope) is the identity used when a later declaration overrides an earlier one.
     */
    struct Step {
        std::string name;
        int seq = 0;
        StepScope scope = StepScope::All;
        std::string command;
        std::string group; /**< regex over the scenario group; empty matches all */
        bool optional = false;
    };

    /**
     * @brief Ordered step declarations with override semantics.
     */
    class StepList {
    public:
        /**
         * @brief Add, replace or delete a step.
         *
         * A step whose identity matches an earlier one replaces it, or deletes it when
         * the command is empty. Otherwise the step is appended; an empty command on an
         * unmatched step is ignored.
         */
        void declare(Step step);

        /** @brief declare() with `seq` set one past the highest seq declared so far. */
        void declareNext(Step step);

        const std::vector<Step>& steps() const noexcept { return steps_; }
        bool empty() const noexcept { return steps_.empty(); }
        size_t size() const noexcept { return steps_.size(); }

    private:
        std::vector<Step> steps_;
        int maxSeq_ = 0;
    };

    /**
     * @brief A user variable for step templates.
     *
     * Exactly one of `value` or `configVar` is meaningful; `eval` marks values that
     * are themselves templates, expanded when the step is resolved.
     */
    struct Variable {
        std::string name;
        std::string value;
        std::string configVar;
        bool eval = false;
    };

    /**
     * @brief Name → value bindings used to render `{name}` placeholders.
     */
    class VariableEnvironment {
    public:
        VariableEnvironment() = default;

        /** @brief Bind a literal value. */
        void set(const std::string& name, const std::string& value) { vars_[name] = {value, false}; }

        /**
         * @brief Bind a user variable, reading `configVar` from `config` when given.
         * @throws ConfigurationError if the configuration variable is not set
         */
        void define(const Variable& var, const ConfigSource& config);

        bool contains(const std::string& name) const { return vars_.count(name) > 0; }

        /**
         * @brief Render a template: `{name}` is replaced, `{{` and `}}` produce literal braces.
         *
         * Variables flagged `eval` are rendered recursively before substitution.
         * @throws UnresolvedVariableError for an unbound name
         * @throws ConfigurationError for a malformed template or a self-referencing variable
         */
        std::string render(const std::string& text) const;

    private:
        struct Binding {
            std::string value;
            bool eval;
        };
        std::map<std::string, Binding> vars_;

        std::string render(const std::string& text, std::set<std::string>& expanding) const;
        std::string lookup(const std::string& name, std::set<std::string>& expanding, const std::string& text) const;
    };

    /**
     * @brief Paths and identities bound automatically for one run.
     */
    struct RunVariables {
        std::string project;
        int64_t simId = 0;
        int trialNum = 0;
        std::string scenario;
        std::string baseline;
        std::string scenarioGroup;
        std::string simsDir;
        std::string simDir;
        std::string trialDir;
    };

    /**
     * @brief Bind project, simId, trialNum, scenario, baseline, scenarioGroup, simsDir,
     * simDir, trialDir, scenarioDir, baselineDir, diffsDir, SEP and PSEP.
     */
    void bindRunVariables(VariableEnvironment& env, const RunVariables& vars);

    /** Caller restriction of the steps to run. Empty `only` means all non-optional steps. */
    struct StepFilter {
        std::set<std::string> only;
        std::set<std::string> skip;
    };

    /** A step ready for execution. */
    struct ResolvedStep {
        std::string name;
        int seq;
        std::string command;
        bool internal; /**< command was prefixed with '@' (the prefix is removed) */
    };

    /**
     * @brief Select, order and render the steps of one experiment.
     *
     * Steps are filtered by scope, group regex and `filter`, then stable-sorted by seq
     * so that ties keep declaration order. `env` also receives `step` while each step renders.
     * @throws UnresolvedVariableError if any selected step references an unbound name
     * @throws ConfigurationError for an invalid group regex
     */
    std::vector<ResolvedStep> resolveSteps(const StepList& steps, ExperimentRole role, VariableEnvironment env,
                                           const StepFilter& filter = {}, const std::string& scenarioGroup = "");
}
