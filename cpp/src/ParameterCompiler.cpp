#include "ParameterCompiler.h"
#include "Error.h"
#include "Logging.h"
#include "Sampler.h"

#include <algorithm>
#include <functional>

using namespace ensemble;

namespace {
    std::string columnKey(const DrawMode mode, const Experiment& exp) {
        return mode == DrawMode::Shared ? std::string() : exp.name;
    }

    std::string streamName(const std::string& what, const std::string& column) {
        return what + "/" + (column.empty() ? std::string("shared") : column);
    }
}

//------------------------------------------------------------------------------
// InputValueTable
//------------------------------------------------------------------------------
InputValueTable::InputValueTable(const std::vector<InputValue>& rows) {
    for (const auto& row : rows)
        values_[{row.trialNum, row.parameter}][row.experiment] = row.value;
}

std::optional<double> InputValueTable::value(const int trialNum, const std::string& parameter,
                                             const std::string& experiment) const {
    const auto it = values_.find({trialNum, parameter});
    if (it == values_.end()) return std::nullopt;
    const auto byExp = it->second.find(experiment);
    if (byExp != it->second.end()) return byExp->second;
    const auto shared = it->second.find("");
    if (shared != it->second.end()) return shared->second;
    return std::nullopt;
}

std::map<std::string, double> InputValueTable::valuesFor(const int trialNum, const std::string& experiment) const {
    std::map<std::string, double> out;
    for (const auto& kv : values_) {
        if (kv.first.first != trialNum) continue;
        if (const auto v = value(trialNum, kv.first.second, experiment)) out[kv.first.second] = *v;
    }
    return out;
}

//------------------------------------------------------------------------------
// ParameterCompiler
//------------------------------------------------------------------------------
ParameterCompiler::ParameterCompiler(std::vector<Parameter> params, const ApplyRegistry& registry,
                                     const uint64_t seed, const std::string& method)
    : params_(std::move(params)), registry_(registry), seed_(seed), method_(method) {
    makeSampler(method_, RngEngine(seed_));

    for (size_t i = 0; i < params_.size(); ++i) {
        const auto& p = params_[i];
        if (!p.active) continue;
        if (!index_.emplace(p.name, i).second)
            throw ConfigurationError("Duplicate parameter name " + p.name);
        if (!registry_.contains(p.apply))
            throw ConfigurationError("Parameter " + p.name + " uses unknown apply operator '" + p.apply + "'");
    }

    resolveLinks();
    groups_ = buildCorrelationGroups(params_);
}

//------------------------------------------------------------------------------
// resolveLinks(): depth-first topological order; a back edge is a cycle
//------------------------------------------------------------------------------
void ParameterCompiler::resolveLinks() {
    enum class Mark { None, Visiting, Done };
    std::map<std::string, Mark> marks;
    std::vector<std::string> path;

    std::function<void(const std::string&)> visit = [&](const std::string& name) {
        auto& mark = marks[name];
        if (mark == Mark::Done) return;
        if (mark == Mark::Visiting) {
            std::vector<std::string> cycle;
            auto it = std::find(path.begin(), path.end(), name);
            cycle.assign(it, path.end());
            cycle.push_back(name);
            throw CyclicLinkError(cycle);
        }
        mark = Mark::Visiting;
        path.push_back(name);

        const Parameter& p = byName(name);
        DrawMode mode = p.mode;
        if (p.isLinked()) {
            const std::string& target = p.distribution.linkedTo();
            if (!index_.count(target))
                throw ConfigurationError("Parameter " + name + " links to unknown or inactive parameter " + target);
            visit(target);
            mode = modes_.at(target);
        }

        path.pop_back();
        marks[name] = Mark::Done;
        modes_[name] = mode;
        order_.push_back(name);
    };

    for (const auto& p : params_)
        if (p.active) visit(p.name);
}

DrawMode ParameterCompiler::effectiveMode(const std::string& name) const {
    const auto it = modes_.find(name);
    if (it == modes_.end()) throw std::out_of_range("ParameterCompiler: no active parameter named " + name);
    return it->second;
}

std::vector<InputValue> ParameterCompiler::compile(const int trialCount,
                                                   const std::vector<Experiment>& experiments) const {
    if (trialCount < 1) throw ConfigurationError("Trial count must be >= 1, got " + std::to_string(trialCount));
    findBaseline(experiments);

    // column key is "" for shared parameters and the experiment name otherwise
    using Column = std::pair<std::string, std::string>;
    std::map<Column, std::vector<double>> percentiles;

    auto columnsOf = [&experiments](const DrawMode mode) {
        std::vector<std::string> keys;
        if (mode == DrawMode::Shared) keys.emplace_back();
        else for (const auto& e : experiments) keys.push_back(columnKey(mode, e));
        return keys;
    };

    std::map<std::string, const CorrelationGroup*> groupOf;
    for (const auto& g : groups_)
        for (const auto& m : g.members) groupOf[m] = &g;

    // correlated columns: stratified percentiles reordered by Iman-Conover ranks
    for (const auto& g : groups_) {
        std::string groupName = "corr";
        for (const auto& m : g.members) groupName += ":" + m;
        for (const auto& key : columnsOf(g.mode)) {
            RngEngine rankRng = RngEngine::derive(seed_, streamName(groupName, key));
            const Eigen::MatrixXi ranks = imanConoverRanks(g.target, trialCount, rankRng);
            for (size_t j = 0; j < g.members.size(); ++j) {
                auto sampler = makeSampler(method_, RngEngine::derive(seed_, streamName(g.members[j], key)));
                const auto sorted = sampler->sortedPercentiles(trialCount);
                auto& column = percentiles[{g.members[j], key}];
                column.resize(trialCount);
                for (int t = 0; t < trialCount; ++t)
                    column[t] = sorted[ranks(t, static_cast<Eigen::Index>(j))];
            }
        }
    }

    std::map<Column, std::vector<double>> draws;
    std::vector<InputValue> rows;

    for (const auto& name : order_) {
        const Parameter& p = byName(name);
        const DrawMode mode = modes_.at(name);
        const double base = p.baseValue ? *p.baseValue : registry_.identity(p.apply);
        const ApplyFunction& fn = registry_.resolve(p.apply);

        for (const auto& key : columnsOf(mode)) {
            const Column col{name, key};
            if (p.distribution.isStochastic() && !groupOf.count(name)) {
                auto sampler = makeSampler(method_, RngEngine::derive(seed_, streamName(name, key)));
                percentiles[col] = sampler->percentiles(trialCount);
            }

            auto& raw = draws[col];
            raw.resize(trialCount);
            for (int t = 0; t < trialCount; ++t) {
                SampleContext ctx;
                ctx.trialNum = t;
                if (p.distribution.isStochastic()) ctx.percentile = percentiles.at(col)[t];
                ctx.linkedValue = [&draws, &key, t](const std::string& target) {
                    return draws.at({target, key})[t];
                };
                raw[t] = p.distribution.sample(ctx);
                rows.push_back({t, name, key, p.clamp(fn(base, raw[t], t))});
            }
        }
    }

    logDebug("Compiled " + std::to_string(rows.size()) + " input values for " + std::to_string(order_.size()) +
             " parameters over " + std::to_string(trialCount) + " trials");
    return rows;
}
