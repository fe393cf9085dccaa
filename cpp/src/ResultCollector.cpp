#include "ResultCollector.h"
#include "Error.h"
#include "Logging.h"
#include "Trials.h"

#include <numeric>
#include <set>
#include <stdexcept>

using namespace ensemble;

std::string ensemble::toString(const ResultType type) {
    return type == ResultType::Diff ? "diff" : "scenario";
}

ResultType ensemble::resultTypeFromString(const std::string& text) {
    if (text == "scenario" || text.empty()) return ResultType::Scenario;
    if (text == "diff") return ResultType::Diff;
    throw ConfigurationError("Unknown result type '" + text + "' (expected scenario or diff)");
}

void ResultDef::validate() const {
    if (name.empty()) throw ConfigurationError("Result without a name");
    if (file.empty()) throw ConfigurationError("Result " + name + " names no file");
    if (file.front() == '/') throw ConfigurationError("Result " + name + ": path (" + file + ") must be relative");
    if (percentage && type != ResultType::Diff)
        throw ConfigurationError("Result " + name + ": percentage requires type diff");
    if (column && column->empty()) throw ConfigurationError("Result " + name + " has an empty column name");
}

double ExtractedResult::total() const {
    if (scalar) return *scalar;
    return std::accumulate(series.begin(), series.end(), 0.0,
                           [](const double acc, const std::pair<const int, double>& kv) { return acc + kv.second; });
}

namespace {
    double numericCell(const CsvTable& table, const size_t row, const std::string& column) {
        const std::string& text = table.cell(row, column);
        size_t pos = 0;
        double v = 0.0;
        try {
            v = std::stod(text, &pos);
        }
        catch (const std::logic_error&) {
            pos = 0;
        }
        if (text.empty() || pos != text.size())
            throw ExecutionError("Column " + column + " holds non-numeric value '" + text + "'");
        return v;
    }

    std::string stem(const std::string& file) {
        const auto slash = file.find_last_of('/');
        std::string base = slash == std::string::npos ? file : file.substr(slash + 1);
        const auto dot = base.find_last_of('.');
        return dot == std::string::npos || dot == 0 ? base : base.substr(0, dot);
    }

    /** Per-element policy − baseline, divided by the baseline for percentages. */
    std::optional<double> difference(const double policy, const double baseline, const bool percentage) {
        const double d = policy - baseline;
        if (!percentage) return d;
        if (baseline == 0.0) return std::nullopt;
        return d / baseline;
    }

    /**
     * Scalar: one difference. Series: per-year differences, or per-year ratios for a
     * non-cumulative percentage; a cumulative result carries the difference of the totals.
     */
    std::optional<ExtractedResult> diffResult(const ResultDef& def, const ExtractedResult& policy,
                                              const ExtractedResult& baseline) {
        ExtractedResult out = policy;
        if (policy.scalar) {
            out.scalar = difference(*policy.scalar, *baseline.scalar, def.percentage);
            if (!out.scalar) return std::nullopt;
            return out;
        }
        const bool perYearRatio = def.percentage && !def.cumulative;
        for (auto& kv : out.series) {
            const auto d = difference(kv.second, baseline.series.at(kv.first), perYearRatio);
            if (!d) return std::nullopt;
            kv.second = *d;
        }
        if (def.cumulative) {
            out.scalar = difference(policy.total(), baseline.total(), def.percentage);
            if (!out.scalar) return std::nullopt;
        }
        return out;
    }
}

//------------------------------------------------------------------------------
// extractResult(): constraint filter, region, units, scalar or per-year sums
//------------------------------------------------------------------------------
ExtractedResult ensemble::extractResult(const ResultDef& def, const CsvTable& table, const std::vector<int>& years) {
    for (const auto& col : def.constraints.columns())
        if (!table.columnIndex(col))
            throw ExecutionError("Result " + def.name + ": constraint column '" + col + "' not in " + table.title());

    std::vector<size_t> rows;
    for (size_t r = 0; r < table.rowCount(); ++r)
        if (def.constraints.matches(table, r)) rows.push_back(r);
    if (rows.empty())
        throw ExecutionError("Result " + def.name + ": constraints (" + def.constraints.describe() + ") matched no rows");

    ExtractedResult out;
    if (table.columnIndex("region")) {
        std::set<std::string> regions;
        for (const size_t r : rows) regions.insert(table.cell(r, "region"));
        out.region = regions.size() == 1 ? *regions.begin() : "Multiple";
    }
    else {
        out.region = "global";
    }
    if (table.columnIndex("Units")) out.units = table.cell(rows.front(), "Units");

    if (def.isScalar()) {
        if (!table.columnIndex(*def.column))
            throw ExecutionError("Result " + def.name + ": column '" + *def.column + "' not found");
        if (rows.size() > 1)
            logDebug("Result " + def.name + ": " + std::to_string(rows.size()) + " rows matched; using the first");
        out.scalar = numericCell(table, rows.front(), *def.column);
        return out;
    }

    for (const int year : years) {
        const std::string col = std::to_string(year);
        if (!table.columnIndex(col)) throw ExecutionError("Result " + def.name + ": year column " + col + " not found");
        double sum = 0.0;
        for (const size_t r : rows) sum += numericCell(table, r, col);
        out.series[year] = sum;
    }
    return out;
}

// FileResultSource
FileResultSource::FileResultSource(std::string simsDir, const int maxSimDirs)
    : simsDir_(std::move(simsDir)), maxSimDirs_(maxSimDirs) {}

std::string FileResultSource::csvPath(const ResultDef& def, const int64_t simId, const int trialNum,
                                      const std::string& experiment) const {
    return trialDirectory(simsDir_, simId, trialNum, maxSimDirs_) + "/" + experiment + "/queryResults/" +
           stem(def.file) + "-" + experiment + ".csv";
}

CsvTable FileResultSource::load(const ResultDef& def, const int64_t simId, const int trialNum,
                                const std::string& experiment) const {
    return CsvTable::fromFile(csvPath(def, simId, trialNum, experiment));
}

// ResultCollector
ResultCollector::ResultCollector(StateStore& store, std::vector<ResultDef> defs,
                                 std::shared_ptr<const ResultSource> source, std::vector<int> years)
    : store_(store), defs_(std::move(defs)), source_(std::move(source)), years_(std::move(years)) {
    if (!source_) throw std::invalid_argument("ResultCollector requires a result source");
    std::set<std::string> names;
    for (const auto& def : defs_) {
        def.validate();
        if (!names.insert(def.name).second) throw ConfigurationError("Duplicate result " + def.name);
        if (!def.isScalar() && years_.empty())
            throw ConfigurationError("Time-series result " + def.name + " requires declared years");
    }
}

std::optional<RunRecord> ResultCollector::successfulBaseline(const int64_t simId, const int trialNum) const {
    const auto baselines = store_.runs(simId, RunStatus::SUCCEEDED);
    std::optional<RunRecord> found;
    for (const auto& r : baselines)
        if (r.trialNum == trialNum && r.role == ExperimentRole::Baseline && (!found || r.runId > found->runId))
            found = r;
    return found;
}

bool ResultCollector::record(const ResultDef& def, const RunRecord& run, const ExtractedResult& value) {
    store_.defineOutput(def.name, def.description, value.units);
    if (!value.series.empty()) store_.saveTimeSeries(run.runId, def.name, value.region, value.series);
    if (!value.scalar && !def.cumulative) return true;

    const double v = value.scalar ? *value.scalar : value.total();
    if (!store_.saveOutputValue(run.runId, def.name, v))
        logDebug("Result " + def.name + " already recorded for run " + std::to_string(run.runId));
    return true;
}

//---- collectRun(): one run, every result definition ----
int ResultCollector::collectRun(const int64_t runId) {
    const auto run = store_.run(runId);
    if (!run) throw std::out_of_range("No run with id " + std::to_string(runId));
    if (run->status != RunStatus::SUCCEEDED) {
        logWarn("Skipping results of run " + std::to_string(runId) + " with status " + toString(run->status));
        return 0;
    }

    std::map<std::string, CsvTable> ownTables, baselineTables;
    std::optional<RunRecord> baseline;
    bool baselineLooked = false;

    auto table = [this](std::map<std::string, CsvTable>& cache, const ResultDef& def, const RunRecord& r)
        -> const CsvTable& {
        auto it = cache.find(def.file);
        if (it == cache.end())
            it = cache.emplace(def.file, source_->load(def, r.simId, r.trialNum, r.experiment)).first;
        return it->second;
    };

    int recorded = 0;
    for (const auto& def : defs_) {
        const std::string where = "Result " + def.name + ", trial " + std::to_string(run->trialNum) + ", " +
                                  run->experiment + ": ";
        if (def.type == ResultType::Diff && run->role == ExperimentRole::Baseline) continue;
        try {
            ExtractedResult value = extractResult(def, table(ownTables, def, *run), years_);

            if (def.type == ResultType::Diff) {
                if (!baselineLooked) {
                    baseline = successfulBaseline(run->simId, run->trialNum);
                    baselineLooked = true;
                }
                if (!baseline) {
                    logWarn(where + "no successful baseline run; skipped");
                    continue;
                }
                const ExtractedResult base = extractResult(def, table(baselineTables, def, *baseline), years_);
                auto diff = diffResult(def, value, base);
                if (!diff) {
                    logWarn(where + "baseline value is zero; percentage skipped");
                    continue;
                }
                value = std::move(*diff);
            }
            if (record(def, *run, value)) ++recorded;
        }
        catch (const StoreError&) {
            throw;
        }
        catch (const ExecutionError& e) {
            logWarn(where + e.what());
        }
        catch (const std::runtime_error& e) {
            logWarn(where + "cannot read query results: " + e.what());
        }
    }
    return recorded;
}

int ResultCollector::collectAll(const int64_t simId) {
    int recorded = 0;
    for (const auto& run : store_.latestRuns(simId))
        if (run.status == RunStatus::SUCCEEDED) recorded += collectRun(run.runId);
    logInfo("Collected " + std::to_string(recorded) + " result values for simulation " + std::to_string(simId));
    return recorded;
}
