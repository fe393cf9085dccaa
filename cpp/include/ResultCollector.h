#pragma once
/**
 * @file ResultCollector.h
 * @brief Extraction of model outputs from query-result files into the State Store.
 */
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Constraint.h"
#include "CsvTable.h"
#include "StateStore.h"

namespace ensemble {
    enum class ResultType { Scenario, Diff };

    std::string toString(ResultType type);

    /** @throws ConfigurationError for anything but scenario or diff */
    ResultType resultTypeFromString(const std::string& text);

    /**
     * @brief Declaration of one model output.
     *
     * With a column the result is a scalar read from that column; without one it is
     * a time series over the declared years.
     */
    struct ResultDef {
        std::string name;
        ResultType type = ResultType::Scenario;
        bool percentage = false;
        bool cumulative = false;
        std::string file; /**< query file, relative; its stem names the CSV */
        std::optional<std::string> column;
        ConstraintGroup constraints;
        std::string description;

        bool isScalar() const noexcept { return column.has_value(); }

        /** @throws ConfigurationError for a missing name, an absolute file or percentage on a scenario result */
        void validate() const;
    };

    /**
     * @brief Values pulled out of one query-result table.
     */
    struct ExtractedResult {
        std::string region; /**< the single region matched, "Multiple", or "global" without a region column */
        std::string units;
        std::optional<double> scalar;
        std::map<int, double> series;

        /** @brief The scalar, or the sum of the series. */
        double total() const;
    };

    /**
     * @brief Select the rows of `table` passing the constraints and read the result.
     *
     * A scalar result takes the column of the first matching row; a time series sums
     * every matching row per year.
     * @throws ExecutionError when no row matches, a column is missing or a cell is not numeric
     */
    ExtractedResult extractResult(const ResultDef& def, const CsvTable& table, const std::vector<int>& years);

    /**
     * @brief Provides the query-result table of one (trial, experiment).
     */
    class ResultSource {
    public:
        virtual ~ResultSource() = default;

        /** @throws std::runtime_error if the table is unavailable */
        virtual CsvTable load(const ResultDef& def, int64_t simId, int trialNum, const std::string& experiment) const = 0;
    };

    /**
     * @brief Reads `<trialDir>/<experiment>/queryResults/<stem>-<experiment>.csv`.
     */
    class FileResultSource final : public ResultSource {
    public:
        FileResultSource(std::string simsDir, int maxSimDirs);

        CsvTable load(const ResultDef& def, int64_t simId, int trialNum, const std::string& experiment) const override;

        std::string csvPath(const ResultDef& def, int64_t simId, int trialNum, const std::string& experiment) const;

    private:
        std::string simsDir_;
        int maxSimDirs_;
    };

    /**
     * @brief Writes OutputValue and time-series rows for successful runs.
     *
     * Output rows are write-once, so collecting a run twice leaves the store unchanged.
     * Gaps (unreadable files, unmatched rows, a missing baseline) are logged and skipped.
     */
    class ResultCollector {
    public:
        ResultCollector(StateStore& store, std::vector<ResultDef> defs, std::shared_ptr<const ResultSource> source,
                        std::vector<int> years);

        /** @return number of results recorded for this run */
        int collectRun(int64_t runId);

        /** @brief collectRun() for the latest SUCCEEDED attempt of every (trial, experiment). */
        int collectAll(int64_t simId);

        const std::vector<ResultDef>& definitions() const noexcept { return defs_; }

    private:
        StateStore& store_;
        std::vector<ResultDef> defs_;
        std::shared_ptr<const ResultSource> source_;
        std::vector<int> years_;

        std::optional<RunRecord> successfulBaseline(int64_t simId, int trialNum) const;
        bool record(const ResultDef& def, const RunRecord& run, const ExtractedResult& value);
    };
}
