// ResultCollector_test.cpp
#include "gtest/gtest.h"
#include "Constraint.h"
#include "CsvTable.h"
#include "Error.h"
#include "ResultCollector.h"
#include "Trials.h"
#include <map>
#include <stdexcept>

using namespace ensemble;

static const char* kEmissions =
    "CO2 emissions by region\n"
    "scenario, region, sector, 2020, 2025, Units\n"
    "base,USA,\"transport, road\",10,12,MtC\r\n"
    "\n"
    "base,USA,electricity,5,6,MtC\n"
    "base,China,electricity,20,25,MtC\n";

static ColumnConstraint where(const std::string& column, const std::string& op, const std::string& value) {
    return ColumnConstraint(column, constraintOpFromString(op), value);
}

TEST(CsvTable, TitleHeaderAndQuotedCells) {
    const auto table = CsvTable::fromString(kEmissions);
    EXPECT_EQ(table.title(), "CO2 emissions by region");
    EXPECT_EQ(table.header(), (std::vector<std::string>{"scenario", "region", "sector", "2020", "2025", "Units"}));
    ASSERT_EQ(table.rowCount(), 3u);
    EXPECT_EQ(table.cell(0, "sector"), "transport, road");
    EXPECT_EQ(table.cell(0, "Units"), "MtC");
    EXPECT_EQ(table.columnIndex(" region "), 1u);
    EXPECT_FALSE(table.columnIndex("price"));
    EXPECT_THROW(table.cell(0, "price"), std::out_of_range);
    EXPECT_THROW(table.cell(5, "region"), std::out_of_range);

    const auto bare = CsvTable::fromString("a,b,c\n1,2\n", false);
    EXPECT_EQ(bare.title(), "");
    EXPECT_EQ(bare.cell(0, "b"), "2");
    EXPECT_EQ(bare.cell(0, "c"), "");

    EXPECT_THROW(CsvTable::fromString("only a title\n"), std::runtime_error);
    EXPECT_THROW(CsvTable::fromString("a,b\n1,2\\\n", false), std::runtime_error);
    EXPECT_THROW(CsvTable::fromFile("/nonexistent/queryResults/x.csv"), std::runtime_error);
}

TEST(Constraint, Operators) {
    const auto table = CsvTable::fromString(kEmissions);
    EXPECT_TRUE(where("region", "==", "USA").matches(table, 0));
    EXPECT_FALSE(where("region", "eq", "USA").matches(table, 2));
    EXPECT_TRUE(where("region", "!=", "USA").matches(table, 2));
    EXPECT_TRUE(where("sector", "startswith", "trans").matches(table, 0));
    EXPECT_TRUE(where("sector", "endswith", "road").matches(table, 0));
    EXPECT_FALSE(where("sector", "endswith", "a much longer suffix").matches(table, 1));
    EXPECT_TRUE(where("sector", "contains", "ctri").matches(table, 1));

    EXPECT_EQ(constraintOpFromString("neq"), ConstraintOp::NotEqual);
    EXPECT_THROW(constraintOpFromString("like"), ConfigurationError);
    EXPECT_THROW(ColumnConstraint("", ConstraintOp::Equal, "x"), ConfigurationError);
}

TEST(Constraint, GroupsAreConjunctive) {
    const auto table = CsvTable::fromString(kEmissions);
    ConstraintGroup group;
    EXPECT_TRUE(group.matches(table, 0));
    EXPECT_EQ(group.describe(), "all rows");

    group.add(where("region", "==", "USA"));
    group.add(where("sector", "==", "electricity"));
    EXPECT_FALSE(group.matches(table, 0));
    EXPECT_TRUE(group.matches(table, 1));
    EXPECT_FALSE(group.matches(table, 2));
    EXPECT_EQ(group.columns(), (std::vector<std::string>{"region", "sector"}));
    EXPECT_EQ(group.describe(), "region equal 'USA' and sector equal 'electricity'");

    const ConstraintGroup copy = group;
    EXPECT_EQ(copy.size(), 2u);
    EXPECT_TRUE(copy.matches(table, 1));
}

static ResultDef seriesResult(const std::string& name) {
    ResultDef def;
    def.name = name;
    def.file = "queries/emissions.xml";
    return def;
}

TEST(ExtractResult, TimeSeriesSumsMatchingRows) {
    const auto table = CsvTable::fromString(kEmissions);
    ResultDef def = seriesResult("co2");
    def.constraints.add(where("region", "==", "USA"));

    const auto r = extractResult(def, table, {2020, 2025});
    EXPECT_EQ(r.region, "USA");
    EXPECT_EQ(r.units, "MtC");
    EXPECT_FALSE(r.scalar);
    EXPECT_EQ(r.series, (std::map<int, double>{{2020, 15.0}, {2025, 18.0}}));
    EXPECT_DOUBLE_EQ(r.total(), 33.0);

    EXPECT_THROW(extractResult(def, table, {2030}), ExecutionError);
}

TEST(ExtractResult, ScalarTakesTheFirstMatchingRow) {
    const auto table = CsvTable::fromString(kEmissions);
    ResultDef def = seriesResult("elec2020");
    def.column = "2020";
    def.constraints.add(where("sector", "==", "electricity"));

    const auto r = extractResult(def, table, {});
    EXPECT_EQ(r.region, "Multiple");
    ASSERT_TRUE(r.scalar);
    EXPECT_DOUBLE_EQ(*r.scalar, 5.0);

    def.column = "Units";
    EXPECT_THROW(extractResult(def, table, {}), ExecutionError);
    def.column = "2040";
    EXPECT_THROW(extractResult(def, table, {}), ExecutionError);

    ResultDef none = seriesResult("none");
    none.column = "2020";
    none.constraints.add(where("region", "==", "Mars"));
    EXPECT_THROW(extractResult(none, table, {}), ExecutionError);

    ResultDef badColumn = seriesResult("bad");
    badColumn.column = "2020";
    badColumn.constraints.add(where("fuel", "==", "coal"));
    EXPECT_THROW(extractResult(badColumn, table, {}), ExecutionError);

    const auto global = extractResult(seriesResult("g"), CsvTable::fromString("t\n2020\n1\n2\n"), {2020});
    EXPECT_EQ(global.region, "global");
    EXPECT_DOUBLE_EQ(global.series.at(2020), 3.0);
}

TEST(ResultDef, Validation) {
    ResultDef def = seriesResult("pct");
    def.percentage = true;
    EXPECT_THROW(def.validate(), ConfigurationError);
    def.type = ResultType::Diff;
    EXPECT_NO_THROW(def.validate());
    def.file = "/abs/emissions.xml";
    EXPECT_THROW(def.validate(), ConfigurationError);

    EXPECT_EQ(resultTypeFromString("diff"), ResultType::Diff);
    EXPECT_THROW(resultTypeFromString("ratio"), ConfigurationError);
}

TEST(FileResultSource, QueryResultPath) {
    const FileResultSource source("sims", 1000);
    EXPECT_EQ(source.csvPath(seriesResult("co2"), 1, 12, "tax"),
              trialDirectory("sims", 1, 12, 1000) + "/tax/queryResults/emissions-tax.csv");
}

/** Serves tables by (trial, experiment); a missing entry behaves like a missing file. */
class MemorySource final : public ResultSource {
public:
    CsvTable load(const ResultDef&, int64_t, int trialNum, const std::string& experiment) const override {
        const auto it = tables.find({trialNum, experiment});
        if (it == tables.end()) throw std::runtime_error("no table for " + experiment);
        return CsvTable::fromString(it->second);
    }

    std::map<std::pair<int, std::string>, std::string> tables;
};

static std::string electricity(double y2020, double y2025) {
    return "Electricity\nregion,sector,2020,2025,Units\nUSA,electricity," + std::to_string(y2020) + "," +
           std::to_string(y2025) + ",EJ\n";
}

class ResultCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        simId = store.createSimulation("collect", 2);
        Experiment base;
        base.name = "base";
        base.role = ExperimentRole::Baseline;
        Experiment tax;
        tax.name = "tax";
        const int64_t baseId = store.createExperiment(simId, base);
        const int64_t taxId = store.createExperiment(simId, tax);
        store.createTrials(simId, 2);
        for (int t = 0; t < 2; ++t) {
            baselineRuns[t] = succeed(store.createRun(simId, baseId, t));
            policyRuns[t] = succeed(store.createRun(simId, taxId, t));
        }

        source = std::make_shared<MemorySource>();
        source->tables[{0, "base"}] = electricity(5, 6);
        source->tables[{0, "tax"}] = electricity(4, 3);
        source->tables[{1, "base"}] = electricity(0, 6);
        source->tables[{1, "tax"}] = electricity(2, 3);

        ResultDef level = seriesResult("elec");
        level.column = "2020";
        ResultDef diff = level;
        diff.name = "elecDiff";
        diff.type = ResultType::Diff;
        ResultDef pct = diff;
        pct.name = "elecPct";
        pct.percentage = true;
        ResultDef cum = seriesResult("elecCum");
        cum.type = ResultType::Diff;
        cum.cumulative = true;
        defs = {level, diff, pct, cum, seriesResult("elecSeries")};
    }

    int64_t succeed(int64_t runId) {
        EXPECT_TRUE(store.claimRun(runId, "w"));
        EXPECT_TRUE(store.transition(runId, RunStatus::QUEUED, RunStatus::RUNNING));
        EXPECT_TRUE(store.transition(runId, RunStatus::RUNNING, RunStatus::SUCCEEDED));
        return runId;
    }

    ResultCollector collector() { return ResultCollector(store, defs, source, {2020, 2025}); }

    StateStore store{":memory:"};
    int64_t simId = 0;
    int64_t baselineRuns[2] = {0, 0};
    int64_t policyRuns[2] = {0, 0};
    std::shared_ptr<MemorySource> source;
    std::vector<ResultDef> defs;
};

TEST_F(ResultCollectorTest, BaselineRecordsScenarioResultsOnly) {
    auto c = collector();
    EXPECT_EQ(c.collectRun(baselineRuns[0]), 2);
    EXPECT_DOUBLE_EQ(*store.outputValue(baselineRuns[0], "elec"), 5.0);
    EXPECT_FALSE(store.outputValue(baselineRuns[0], "elecDiff"));
    EXPECT_EQ(store.timeSeries(baselineRuns[0], "elecSeries"), (std::map<int, double>{{2020, 5.0}, {2025, 6.0}}));
    EXPECT_FALSE(store.outputValue(baselineRuns[0], "elecSeries")); // not cumulative
}

TEST_F(ResultCollectorTest, DifferencesAgainstTheBaseline) {
    auto c = collector();
    EXPECT_EQ(c.collectRun(policyRuns[0]), 5);
    const int64_t run = policyRuns[0];
    EXPECT_DOUBLE_EQ(*store.outputValue(run, "elec"), 4.0);
    EXPECT_DOUBLE_EQ(*store.outputValue(run, "elecDiff"), -1.0);
    EXPECT_DOUBLE_EQ(*store.outputValue(run, "elecPct"), -0.2);
    EXPECT_EQ(store.timeSeries(run, "elecCum"), (std::map<int, double>{{2020, -1.0}, {2025, -3.0}}));
    EXPECT_DOUBLE_EQ(*store.outputValue(run, "elecCum"), -4.0);
}

TEST_F(ResultCollectorTest, ZeroBaselineLeavesAPercentageGap) {
    auto c = collector();
    EXPECT_EQ(c.collectRun(policyRuns[1]), 4);
    EXPECT_DOUBLE_EQ(*store.outputValue(policyRuns[1], "elecDiff"), 2.0);
    EXPECT_FALSE(store.outputValue(policyRuns[1], "elecPct"));
}

TEST_F(ResultCollectorTest, MissingBaselineSkipsDiffs) {
    store.exec("UPDATE run SET status = 'FAILED' WHERE runId = " + std::to_string(baselineRuns[1]));
    auto c = collector();
    EXPECT_EQ(c.collectRun(policyRuns[1]), 2);
    EXPECT_TRUE(store.outputValue(policyRuns[1], "elec"));
    EXPECT_FALSE(store.outputValue(policyRuns[1], "elecDiff"));

    source->tables.erase({0, "base"});
    EXPECT_EQ(c.collectRun(policyRuns[0]), 2);
    EXPECT_EQ(c.collectRun(baselineRuns[0]), 0);
}

TEST_F(ResultCollectorTest, CollectingTwiceChangesNothing) {
    auto c = collector();
    EXPECT_EQ(c.collectAll(simId), 2 + 5 + 2 + 4);
    source->tables[{0, "tax"}] = electricity(100, 100);
    c.collectAll(simId);
    EXPECT_DOUBLE_EQ(*store.outputValue(policyRuns[0], "elec"), 4.0);
    EXPECT_EQ(store.timeSeries(policyRuns[0], "elecSeries"), (std::map<int, double>{{2020, 4.0}, {2025, 3.0}}));

    const auto rows = store.results(simId, "elecDiff");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].trialNum, 0);
    EXPECT_EQ(rows[0].experiment, "tax");
}

TEST_F(ResultCollectorTest, InvalidCollectors) {
    defs.push_back(seriesResult("elec"));
    EXPECT_THROW(collector(), ConfigurationError);
    defs.pop_back();
    EXPECT_THROW(ResultCollector(store, defs, source, {}), ConfigurationError);
    EXPECT_THROW(ResultCollector(store, defs, nullptr, {2020}), std::invalid_argument);
    EXPECT_THROW(collector().collectRun(9999), std::out_of_range);
}
