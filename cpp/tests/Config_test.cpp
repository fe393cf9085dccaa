// Config_test.cpp
#include "gtest/gtest.h"
#include "Config.h"
#include "Error.h"
#include <cstdio>
#include <fstream>
#include <string>

using namespace ensemble;

TEST(Config, Defaults) {
    const Config cfg;
    EXPECT_EQ(cfg.getString("MCS.SamplingMethod"), "lhs");
    EXPECT_EQ(cfg.getInt("MCS.MaxWorkers"), 8);
    EXPECT_TRUE(cfg.getBool("MCS.ShutdownWhenIdle"));
    EXPECT_FALSE(cfg.get("No.Such").has_value());
    EXPECT_THROW(cfg.getString("No.Such"), ConfigurationError);
    EXPECT_EQ(cfg.getString("No.Such", "fallback"), "fallback");
}

TEST(Config, YamlOverlay) {
    const Config cfg = Config::fromYamlString(R"(
MCS:
  MaxWorkers: 16
  Seed: 12345678901
  Years: [2020, "2030-2050:10"]
SLURM:
  Partition: long
Custom:
  Ratio: 0.25
  Flag: off
)");
    EXPECT_EQ(cfg.getInt("MCS.MaxWorkers"), 16);
    EXPECT_EQ(cfg.getInt64("MCS.Seed"), 12345678901LL);
    EXPECT_THROW(cfg.getInt("MCS.Seed"), ConfigurationError);
    EXPECT_EQ(cfg.getString("MCS.Years"), "2020,2030-2050:10");
    EXPECT_EQ(cfg.getString("SLURM.Partition"), "long");
    EXPECT_DOUBLE_EQ(cfg.getDouble("Custom.Ratio"), 0.25);
    EXPECT_FALSE(cfg.getBool("Custom.Flag"));
    // untouched defaults survive
    EXPECT_EQ(cfg.getString("PBS.Queue"), "short");
}

TEST(Config, MergeAndSet) {
    Config cfg;
    cfg.merge("MCS:\n  MaxRetries: 2\n");
    cfg.merge("MCS:\n  MaxRetries: 3\n");
    EXPECT_EQ(cfg.getInt("MCS.MaxRetries"), 3);
    cfg.set("MCS.MaxRetries", " 4 ");
    EXPECT_EQ(cfg.getInt("MCS.MaxRetries"), 4);
    cfg.set("MCS.MaxRetries", "four");
    EXPECT_THROW(cfg.getInt("MCS.MaxRetries"), ConfigurationError);
    cfg.set("MCS.ShutdownWhenIdle", "maybe");
    EXPECT_THROW(cfg.getBool("MCS.ShutdownWhenIdle"), ConfigurationError);
}

TEST(Config, MalformedYaml) {
    EXPECT_THROW(Config::fromYamlString("MCS: [1, 2"), ConfigurationError);
    EXPECT_THROW(Config::fromYamlString("- just\n- a list\n"), ConfigurationError);
    EXPECT_THROW(Config::fromYamlString("MCS: 3\n"), ConfigurationError);
    EXPECT_THROW(Config::fromYamlString("MCS:\n  Nested:\n    Deeper: 1\n"), ConfigurationError);
    EXPECT_THROW(Config::fromYamlFile("/nonexistent/ensemble.yaml"), ConfigurationError);
}

TEST(Config, FromFile) {
    const std::string path = ::testing::TempDir() + "ensemble_config_test.yaml";
    {
        std::ofstream out(path);
        out << "MCS:\n  DbPath: /tmp/x.sqlite\n";
    }
    EXPECT_EQ(Config::fromYamlFile(path).getString("MCS.DbPath"), "/tmp/x.sqlite");
    std::remove(path.c_str());
}

TEST(Config, ParseYears) {
    EXPECT_EQ(parseYears("2015-2030"), (std::vector<int>{2015, 2020, 2025, 2030}));
    EXPECT_EQ(parseYears("1990, 2005-2020:10, 1990"), (std::vector<int>{1990, 2005, 2015}));
    EXPECT_THROW(parseYears("2050-2020"), ConfigurationError);
    EXPECT_THROW(parseYears("2020-2030:0"), ConfigurationError);
    EXPECT_THROW(parseYears("twenty"), ConfigurationError);
    EXPECT_THROW(parseYears(" , "), ConfigurationError);
}
