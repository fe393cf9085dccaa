// SpecLoader_test.cpp
#include "gtest/gtest.h"
#include "Error.h"
#include "SpecLoader.h"
#include <cstdio>
#include <fstream>

using namespace ensemble;

static const char* kSpec = R"(
parameters:
  - name: elasticity
    distribution: {kind: triangle, factor: 0.3}
    apply: multiply
    base: 1.5
    correlations:
      - {with: growth, coefficient: 0.6}
  - name: growth
    mode: independent
    distribution: {kind: uniform, min: 0.01, max: 0.03}
    lowbound: 0.015
  - name: techMix
    distribution: {kind: sequence, values: [4, 6, 43.2]}
  - name: follower
    active: false
    distribution: {kind: linked, parameter: growth}

results:
  - name: co2
    file: queries/emissions.xml
    constraints:
      - {column: region, op: "==", value: USA}
  - name: co2Change
    type: diff
    percentage: true
    file: queries/emissions.xml
    column: "2050"

experiments:
  - {name: base, role: baseline}
  - {name: carbonTax, group: tax}

vars:
  - {name: workspace, configVar: GCAM.Workspace}
  - {name: exe, value: "{workspace}/gcam.exe", eval: true}

steps:
  - {name: gcam, seq: 10, runFor: baseline, command: "{exe} -C {scenarioDir}"}
  - {name: setup, seq: 5, runFor: both, command: "@prepare"}
  - {name: plot, command: "plot {scenario}", optional: true}
)";

TEST(SpecLoader, ParsesEverySection) {
    const SimulationSpec spec = loadSpecString(kSpec);

    ASSERT_EQ(spec.parameters.size(), 4u);
    const Parameter& elasticity = spec.parameters[0];
    EXPECT_EQ(elasticity.distribution.describe(), "Triangle(min=0.7, mode=1, max=1.3)");
    EXPECT_EQ(elasticity.apply, "multiply");
    EXPECT_DOUBLE_EQ(*elasticity.baseValue, 1.5);
    ASSERT_EQ(elasticity.correlations.size(), 1u);
    EXPECT_EQ(elasticity.correlations[0].with, "growth");
    EXPECT_DOUBLE_EQ(elasticity.correlations[0].coefficient, 0.6);

    const Parameter& growth = spec.parameters[1];
    EXPECT_EQ(growth.mode, DrawMode::Independent);
    EXPECT_EQ(growth.distribution.kind(), DistributionKind::Uniform);
    EXPECT_DOUBLE_EQ(*growth.lowBound, 0.015);
    EXPECT_FALSE(growth.highBound);

    EXPECT_EQ(spec.parameters[2].distribution.kind(), DistributionKind::Sequence);
    EXPECT_FALSE(spec.parameters[3].active);
    EXPECT_EQ(spec.parameters[3].distribution.linkedTo(), "growth");

    ASSERT_EQ(spec.results.size(), 2u);
    EXPECT_FALSE(spec.results[0].isScalar());
    EXPECT_EQ(spec.results[0].constraints.describe(), "region equal 'USA'");
    EXPECT_EQ(spec.results[1].type, ResultType::Diff);
    EXPECT_TRUE(spec.results[1].percentage);
    EXPECT_EQ(*spec.results[1].column, "2050");

    ASSERT_EQ(spec.experiments.size(), 2u);
    EXPECT_TRUE(spec.experiments[0].isBaseline());
    EXPECT_EQ(spec.experiments[1].role, ExperimentRole::Policy);
    EXPECT_EQ(spec.experiments[1].group, "tax");

    ASSERT_EQ(spec.vars.size(), 2u);
    EXPECT_EQ(spec.vars[0].configVar, "GCAM.Workspace");
    EXPECT_TRUE(spec.vars[1].eval);

    const auto& steps = spec.steps.steps();
    ASSERT_EQ(steps.size(), 3u);
    EXPECT_EQ(steps[0].scope, StepScope::Baseline);
    EXPECT_EQ(steps[1].scope, StepScope::All);
    EXPECT_EQ(steps[2].name, "plot");
    EXPECT_EQ(steps[2].seq, 11); // appended after the highest seq
    EXPECT_TRUE(steps[2].optional);
}

TEST(SpecLoader, RejectsUnknownKeys) {
    try {
        loadSpecString("parameters:\n  - {name: x, distrib: {kind: constant, value: 1}}\n");
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("unknown key 'distrib'"), std::string::npos) << e.what();
    }
    EXPECT_THROW(loadSpecString("paramters: []\n"), ConfigurationError);
    EXPECT_THROW(loadSpecString("steps:\n  - {name: s, sequence: 1}\n"), ConfigurationError);
}

TEST(SpecLoader, DistributionErrorsNameTheParameter) {
    try {
        loadSpecString("parameters:\n  - {name: growth, distribution: {kind: weibull, shape: 2}}\n");
        FAIL() << "expected DistributionSpecError";
    }
    catch (const DistributionSpecError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Parameter growth: ", 0), 0u) << e.what();
    }
    EXPECT_THROW(loadSpecString("parameters:\n  - {name: g, distribution: {kind: uniform, min: low, max: 1}}\n"),
                 ConfigurationError);
    EXPECT_THROW(loadSpecString("parameters:\n  - {name: g}\n"), ConfigurationError);
    EXPECT_THROW(loadSpecString("parameters:\n  - name: g\n    mode: sometimes\n"
                                "    distribution: {kind: constant, value: 1}\n"),
                 ConfigurationError);
}

TEST(SpecLoader, MalformedDocuments) {
    EXPECT_THROW(loadSpecString(""), ConfigurationError);
    EXPECT_THROW(loadSpecString("parameters: [unclosed\n"), ConfigurationError);
    EXPECT_THROW(loadSpecString("- just\n- a list\n"), ConfigurationError);
    EXPECT_THROW(loadSpecString("experiments: {name: base}\n"), ConfigurationError);
    EXPECT_THROW(loadSpecString("vars:\n  - {name: both, value: x, configVar: y}\n"), ConfigurationError);
    EXPECT_THROW(loadSpecString("results:\n  - {name: r, file: /abs/q.xml}\n"), ConfigurationError);
    EXPECT_THROW(loadSpecString("steps:\n  - {name: s, runFor: nobody}\n"), ConfigurationError);
}

TEST(SpecLoader, FromFile) {
    const std::string path = ::testing::TempDir() + "ensemble_spec.yaml";
    {
        std::ofstream out(path);
        out << kSpec;
    }
    EXPECT_EQ(loadSpecFile(path).parameters.size(), 4u);
    std::remove(path.c_str());
    EXPECT_THROW(loadSpecFile(path), ConfigurationError);
}
