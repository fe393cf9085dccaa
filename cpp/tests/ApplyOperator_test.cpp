// ApplyOperator_test.cpp
#include "gtest/gtest.h"
#include "ApplyOperator.h"
#include "CompiledExpression.h"
#include "Error.h"
#include <algorithm>
#include <thread>
#include <vector>

using namespace ensemble;

TEST(ApplyRegistry, BuiltIns) {
    const ApplyRegistry reg;
    EXPECT_DOUBLE_EQ(reg.apply("direct", 5, 2, 0), 2.0);
    EXPECT_DOUBLE_EQ(reg.apply("replace", 5, 2, 0), 2.0);
    EXPECT_DOUBLE_EQ(reg.apply("add", 5, 2, 0), 7.0);
    EXPECT_DOUBLE_EQ(reg.apply("multiply", 5, 2, 0), 10.0);
    EXPECT_DOUBLE_EQ(reg.apply("mult", 5, 2, 0), 10.0);

    EXPECT_DOUBLE_EQ(reg.identity("multiply"), 1.0);
    EXPECT_DOUBLE_EQ(reg.identity("add"), 0.0);

    const auto names = reg.names();
    for (const char* n : {"add", "direct", "mult", "multiply", "replace"})
        EXPECT_NE(std::find(names.begin(), names.end(), n), names.end()) << n;
}

TEST(ApplyRegistry, UnknownOperator) {
    const ApplyRegistry reg;
    EXPECT_FALSE(reg.contains("pow"));
    EXPECT_THROW(reg.resolve("pow"), ConfigurationError);
    EXPECT_THROW(reg.identity("pow"), ConfigurationError);
}

TEST(ApplyRegistry, CustomOperators) {
    ApplyRegistry reg;
    reg.registerOperator("scaleByTrial", [](double base, double value, int64_t trial) {
        return base + value * static_cast<double>(trial);
    }, 100.0);
    EXPECT_TRUE(reg.contains("scaleByTrial"));
    EXPECT_DOUBLE_EQ(reg.apply("scaleByTrial", 1, 2, 3), 7.0);
    EXPECT_DOUBLE_EQ(reg.identity("scaleByTrial"), 100.0);

    EXPECT_THROW(reg.registerOperator("", [](double, double v, int64_t) { return v; }), std::invalid_argument);
    EXPECT_THROW(reg.registerOperator("empty", ApplyFunction()), std::invalid_argument);
}

TEST(ApplyRegistry, ExpressionOperators) {
    ApplyRegistry reg;
    reg.registerExpression("pct", "base * (1 + value / 100)", 1.0);
    EXPECT_NEAR(reg.apply("pct", 200, 5, 0), 210.0, 1e-12);

    reg.registerExpression("ramp", "base + value * trial");
    EXPECT_NEAR(reg.apply("ramp", 1, 0.5, 4), 3.0, 1e-12);

    EXPECT_THROW(reg.registerExpression("broken", "base * (value"), ConfigurationError);
    EXPECT_THROW(reg.registerExpression("unknownVar", "base * growth"), ConfigurationError);
    EXPECT_FALSE(reg.contains("broken"));
}

TEST(CompiledExpression, ConcurrentEvaluation) {
    const CompiledExpression expr("base + value * trial");
    std::vector<std::thread> threads;
    std::vector<int> mismatches(4, 0);
    for (int w = 0; w < 4; ++w) {
        threads.emplace_back([&expr, &mismatches, w] {
            for (int i = 0; i < 2000; ++i) {
                const double expected = w + 0.5 * i;
                if (expr.eval(w, 0.5, i) != expected) ++mismatches[w];
            }
        });
    }
    for (auto& t : threads) t.join();
    for (int w = 0; w < 4; ++w) EXPECT_EQ(mismatches[w], 0) << "thread " << w;
    EXPECT_EQ(expr.expr(), "base + value * trial");
}
