// Distribution_test.cpp
#include "gtest/gtest.h"
#include "Distribution.h"
#include "Error.h"
#include "RngEngine.h"
#include "Sampler.h"
#include <algorithm>
#include <cmath>
#include <vector>
#include <boost/math/distributions/lognormal.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/triangular.hpp>

using namespace ensemble;

static double ks_critical(size_t n) {
    // approximate Kolmogorov-Smirnov critical value for alpha=0.01
    return 1.63 / std::sqrt(n);
}

static double drawAt(const Distribution& d, const int64_t trial, const double u = 0.5) {
    SampleContext ctx;
    ctx.trialNum = trial;
    ctx.percentile = u;
    return d.sample(ctx);
}

TEST(Distribution, SignatureSelection) {
    EXPECT_EQ(Distribution::fromArgs("uniform", {{"min", 1}, {"max", 2}}).kind(), DistributionKind::Uniform);
    EXPECT_EQ(Distribution::fromArgs("Lognormal", {{"low95", 0.5}, {"high95", 2}}).kind(),
              DistributionKind::Lognormal);
    EXPECT_EQ(Distribution::fromArgs("TRIANGLE", {{"Factor", 0.2}}).kind(), DistributionKind::Triangle);
    EXPECT_EQ(Distribution::fromArgs("binary", {}).kind(), DistributionKind::Binary);
    EXPECT_EQ(Distribution::fromArgs("sequence", {}, {1, 2}).kind(), DistributionKind::Sequence);
    EXPECT_EQ(Distribution::fromArgs("linked", {}, {}, "other").linkedTo(), "other");
}

TEST(Distribution, RejectsUnknownSignatures) {
    EXPECT_THROW(Distribution::fromArgs("uniform", {{"min", 1}}), DistributionSpecError);
    EXPECT_THROW(Distribution::fromArgs("uniform", {{"min", 1}, {"max", 2}, {"mode", 1.5}}), DistributionSpecError);
    EXPECT_THROW(Distribution::fromArgs("weibull", {{"k", 1}}), DistributionSpecError);
    EXPECT_THROW(Distribution::fromArgs("normal", {{"mean", 0}, {"stdev", 0}}), DistributionSpecError);
    EXPECT_THROW(Distribution::fromArgs("normal", {{"mean", 0}, {"stdev", 1}}, {3.0}), DistributionSpecError);
    EXPECT_THROW(Distribution::fromArgs("sequence", {}, {}), DistributionSpecError);
    EXPECT_THROW(Distribution::fromArgs("integers", {{"min", 0.5}, {"max", 3}}), DistributionSpecError);
    EXPECT_THROW(Distribution::fromArgs("linked", {}, {}, ""), DistributionSpecError);
}

TEST(Distribution, Shorthands) {
    const auto uf = Distribution::fromArgs("uniform", {{"factor", 2}});
    EXPECT_NEAR(uf.ppf(0.0), 0.5, 1e-9);
    EXPECT_NEAR(uf.ppf(1.0), 2.0, 1e-9);

    const auto ur = Distribution::fromArgs("uniform", {{"range", 0.25}});
    EXPECT_NEAR(ur.ppf(0.5), 1.0, 1e-12);
    EXPECT_NEAR(ur.ppf(0.0), 0.75, 1e-9);

    const auto tf = Distribution::fromArgs("triangle", {{"factor", 0.3}});
    EXPECT_EQ(tf.describe(), "Triangle(min=0.7, mode=1, max=1.3)");

    const auto tl = Distribution::fromArgs("triangle", {{"logfactor", 4}});
    EXPECT_EQ(tl.describe(), "Triangle(min=0.25, mode=1, max=4)");

    const auto tr = Distribution::fromArgs("triangle", {{"range", 2}});
    EXPECT_NEAR(tr.ppf(0.5), 0.0, 1e-12);

    // 95% of the mass between 1/f and f
    const auto ln = Distribution::fromArgs("lognormal", {{"logfactor", 3}});
    EXPECT_NEAR(ln.ppf(0.025), 1.0 / 3.0, 1e-3);
    EXPECT_NEAR(ln.ppf(0.975), 3.0, 1e-3);
    EXPECT_NEAR(ln.ppf(0.5), 1.0, 1e-9);
}

TEST(Distribution, LognormalFromMoments) {
    const auto d = Distribution::fromArgs("lognormal", {{"mean", 10}, {"std", 2}});
    const double sigma2 = std::log(1.0 + 0.04);
    const boost::math::lognormal_distribution<> ref(std::log(10.0) - sigma2 / 2, std::sqrt(sigma2));
    for (double u : {0.05, 0.5, 0.95})
        EXPECT_NEAR(d.ppf(u), boost::math::quantile(ref, u), 1e-9) << "u=" << u;
}

TEST(Distribution, PpfMatchesReferenceQuantiles) {
    const auto n = Distribution::normal(3, 2);
    const auto t = Distribution::triangle(0, 1, 4);
    for (double u : {0.01, 0.2, 0.5, 0.8, 0.99}) {
        EXPECT_NEAR(n.ppf(u), boost::math::quantile(boost::math::normal_distribution<>(3, 2), u), 1e-9);
        EXPECT_NEAR(t.ppf(u), boost::math::quantile(boost::math::triangular_distribution<>(0, 1, 4), u), 1e-9);
    }
    // unbounded kinds stay finite at the edges
    EXPECT_TRUE(std::isfinite(n.ppf(0.0)));
    EXPECT_TRUE(std::isfinite(n.ppf(1.0)));
}

TEST(Distribution, IntegersAreInclusive) {
    const auto d = Distribution::fromArgs("integers", {{"min", 2}, {"max", 5}});
    EXPECT_DOUBLE_EQ(d.ppf(0.0), 2.0);
    EXPECT_DOUBLE_EQ(d.ppf(0.2499), 2.0);
    EXPECT_DOUBLE_EQ(d.ppf(0.25), 3.0);
    EXPECT_DOUBLE_EQ(d.ppf(0.9999), 5.0);
}

TEST(Distribution, Binary) {
    const auto d = Distribution::binary();
    EXPECT_DOUBLE_EQ(d.ppf(0.4999), 0.0);
    EXPECT_DOUBLE_EQ(d.ppf(0.5), 1.0);
}

TEST(Distribution, SequenceCyclesThroughValues) {
    const auto d = Distribution::fromArgs("sequence", {}, {4, 6, 43.2});
    EXPECT_FALSE(d.isStochastic());
    const std::vector<double> expected{4, 6, 43.2, 4, 6, 43.2, 4};
    for (int t = 0; t < 7; ++t)
        EXPECT_DOUBLE_EQ(drawAt(d, t), expected[t]) << "trial " << t;
}

TEST(Distribution, GridSteps) {
    const auto d = Distribution::fromArgs("grid", {{"min", 0}, {"max", 10}, {"count", 3}});
    EXPECT_DOUBLE_EQ(drawAt(d, 0), 0.0);
    EXPECT_DOUBLE_EQ(drawAt(d, 1), 5.0);
    EXPECT_DOUBLE_EQ(drawAt(d, 2), 10.0);
    EXPECT_DOUBLE_EQ(drawAt(d, 3), 0.0);
}

TEST(Distribution, LinkedNeedsAValueSource) {
    const auto d = Distribution::linked("x");
    EXPECT_THROW(drawAt(d, 0), std::logic_error);

    SampleContext ctx;
    ctx.linkedValue = [](const std::string& name) { return name == "x" ? 1.5 : 0.0; };
    EXPECT_DOUBLE_EQ(d.sample(ctx), 1.5);
}

TEST(Sampler, LatinHypercubeHasOneDrawPerStratum) {
    const int n = 500;
    LatinHypercubeSampler lhs(RngEngine(11), true);
    const auto u = lhs.percentiles(n);
    ASSERT_EQ(u.size(), size_t(n));

    std::vector<int> strata(n, 0);
    for (double x : u) {
        ASSERT_GE(x, 0.0);
        ASSERT_LT(x, 1.0);
        ++strata[static_cast<int>(x * n)];
    }
    EXPECT_TRUE(std::all_of(strata.begin(), strata.end(), [](int c) { return c == 1; }));

    const auto sorted = LatinHypercubeSampler(RngEngine(11), true).sortedPercentiles(n);
    EXPECT_TRUE(std::is_sorted(sorted.begin(), sorted.end()));
}

TEST(Sampler, UnknownMethod) {
    EXPECT_THROW(makeSampler("sobol", RngEngine(1)), ConfigurationError);
    EXPECT_NE(makeSampler("random", RngEngine(1)), nullptr);
}

TEST(Sampler, NormalThroughLatinHypercubeKS) {
    const size_t N = 100'000;
    LatinHypercubeSampler lhs(RngEngine(420), true);
    const auto d = Distribution::normal(-1, 2.5);
    std::vector<double> values;
    values.reserve(N);
    for (double u : lhs.percentiles(static_cast<int>(N))) values.push_back(d.ppf(u));

    std::sort(values.begin(), values.end());
    const boost::math::normal_distribution<> ref(-1, 2.5);
    double dmax = 0;
    for (size_t i = 0; i < N; ++i) {
        double F_emp = double(i + 1) / N;
        dmax = std::max(dmax, std::abs(F_emp - boost::math::cdf(ref, values[i])));
    }
    EXPECT_LT(dmax, ks_critical(N));
}
