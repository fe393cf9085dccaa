#include "Correlation.h"
#include "Error.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <random>

#include <boost/math/distributions/normal.hpp>

using namespace ensemble;

namespace {
    // Ordinal 0-based ranks of one column.
    Eigen::VectorXi columnRanks(const Eigen::VectorXd& col) {
        const auto n = static_cast<int>(col.size());
        std::vector<int> order(n);
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&col](const int a, const int b) { return col[a] < col[b]; });
        Eigen::VectorXi ranks(n);
        for (int r = 0; r < n; ++r) ranks[order[r]] = r;
        return ranks;
    }

    Eigen::MatrixXd pearson(const Eigen::MatrixXd& x) {
        const Eigen::MatrixXd centered = x.rowwise() - x.colwise().mean();
        const Eigen::MatrixXd cov = centered.transpose() * centered / static_cast<double>(x.rows() - 1);
        const Eigen::VectorXd inv = cov.diagonal().cwiseSqrt().cwiseInverse();
        return inv.asDiagonal() * cov * inv.asDiagonal();
    }

    struct DisjointSet {
        std::vector<size_t> parent;

        explicit DisjointSet(const size_t n) : parent(n) { std::iota(parent.begin(), parent.end(), 0); }

        size_t find(size_t i) {
            while (parent[i] != i) i = parent[i] = parent[parent[i]];
            return i;
        }

        void unite(const size_t a, const size_t b) { parent[find(a)] = find(b); }
    };
}

Eigen::MatrixXd ensemble::rankCorrelation(const Eigen::MatrixXd& samples) {
    Eigen::MatrixXd ranks(samples.rows(), samples.cols());
    for (Eigen::Index j = 0; j < samples.cols(); ++j)
        ranks.col(j) = columnRanks(samples.col(j)).cast<double>();
    return pearson(ranks);
}

std::vector<CorrelationGroup> ensemble::buildCorrelationGroups(const std::vector<Parameter>& params) {
    std::map<std::string, size_t> index;
    std::vector<const Parameter*> active;
    for (const auto& p : params) {
        if (!p.active) continue;
        index[p.name] = active.size();
        active.push_back(&p);
    }

    DisjointSet sets(active.size());
    std::map<std::pair<size_t, size_t>, double> pairs;

    for (size_t i = 0; i < active.size(); ++i) {
        const Parameter& p = *active[i];
        for (const auto& c : p.correlations) {
            const auto it = index.find(c.with);
            if (it == index.end())
                throw ConfigurationError("Parameter " + p.name + " is correlated with unknown parameter " + c.with);
            const size_t j = it->second;
            const Parameter& q = *active[j];
            if (i == j)
                throw ConfigurationError("Parameter " + p.name + " cannot be correlated with itself");
            if (p.isLinked() || q.isLinked())
                throw ConfigurationError("Linked parameters cannot be correlated: " + p.name + ", " + q.name);
            if (!p.distribution.isStochastic() || !q.distribution.isStochastic())
                throw ConfigurationError("Only random parameters can be correlated: " + p.name + ", " + q.name);
            if (p.mode != q.mode)
                throw ConfigurationError("Correlated parameters " + p.name + " and " + q.name +
                                         " must share a draw mode (shared or independent)");
            if (!(c.coefficient >= -1.0 && c.coefficient <= 1.0))
                throw ConfigurationError("Correlation " + p.name + "/" + q.name + " must lie in [-1, 1]");

            const auto key = std::make_pair(std::min(i, j), std::max(i, j));
            const auto prev = pairs.find(key);
            if (prev != pairs.end() && prev->second != c.coefficient)
                throw ConfigurationError("Contradicting correlations given for " + p.name + " and " + q.name);
            pairs[key] = c.coefficient;
            sets.unite(i, j);
        }
    }

    // group members by root, keeping declaration order
    std::map<size_t, std::vector<size_t>> byRoot;
    for (const auto& kv : pairs) {
        byRoot[sets.find(kv.first.first)];
    }
    for (size_t i = 0; i < active.size(); ++i) {
        const auto it = byRoot.find(sets.find(i));
        if (it != byRoot.end()) it->second.push_back(i);
    }

    std::vector<CorrelationGroup> groups;
    for (const auto& kv : byRoot) {
        const auto& members = kv.second;
        CorrelationGroup g;
        g.mode = active[members.front()]->mode;
        g.target = Eigen::MatrixXd::Identity(members.size(), members.size());
        std::map<size_t, Eigen::Index> pos;
        for (size_t m = 0; m < members.size(); ++m) {
            g.members.push_back(active[members[m]]->name);
            pos[members[m]] = static_cast<Eigen::Index>(m);
        }
        for (const auto& pr : pairs) {
            const auto a = pos.find(pr.first.first);
            if (a == pos.end()) continue;
            const auto b = pos.at(pr.first.second);
            g.target(a->second, b) = pr.second;
            g.target(b, a->second) = pr.second;
        }
        if (g.target.llt().info() != Eigen::Success) {
            std::string names;
            for (const auto& n : g.members) names += (names.empty() ? "" : ", ") + n;
            throw ConfigurationError("Correlation matrix for {" + names + "} is not positive definite");
        }
        groups.push_back(std::move(g));
    }
    return groups;
}

//------------------------------------------------------------------------------
// imanConoverRanks(): shuffled van der Waerden scores, decorrelated then
// re-correlated through Cholesky factors of the sample and target matrices
//------------------------------------------------------------------------------
Eigen::MatrixXi ensemble::imanConoverRanks(const Eigen::MatrixXd& target, const int n, RngEngine& rng) {
    const auto k = static_cast<int>(target.rows());
    if (target.cols() != k) throw std::invalid_argument("imanConoverRanks: target must be square");
    if (n <= k)
        throw ConfigurationError("Rank correlation of " + std::to_string(k) + " parameters needs more than " +
                                 std::to_string(k) + " trials, got " + std::to_string(n));

    const boost::math::normal_distribution<> stdNormal;
    std::vector<double> scores(n);
    for (int i = 0; i < n; ++i)
        scores[i] = boost::math::quantile(stdNormal, (i + 1.0) / (n + 1.0));

    Eigen::MatrixXd s(n, k);
    std::vector<int> perm(n);
    for (int j = 0; j < k; ++j) {
        std::iota(perm.begin(), perm.end(), 0);
        std::shuffle(perm.begin(), perm.end(), std::mt19937(rng.nextUInt32()));
        for (int i = 0; i < n; ++i) s(i, j) = scores[perm[i]];
    }

    const Eigen::LLT<Eigen::MatrixXd> targetChol(target);
    if (targetChol.info() != Eigen::Success)
        throw ConfigurationError("Target correlation matrix is not positive definite");
    const Eigen::LLT<Eigen::MatrixXd> sampleChol(rankCorrelation(s));
    if (sampleChol.info() != Eigen::Success)
        throw ConfigurationError("Sample rank correlation is singular; increase the trial count");

    const Eigen::MatrixXd p = targetChol.matrixL();
    const Eigen::MatrixXd q = sampleChol.matrixL();

    // T = S * inv(Q)^T * P^T
    const Eigen::MatrixXd decorrelated = q.triangularView<Eigen::Lower>().solve(s.transpose());
    const Eigen::MatrixXd t = (p * decorrelated).transpose();

    Eigen::MatrixXi ranks(n, k);
    for (int j = 0; j < k; ++j) ranks.col(j) = columnRanks(t.col(j));
    return ranks;
}
