#pragma once
/**
 * @file Correlation.h
 * @brief Rank correlation between parameters (Iman-Conover).
 */
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "Parameter.h"
#include "RngEngine.h"

namespace ensemble {
    /**
     * @brief Parameters connected by correlation pairs, drawn jointly.
     */
    struct CorrelationGroup {
        std::vector<std::string> members; /**< parameter names in declaration order */
        Eigen::MatrixXd target; /**< target rank correlation, unit diagonal */
        DrawMode mode = DrawMode::Shared;
    };

    /**
     * @brief Collect the `With` pairs of active parameters into connected groups.
     *
     * Pairs missing from a group's matrix are uncorrelated (0).
     * @throws ConfigurationError for an unknown or inactive partner, a self-correlation,
     *         a linked or non-stochastic member, mixed draw modes, coefficients outside
     *         [-1, 1], contradicting coefficients or a matrix that is not positive definite
     */
    std::vector<CorrelationGroup> buildCorrelationGroups(const std::vector<Parameter>& params);

    /**
     * @brief Iman-Conover ranks imposing `target` on `n` trials.
     * @param target  k×k positive definite correlation matrix.
     * @param n       Number of trials, must exceed k.
     * @param rng     Stream for the per-column score shuffles.
     * @return        n×k matrix; entry (t, j) is the 0-based rank of trial t in column j.
     * @throws ConfigurationError if a Cholesky factorization fails
     */
    Eigen::MatrixXi imanConoverRanks(const Eigen::MatrixXd& target, int n, RngEngine& rng);

    /**
     * @brief Spearman rank correlation between the columns of `samples`.
     */
    Eigen::MatrixXd rankCorrelation(const Eigen::MatrixXd& samples);
}
