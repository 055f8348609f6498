// SPDX-License-Identifier: MIT
/**
 * @file dense_solver_test.cc
 * @brief Tests for the dense Gaussian-elimination solver
 *
 * Validates:
 * - Known small systems, including ones that need row exchanges
 * - Singular detection at every pivot, the last one included
 * - Dimension checks
 * - AᵀA and Aᵀb products
 * - Agreement with Eigen's PartialPivLU on random systems
 */

#include "interpfit/math/dense_solver.hpp"
#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <cmath>
#include <random>
#include <vector>

using namespace interpfit;

namespace {

constexpr double kTolerance = 1e-10;

Eigen::MatrixXd make_matrix(const std::vector<std::vector<double>>& rows) {
    const auto n_rows = static_cast<Eigen::Index>(rows.size());
    const auto n_cols = static_cast<Eigen::Index>(rows.empty() ? 0 : rows[0].size());
    Eigen::MatrixXd A(n_rows, n_cols);
    for (Eigen::Index i = 0; i < n_rows; ++i) {
        for (Eigen::Index j = 0; j < n_cols; ++j) {
            A(i, j) = rows[static_cast<size_t>(i)][static_cast<size_t>(j)];
        }
    }
    return A;
}

}  // namespace

TEST(DenseSolverConfigTest, DefaultTolerance) {
    DenseSolverConfig config;
    EXPECT_DOUBLE_EQ(config.singularity_tol, 1e-10);
}

// ============================================================================
// Known systems
// ============================================================================

TEST(DenseSolverTest, ThreeByThree) {
    auto A = make_matrix({{2.0, 1.0, -1.0},
                          {-3.0, -1.0, 2.0},
                          {-2.0, 1.0, 2.0}});
    std::vector<double> b = {8.0, -11.0, -3.0};

    auto x = solve_dense(A, b);

    ASSERT_TRUE(x.has_value());
    ASSERT_EQ(x->size(), 3u);
    EXPECT_NEAR((*x)[0], 2.0, kTolerance);
    EXPECT_NEAR((*x)[1], 3.0, kTolerance);
    EXPECT_NEAR((*x)[2], -1.0, kTolerance);
}

TEST(DenseSolverTest, ZeroLeadingPivotNeedsRowExchange) {
    auto A = make_matrix({{0.0, 1.0},
                          {1.0, 1.0}});
    std::vector<double> b = {1.0, 2.0};

    auto x = solve_dense(A, b);

    ASSERT_TRUE(x.has_value());
    EXPECT_NEAR((*x)[0], 1.0, kTolerance);
    EXPECT_NEAR((*x)[1], 1.0, kTolerance);
}

TEST(DenseSolverTest, PivotsOnLargestMagnitude) {
    // The 1e-9 leading entry passes the tolerance; eliminating on it would
    // cancel most digits of x[0]
    auto A = make_matrix({{1e-9, 1.0},
                          {1.0, 1.0}});
    std::vector<double> b = {1.0, 2.0};

    auto x = solve_dense(A, b);

    ASSERT_TRUE(x.has_value());
    EXPECT_NEAR((*x)[0], 1.0, 1e-8);
    EXPECT_NEAR((*x)[1], 1.0, 1e-8);
}

TEST(DenseSolverTest, InputNotModified) {
    auto A = make_matrix({{4.0, 1.0}, {1.0, 3.0}});
    std::vector<double> b = {1.0, 2.0};

    auto x = solve_dense(A, b);

    ASSERT_TRUE(x.has_value());
    EXPECT_DOUBLE_EQ(A(0, 0), 4.0);
    EXPECT_DOUBLE_EQ(A(1, 0), 1.0);
    EXPECT_DOUBLE_EQ(b[0], 1.0);
}

TEST(DenseSolverTest, EmptySystem) {
    Eigen::MatrixXd A(0, 0);
    std::vector<double> b;

    auto x = solve_dense(A, b);

    ASSERT_TRUE(x.has_value());
    EXPECT_TRUE(x->empty());
}

// ============================================================================
// Singular and dimension errors
// ============================================================================

TEST(DenseSolverTest, SingularLastPivotDetected) {
    // Second row is twice the first: the final pivot eliminates to zero
    auto A = make_matrix({{1.0, 2.0},
                          {2.0, 4.0}});
    std::vector<double> b = {3.0, 6.0};

    auto x = solve_dense(A, b);

    ASSERT_FALSE(x.has_value());
    EXPECT_EQ(x.error().code, FitErrorCode::SingularMatrix);
    EXPECT_EQ(x.error().index, 1u);
    EXPECT_LT(x.error().value, 1e-10);
}

TEST(DenseSolverTest, SingularFirstPivotDetected) {
    auto A = make_matrix({{0.0, 1.0},
                          {0.0, 2.0}});
    std::vector<double> b = {1.0, 2.0};

    auto x = solve_dense(A, b);

    ASSERT_FALSE(x.has_value());
    EXPECT_EQ(x.error().code, FitErrorCode::SingularMatrix);
    EXPECT_EQ(x.error().index, 0u);
}

TEST(DenseSolverTest, ToleranceIsConfigurable) {
    auto A = make_matrix({{1e-12, 0.0},
                          {0.0, 1.0}});
    std::vector<double> b = {1e-12, 2.0};

    auto strict = solve_dense(A, b);
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().code, FitErrorCode::SingularMatrix);

    auto relaxed = solve_dense(A, b, DenseSolverConfig{.singularity_tol = 1e-14});
    ASSERT_TRUE(relaxed.has_value());
    EXPECT_NEAR((*relaxed)[0], 1.0, kTolerance);
    EXPECT_NEAR((*relaxed)[1], 2.0, kTolerance);
}

TEST(DenseSolverTest, NonSquareRejected) {
    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(2, 3);
    std::vector<double> b = {1.0, 2.0};

    auto x = solve_dense(A, b);

    ASSERT_FALSE(x.has_value());
    EXPECT_EQ(x.error().code, FitErrorCode::DimensionMismatch);
}

TEST(DenseSolverTest, RhsSizeMismatchRejected) {
    Eigen::MatrixXd A = Eigen::MatrixXd::Identity(2, 2);
    std::vector<double> b = {1.0, 2.0, 3.0};

    auto x = solve_dense(A, b);

    ASSERT_FALSE(x.has_value());
    EXPECT_EQ(x.error().code, FitErrorCode::DimensionMismatch);
}

// ============================================================================
// Normal equations
// ============================================================================

TEST(NormalEquationsTest, NormalMatrixIsSymmetric) {
    auto A = make_matrix({{1.0, 0.0},
                          {1.0, 1.0},
                          {1.0, 2.0}});

    Eigen::MatrixXd AtA = normal_matrix(A);

    ASSERT_EQ(AtA.rows(), 2);
    ASSERT_EQ(AtA.cols(), 2);
    EXPECT_DOUBLE_EQ(AtA(0, 0), 3.0);
    EXPECT_DOUBLE_EQ(AtA(0, 1), 3.0);
    EXPECT_DOUBLE_EQ(AtA(1, 0), 3.0);
    EXPECT_DOUBLE_EQ(AtA(1, 1), 5.0);

    std::vector<double> b = {1.0, 3.0, 5.0};
    Eigen::VectorXd Atb = normal_rhs(A, b);
    ASSERT_EQ(Atb.size(), 2);
    EXPECT_DOUBLE_EQ(Atb(0), 9.0);
    EXPECT_DOUBLE_EQ(Atb(1), 13.0);
}

TEST(NormalEquationsTest, OverdeterminedExactLine) {
    auto A = make_matrix({{1.0, 0.0},
                          {1.0, 1.0},
                          {1.0, 2.0}});
    std::vector<double> b = {1.0, 3.0, 5.0};

    auto x = solve_normal_equations(A, b);

    ASSERT_TRUE(x.has_value());
    EXPECT_NEAR((*x)[0], 1.0, kTolerance);
    EXPECT_NEAR((*x)[1], 2.0, kTolerance);
}

TEST(NormalEquationsTest, RhsLengthMustMatchRows) {
    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(3, 2);
    std::vector<double> b = {1.0, 2.0};

    auto x = solve_normal_equations(A, b);

    ASSERT_FALSE(x.has_value());
    EXPECT_EQ(x.error().code, FitErrorCode::DimensionMismatch);
}

// ============================================================================
// Cross-check against Eigen
// ============================================================================

TEST(DenseSolverEigenTest, MatchesPartialPivLU) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);

    for (Eigen::Index n : {3, 6, 12}) {
        Eigen::MatrixXd A(n, n);
        std::vector<double> b(static_cast<size_t>(n));

        for (Eigen::Index i = 0; i < n; ++i) {
            for (Eigen::Index j = 0; j < n; ++j) {
                double v = dist(rng);
                if (i == j) v += static_cast<double>(n);
                A(i, j) = v;
            }
            b[static_cast<size_t>(i)] = dist(rng);
        }

        auto x = solve_dense(A, b);
        ASSERT_TRUE(x.has_value()) << "n=" << n;

        Eigen::Map<const Eigen::VectorXd> b_eigen(b.data(), n);
        Eigen::VectorXd expected = A.partialPivLu().solve(b_eigen);
        for (Eigen::Index i = 0; i < n; ++i) {
            EXPECT_NEAR((*x)[static_cast<size_t>(i)], expected(i), 1e-10) << "n=" << n << " i=" << i;
        }
    }
}

TEST(DenseSolverEigenTest, NormalEquationsMatchLeastSquaresQR) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);

    const Eigen::Index rows = 20;
    const Eigen::Index cols = 4;
    Eigen::MatrixXd A(rows, cols);
    std::vector<double> b(static_cast<size_t>(rows));
    for (Eigen::Index i = 0; i < rows; ++i) {
        for (Eigen::Index j = 0; j < cols; ++j) {
            A(i, j) = dist(rng);
        }
        b[static_cast<size_t>(i)] = dist(rng);
    }

    auto x = solve_normal_equations(A, b);
    ASSERT_TRUE(x.has_value());

    Eigen::Map<const Eigen::VectorXd> b_eigen(b.data(), rows);
    Eigen::VectorXd expected = A.colPivHouseholderQr().solve(b_eigen);
    ASSERT_EQ(x->size(), 4u);
    for (Eigen::Index j = 0; j < cols; ++j) {
        EXPECT_NEAR((*x)[static_cast<size_t>(j)], expected(j), 1e-9) << "j=" << j;
    }
}
