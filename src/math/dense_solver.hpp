// SPDX-License-Identifier: MIT
/**
 * @file dense_solver.hpp
 * @brief Dense linear solver for small least-squares systems
 *
 * Gaussian elimination with partial pivoting over Eigen dense storage, for
 * the normal-equation systems produced by the fitting suite. Systems are
 * sized by the number of fit parameters (typically < 20), so everything is
 * O(n³) in the parameter count and independent of sample count.
 */

#pragma once

#include "interpfit/support/error_types.hpp"
#include <Eigen/Dense>
#include <span>
#include <vector>

namespace interpfit {

/// Configuration for the dense solver
struct DenseSolverConfig {
    /// Pivot magnitude below which the matrix is treated as singular
    double singularity_tol = 1e-10;
};

/// Normal-equation matrix AᵀA (cols × cols)
[[nodiscard]] Eigen::MatrixXd normal_matrix(const Eigen::MatrixXd& A);

/// Normal-equation right-hand side Aᵀb
/// @pre b.size() == A.rows()
[[nodiscard]] Eigen::VectorXd normal_rhs(const Eigen::MatrixXd& A,
                                         std::span<const double> b);

/// Solve A·x = b by Gaussian elimination with partial pivoting
///
/// At each elimination step the row with the largest-magnitude entry in the
/// current column is swapped into pivot position; back substitution follows.
///
/// Errors:
/// - DimensionMismatch: A not square, or b.size() != A.rows()
/// - SingularMatrix: a pivot magnitude (the last one included) is below
///   config.singularity_tol; index = column, value = pivot magnitude
///
/// @param A Square coefficient matrix (copied, not modified)
/// @param b Right-hand side
/// @param config Solver configuration
/// @return Solution vector or error
[[nodiscard]] FitResult<std::vector<double>> solve_dense(
    const Eigen::MatrixXd& A,
    std::span<const double> b,
    const DenseSolverConfig& config = {});

/// Solve the least-squares problem min ‖A·x − b‖² via the normal equations
/// Convenience wrapper for solve_dense(AᵀA, Aᵀb).
[[nodiscard]] FitResult<std::vector<double>> solve_normal_equations(
    const Eigen::MatrixXd& A,
    std::span<const double> b,
    const DenseSolverConfig& config = {});

} // namespace interpfit
