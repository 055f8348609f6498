// SPDX-License-Identifier: MIT
/**
 * @file polynomial_fit.hpp
 * @brief Least-squares polynomial regression
 */

#pragma once

#include "interpfit/math/dense_solver.hpp"
#include "interpfit/support/error_types.hpp"
#include <cstddef>
#include <span>
#include <vector>

namespace interpfit {

/// Polynomial coefficients, low to high degree: coeffs[k] multiplies x^k
using PolynomialCoefficients = std::vector<double>;

/// Fit a polynomial of the given degree by least squares
///
/// Builds the Vandermonde design matrix A[i][j] = x[i]^j, j in [0, degree],
/// and solves the normal equations AᵀA·c = Aᵀy. Sample order is irrelevant.
///
/// Errors:
/// - LengthMismatch: x.size() != y.size()
/// - EmptyInput: no samples
/// - InsufficientPoints: x.size() <= degree
/// - SingularMatrix: design is rank-deficient (e.g. repeated abscissae)
[[nodiscard]] FitResult<PolynomialCoefficients> fit_polynomial(
    std::span<const double> x,
    std::span<const double> y,
    size_t degree,
    const DenseSolverConfig& solver_config = {});

/// Evaluate a polynomial at x; empty coefficients evaluate to 0
[[nodiscard]] inline double
evaluate_polynomial(std::span<const double> coeffs, double x) noexcept {
    double result = 0.0;
    for (size_t k = coeffs.size(); k-- > 0;) {
        result = result * x + coeffs[k];
    }
    return result;
}

/// Vandermonde design matrix, rows = samples, cols = degree + 1
[[nodiscard]] Eigen::MatrixXd vandermonde(std::span<const double> x, size_t degree);

} // namespace interpfit
