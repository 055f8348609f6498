// SPDX-License-Identifier: MIT
/**
 * @file rational_fit.hpp
 * @brief Iterative least-squares fit of a ratio of polynomials
 *
 * Fits y ≈ P(x)/Q(x) with independently chosen numerator and denominator
 * degrees. The problem is non-linear in the denominator, so each iteration
 * linearizes y·Q(x) ≈ P(x) around the previous denominator Q_old and weights
 * every row by 1/Q_old(x):
 *
 *   (P(x) − y·(Q(x) − 1)) / Q_old(x) ≈ y / Q_old(x)
 *
 * The first pass (Q_old = 1) is the plain linearized fit; later passes
 * remove the bias the linearization puts on samples where |Q| is large.
 *
 * The denominator's constant term is fixed at 1, which removes the scale
 * freedom of P/Q and excludes the trivial all-zero solution.
 */

#pragma once

#include "interpfit/fitting/polynomial_fit.hpp"
#include "interpfit/math/dense_solver.hpp"
#include "interpfit/support/error_types.hpp"
#include <cstddef>
#include <span>

namespace interpfit {

/// |Q(x)| below this makes evaluate_rational() fail
inline constexpr double kRationalPoleTolerance = 1e-10;

/// Configuration for rational fitting
struct RationalFitConfig {
    /// Maximum reweighting iterations
    size_t max_iter = 100;

    /// Stop when the SSE changes by less than this between iterations
    double tolerance = 1e-6;

    /// Denominator samples with |Q_old(x)| below this are clamped to it
    double denominator_floor = 1e-10;

    /// Solver used for each normal-equation system
    DenseSolverConfig solver = {};
};

/// Rational fit result: P/Q with Q[0] == 1
struct RationalFitResult {
    PolynomialCoefficients numerator;
    PolynomialCoefficients denominator;

    /// Iterations performed
    size_t iterations = 0;

    /// Sum of squared residuals of the returned P/Q on the training samples
    double sse = 0.0;

    /// False when max_iter was reached before the SSE settled
    bool converged = false;

    [[nodiscard]] size_t numerator_degree() const noexcept {
        return numerator.empty() ? 0 : numerator.size() - 1;
    }
    [[nodiscard]] size_t denominator_degree() const noexcept {
        return denominator.empty() ? 0 : denominator.size() - 1;
    }
};

/// Fit y ≈ P(x)/Q(x) with deg P = num_degree and deg Q = den_degree
///
/// Running out of iterations is not an error: the last iterate is returned
/// with converged == false.
///
/// Errors:
/// - LengthMismatch, EmptyInput
/// - InsufficientPoints: x.size() < num_degree + den_degree + 1
/// - SingularMatrix: a linearized system is rank-deficient
/// - NearSingularDenominator: an iterate has a pole at a training sample
[[nodiscard]] FitResult<RationalFitResult> fit_rational(
    std::span<const double> x,
    std::span<const double> y,
    size_t num_degree,
    size_t den_degree,
    const RationalFitConfig& config = {});

/// Evaluate P(x)/Q(x)
///
/// Errors: NearSingularDenominator when |Q(x)| < kRationalPoleTolerance
/// (value = x).
[[nodiscard]] FitResult<double> evaluate_rational(std::span<const double> numerator,
                                                  std::span<const double> denominator,
                                                  double x);

[[nodiscard]] inline FitResult<double>
evaluate_rational(const RationalFitResult& fit, double x) {
    return evaluate_rational(fit.numerator, fit.denominator, x);
}

} // namespace interpfit
