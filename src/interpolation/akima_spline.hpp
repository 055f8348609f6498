// SPDX-License-Identifier: MIT
/**
 * @file akima_spline.hpp
 * @brief Akima (shape-preserving) cubic spline interpolation
 *
 * Piecewise cubic interpolant whose knot derivatives are weighted averages
 * of the adjacent secant slopes. Unlike a natural cubic spline it does not
 * solve a global system, so an abrupt slope change only affects nearby
 * segments and overshoot near sharp transitions is suppressed.
 *
 * Usage:
 *   auto spline = AkimaSpline::create(freq, gain_db);
 *   if (!spline) return std::unexpected(spline.error());
 *   double g = spline->eval(2.4e9);
 */

#pragma once

#include "interpfit/support/error_types.hpp"
#include <cstddef>
#include <span>
#include <vector>

namespace interpfit {

/// Akima spline over n >= 5 knots
///
/// For n knots, stores n-1 cubic segments of the form
///   S[i](x) = y[i] + b[i]·Δx + c[i]·Δx² + d[i]·Δx³,  Δx = x - x[i]
///
/// Immutable after construction. Queries at or beyond either end return the
/// endpoint value (no extrapolation).
class AkimaSpline {
public:
    /// Minimum number of knots accepted by create()
    static constexpr size_t kMinPoints = 5;

    /// Build a spline from knots
    ///
    /// @param x Knot abscissae, ascending (not validated)
    /// @param y Knot values
    /// @return Spline, or LengthMismatch / InsufficientPoints
    [[nodiscard]] static FitResult<AkimaSpline> create(std::span<const double> x,
                                                       std::span<const double> y);

    /// Evaluate at a query point (clamped to the endpoint values)
    [[nodiscard]] double eval(double x) const noexcept;

    /// First derivative; zero outside the knot range, consistent with clamping
    [[nodiscard]] double eval_derivative(double x) const noexcept;

    /// Evaluate at many query points
    ///
    /// @pre out.size() == queries.size()
    void eval_batch(std::span<const double> queries, std::span<double> out) const noexcept;

    [[nodiscard]] size_t size() const noexcept { return x_.size(); }
    [[nodiscard]] std::span<const double> knots() const noexcept { return x_; }
    [[nodiscard]] std::span<const double> values() const noexcept { return y_; }

    /// Per-segment coefficients (length n-1)
    [[nodiscard]] std::span<const double> linear_coeffs() const noexcept { return b_; }
    [[nodiscard]] std::span<const double> quadratic_coeffs() const noexcept { return c_; }
    [[nodiscard]] std::span<const double> cubic_coeffs() const noexcept { return d_; }

private:
    AkimaSpline() = default;

    /// Segment index for an interior query (x[0] < q < x[n-1])
    [[nodiscard]] size_t segment(double q) const noexcept;

    std::vector<double> x_;
    std::vector<double> y_;
    std::vector<double> b_;
    std::vector<double> c_;
    std::vector<double> d_;
};

/// One-shot Akima interpolation: builds a spline and evaluates it once
[[nodiscard]] FitResult<double> akima_interpolate(std::span<const double> x,
                                                  std::span<const double> y,
                                                  double query);

} // namespace interpfit
