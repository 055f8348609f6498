// SPDX-License-Identifier: MIT
/**
 * @file piecewise.hpp
 * @brief Piecewise interpolation over tabulated data
 *
 * Linear, log-linear, nearest-neighbour and bilinear interpolation.
 *
 * Boundary policy shared by every routine: no extrapolation. Queries at or
 * beyond either end of the table return the endpoint value.
 *
 * Abscissae must be non-decreasing; this is the caller's responsibility and
 * is not validated.
 */

#pragma once

#include "interpfit/support/error_types.hpp"
#include <span>
#include <vector>

namespace interpfit {

/// Two-point linear form y0 + (y1 - y0)·(x - x0)/(x1 - x0)
[[nodiscard]] constexpr double
linear(double x0, double y0, double x1, double y1, double x) noexcept {
    return y0 + (y1 - y0) * (x - x0) / (x1 - x0);
}

/// Linear interpolation with endpoint clamping
///
/// A single sample returns its y unconditionally.
///
/// Errors: LengthMismatch (x.size() != y.size()), EmptyInput.
[[nodiscard]] FitResult<double> linear(std::span<const double> x,
                                       std::span<const double> y,
                                       double query);

/// Apply linear() independently to every query point
///
/// Pure map: result[k] == linear(x, y, queries[k]).
[[nodiscard]] FitResult<std::vector<double>> linear_batch(std::span<const double> x,
                                                          std::span<const double> y,
                                                          std::span<const double> queries);

/// Linear interpolation in log10 of the abscissa (dB vs log-frequency tables)
///
/// Errors: InvalidDomain when target <= 0 (value = target) or when a table
/// abscissa is <= 0 (index = sample); otherwise as linear().
[[nodiscard]] FitResult<double> log_linear(std::span<const double> freq,
                                           std::span<const double> value_db,
                                           double target);

/// Nearest-neighbour interpolation; ties favour the left neighbour
///
/// Errors: as linear().
[[nodiscard]] FitResult<double> nearest(std::span<const double> x,
                                        std::span<const double> y,
                                        double query);

/// Bilinear interpolation on a rectangular grid
///
/// table[i][j] is the value at (x_grid[i], y_grid[j]). A query outside the
/// grid on one axis degrades to 1D linear interpolation along the other axis
/// on the nearest edge row/column.
///
/// Errors: EmptyInput (empty grid), DimensionMismatch (table.size() !=
/// x_grid.size() or a row size != y_grid.size(); index = row).
[[nodiscard]] FitResult<double> bilinear(std::span<const double> x_grid,
                                         std::span<const double> y_grid,
                                         std::span<const std::vector<double>> table,
                                         double qx,
                                         double qy);

} // namespace interpfit
