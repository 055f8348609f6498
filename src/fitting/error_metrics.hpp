// SPDX-License-Identifier: MIT
/**
 * @file error_metrics.hpp
 * @brief Goodness-of-fit statistics for fitted models
 *
 * Metrics are computed once against a reference sample set and a prediction
 * function evaluated pointwise. The predictor may be any callable returning
 * double, or FitResult<double> for models whose evaluation can fail (rational
 * fits); a failed prediction is propagated.
 */

#pragma once

#include "interpfit/fitting/polynomial_fit.hpp"
#include "interpfit/fitting/rational_fit.hpp"
#include "interpfit/fitting/vector_fit.hpp"
#include "interpfit/support/error_types.hpp"
#include <concepts>
#include <cstddef>
#include <ostream>
#include <span>
#include <vector>

namespace interpfit {

/// Total sum of squares below this is treated as constant reference data (R² = 1)
inline constexpr double kDegenerateVarianceTolerance = 1e-10;

/// Reference values with |y| at or below this are skipped by the relative error
inline constexpr double kRelativeErrorFloor = 1e-10;

/// Goodness-of-fit statistics
struct FitErrorMetrics {
    double r_squared = 0.0;            ///< 1 − SSE/SSTotal (1 for constant data)
    double rmse = 0.0;                 ///< √(SSE/n)
    double mae = 0.0;                  ///< Σ|e|/n
    double max_error = 0.0;            ///< max|e|
    double mean_relative_error = 0.0;  ///< mean |e|/|y| in percent (0 for vector fits)
    double sse = 0.0;                  ///< Σe²
};

/// Prints "R² = ..., RMSE = ..., MAE = ..., MaxError = ..." with six decimals
std::ostream& operator<<(std::ostream& os, const FitErrorMetrics& m);

/// Predictor returning a plain value
template<typename F>
concept ScalarPredictor = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Predictor whose evaluation can fail
template<typename F>
concept FalliblePredictor = requires(F f, double x) {
    { f(x) } -> std::same_as<FitResult<double>>;
};

namespace detail {

/// Metrics from reference values and matching predictions
///
/// @pre y.size() == predicted.size() && !y.empty()
[[nodiscard]] FitErrorMetrics metrics_from_predictions(std::span<const double> y,
                                                       std::span<const double> predicted);

[[nodiscard]] FitResult<void> validate_reference(std::span<const double> x,
                                                 std::span<const double> y);

} // namespace detail

/// Compute goodness-of-fit statistics of `predict` against (x, y)
///
/// Errors: LengthMismatch, EmptyInput, or the predictor's own error.
template<typename F>
    requires ScalarPredictor<F> || FalliblePredictor<F>
[[nodiscard]] FitResult<FitErrorMetrics>
compute_error_metrics(std::span<const double> x,
                      std::span<const double> y,
                      F&& predict)
{
    if (auto ok = detail::validate_reference(x, y); !ok) {
        return std::unexpected(ok.error());
    }

    std::vector<double> predicted(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        if constexpr (FalliblePredictor<F>) {
            auto value = predict(x[i]);
            if (!value) {
                return std::unexpected(value.error());
            }
            predicted[i] = *value;
        } else {
            predicted[i] = static_cast<double>(predict(x[i]));
        }
    }

    return detail::metrics_from_predictions(y, predicted);
}

/// Metrics of a fitted polynomial
[[nodiscard]] FitResult<FitErrorMetrics>
polynomial_error_metrics(std::span<const double> x,
                         std::span<const double> y,
                         std::span<const double> coeffs);

/// Metrics of a fitted rational function
[[nodiscard]] FitResult<FitErrorMetrics>
rational_error_metrics(std::span<const double> x,
                       std::span<const double> y,
                       const RationalFitResult& fit);

/// Metrics of a vector fit, aggregated over every component of every sample
///
/// RMSE and MAE divide by n·dimension; SSTotal uses per-component means;
/// mean_relative_error is always 0.
///
/// Errors: EmptyInput, LengthMismatch (x vs vectors), DimensionMismatch
/// (a sample's dimension differs from fit.dimension(); index = sample).
[[nodiscard]] FitResult<FitErrorMetrics>
vector_error_metrics(std::span<const double> x,
                     std::span<const std::vector<double>> vectors,
                     const VectorFitResult& fit);

} // namespace interpfit
