// SPDX-License-Identifier: MIT
#include "interpfit/interpolation/akima_spline.hpp"
#include "interpfit/math/search_index.hpp"
#include "interpfit/support/interpfit_trace.h"
#include "interpfit/support/parallel.hpp"
#include <cassert>
#include <cmath>
#include <optional>

namespace interpfit {

namespace {

/// Weights closer than this are treated as equal when blending slopes
constexpr double kWeightTieEpsilon = 1e-10;

/// Weights above this count as "effectively unbounded" in a tie
constexpr double kLargeWeight = 1e5;

/// Knot derivative from the two adjacent secant slopes.
///
/// An absent weight marks a neighbour whose ratio is undefined (boundary or
/// degenerate); it behaves as an unbounded weight on its own slope.
double blend_slopes(std::optional<double> w1, std::optional<double> w2,
                    double left_slope, double right_slope) noexcept {
    if (!w1 && !w2) {
        return left_slope;
    }
    if (!w1) {
        return left_slope;
    }
    if (!w2) {
        return right_slope;
    }
    if (std::abs(*w2 - *w1) < kWeightTieEpsilon) {
        return (*w1 > kLargeWeight) ? left_slope : right_slope;
    }
    return (*w1 * left_slope + *w2 * right_slope) / (*w1 + *w2);
}

} // namespace

FitResult<AkimaSpline> AkimaSpline::create(std::span<const double> x,
                                           std::span<const double> y)
{
    if (x.size() != y.size()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_AKIMA_SPLINE,
            static_cast<int>(FitErrorCode::LengthMismatch), x.size(), y.size());
        return std::unexpected(FitError(FitErrorCode::LengthMismatch, x.size(), y.size()));
    }
    if (x.size() < kMinPoints) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_AKIMA_SPLINE,
            static_cast<int>(FitErrorCode::InsufficientPoints), x.size(), kMinPoints);
        return std::unexpected(FitError(FitErrorCode::InsufficientPoints, x.size(), kMinPoints));
    }

    const size_t n = x.size();

    AkimaSpline spline;
    spline.x_.assign(x.begin(), x.end());
    spline.y_.assign(y.begin(), y.end());

    // Secant slope of each segment
    std::vector<double> slope(n - 1);
    for (size_t i = 0; i < n - 1; ++i) {
        slope[i] = (y[i + 1] - y[i]) / (x[i + 1] - x[i]);
    }

    // Weight cells [0, n+4); cell i+2 belongs to segment i. Boundary cells
    // and degenerate ratios stay empty.
    std::vector<std::optional<double>> weight(n + 4);
    for (size_t i = 0; i < n - 1; ++i) {
        const double s1 = std::abs(slope[i]);
        const double s0 = (i > 0) ? std::abs(slope[i - 1]) : s1;
        const double s2 = (i + 2 < n) ? std::abs(slope[i + 1]) : s1;
        const double s3 = (i + 3 < n) ? std::abs(slope[i + 2]) : s2;

        if (s1 == s0 || s2 == s3) continue;

        const double w = (s0 + s1) / (s1 + s2);
        if (std::isfinite(w)) {
            weight[i + 2] = w;
        }
    }

    // Knot derivatives; the end knots have a single adjacent segment
    std::vector<double> deriv(n);
    deriv[0] = slope[0];
    deriv[n - 1] = slope[n - 2];
    for (size_t i = 1; i < n - 1; ++i) {
        deriv[i] = blend_slopes(weight[i + 2], weight[i + 3], slope[i - 1], slope[i]);
    }

    // Hermite cubic coefficients per segment
    spline.b_.resize(n - 1);
    spline.c_.resize(n - 1);
    spline.d_.resize(n - 1);
    for (size_t i = 0; i < n - 1; ++i) {
        const double h = x[i + 1] - x[i];
        const double s = slope[i];
        const double p = deriv[i];
        const double q = deriv[i + 1];

        spline.b_[i] = p;
        spline.c_[i] = (3.0 * s - 2.0 * p - q) / h;
        spline.d_[i] = (p + q - 2.0 * s) / (h * h);
    }

    return spline;
}

size_t AkimaSpline::segment(double q) const noexcept {
    // Interior query: insertion point is in [1, n-1]
    return find_insertion_point(x_, q) - 1;
}

double AkimaSpline::eval(double q) const noexcept {
    if (q <= x_.front()) return y_.front();
    if (q >= x_.back()) return y_.back();

    const size_t i = segment(q);
    const double dx = q - x_[i];
    return y_[i] + b_[i] * dx + c_[i] * (dx * dx) + d_[i] * (dx * dx * dx);
}

double AkimaSpline::eval_derivative(double q) const noexcept {
    if (q <= x_.front() || q >= x_.back()) return 0.0;

    const size_t i = segment(q);
    const double dx = q - x_[i];

    // S'(x) = b + 2c·Δx + 3d·Δx²
    return b_[i] + 2.0 * c_[i] * dx + 3.0 * d_[i] * (dx * dx);
}

void AkimaSpline::eval_batch(std::span<const double> queries,
                             std::span<double> out) const noexcept {
    assert(out.size() == queries.size());
    const size_t n_queries = queries.size();

    INTERPFIT_PRAGMA_PARALLEL_FOR_STATIC
    for (size_t k = 0; k < n_queries; ++k) {
        out[k] = eval(queries[k]);
    }
}

FitResult<double> akima_interpolate(std::span<const double> x,
                                    std::span<const double> y,
                                    double query)
{
    auto spline = AkimaSpline::create(x, y);
    if (!spline) {
        return std::unexpected(spline.error());
    }
    return spline->eval(query);
}

} // namespace interpfit
