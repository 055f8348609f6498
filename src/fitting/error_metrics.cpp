// SPDX-License-Identifier: MIT
#include "interpfit/fitting/error_metrics.hpp"
#include "interpfit/support/interpfit_trace.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ios>

namespace interpfit {

std::ostream& operator<<(std::ostream& os, const FitErrorMetrics& m) {
    const std::ios_base::fmtflags flags = os.flags();
    const std::streamsize precision = os.precision();

    os << std::fixed << std::setprecision(6)
       << "R² = " << m.r_squared
       << ", RMSE = " << m.rmse
       << ", MAE = " << m.mae
       << ", MaxError = " << m.max_error;

    os.flags(flags);
    os.precision(precision);
    return os;
}

namespace detail {

FitResult<void> validate_reference(std::span<const double> x,
                                   std::span<const double> y) {
    if (x.size() != y.size()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_ERROR_METRICS,
            static_cast<int>(FitErrorCode::LengthMismatch), x.size(), y.size());
        return std::unexpected(FitError(FitErrorCode::LengthMismatch, x.size(), y.size()));
    }
    if (x.empty()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_ERROR_METRICS,
            static_cast<int>(FitErrorCode::EmptyInput), 0, 0);
        return std::unexpected(FitError(FitErrorCode::EmptyInput));
    }
    return {};
}

FitErrorMetrics metrics_from_predictions(std::span<const double> y,
                                         std::span<const double> predicted) {
    const size_t n = y.size();

    double sum_squared = 0.0;
    double sum_abs = 0.0;
    double max_abs = 0.0;
    double sum_relative = 0.0;
    size_t relative_count = 0;
    double mean = 0.0;

    for (size_t i = 0; i < n; ++i) {
        const double e = y[i] - predicted[i];
        const double abs_e = std::abs(e);

        sum_squared += e * e;
        sum_abs += abs_e;
        max_abs = std::max(max_abs, abs_e);
        mean += y[i];

        if (std::abs(y[i]) > kRelativeErrorFloor) {
            sum_relative += abs_e / std::abs(y[i]);
            ++relative_count;
        }
    }
    mean /= static_cast<double>(n);

    double ss_total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dev = y[i] - mean;
        ss_total += dev * dev;
    }

    FitErrorMetrics m;
    m.sse = sum_squared;
    m.rmse = std::sqrt(sum_squared / static_cast<double>(n));
    m.mae = sum_abs / static_cast<double>(n);
    m.max_error = max_abs;
    m.r_squared = (ss_total < kDegenerateVarianceTolerance) ? 1.0 : 1.0 - sum_squared / ss_total;
    m.mean_relative_error = (relative_count > 0)
        ? sum_relative / static_cast<double>(relative_count) * 100.0
        : 0.0;
    return m;
}

} // namespace detail

FitResult<FitErrorMetrics>
polynomial_error_metrics(std::span<const double> x,
                         std::span<const double> y,
                         std::span<const double> coeffs)
{
    return compute_error_metrics(x, y, [coeffs](double xi) {
        return evaluate_polynomial(coeffs, xi);
    });
}

FitResult<FitErrorMetrics>
rational_error_metrics(std::span<const double> x,
                       std::span<const double> y,
                       const RationalFitResult& fit)
{
    return compute_error_metrics(x, y, [&fit](double xi) {
        return evaluate_rational(fit, xi);
    });
}

FitResult<FitErrorMetrics>
vector_error_metrics(std::span<const double> x,
                     std::span<const std::vector<double>> vectors,
                     const VectorFitResult& fit)
{
    if (x.size() != vectors.size()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_ERROR_METRICS,
            static_cast<int>(FitErrorCode::LengthMismatch), x.size(), vectors.size());
        return std::unexpected(FitError(FitErrorCode::LengthMismatch, x.size(), vectors.size()));
    }

    const size_t n = x.size();
    const size_t dimension = fit.dimension();

    if (n == 0 || dimension == 0) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_ERROR_METRICS,
            static_cast<int>(FitErrorCode::EmptyInput), n, dimension);
        return std::unexpected(FitError(FitErrorCode::EmptyInput));
    }
    for (size_t i = 0; i < n; ++i) {
        if (vectors[i].size() != dimension) {
            INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_ERROR_METRICS,
                static_cast<int>(FitErrorCode::DimensionMismatch), dimension, i);
            return std::unexpected(FitError(FitErrorCode::DimensionMismatch, dimension, i));
        }
    }

    double sum_squared = 0.0;
    double sum_abs = 0.0;
    double max_abs = 0.0;

    for (size_t i = 0; i < n; ++i) {
        const std::vector<double> predicted = evaluate_vector(fit, x[i]);
        for (size_t d = 0; d < dimension; ++d) {
            const double e = vectors[i][d] - predicted[d];
            const double abs_e = std::abs(e);
            sum_squared += e * e;
            sum_abs += abs_e;
            max_abs = std::max(max_abs, abs_e);
        }
    }

    // Per-component means
    std::vector<double> mean(dimension, 0.0);
    for (size_t i = 0; i < n; ++i) {
        for (size_t d = 0; d < dimension; ++d) {
            mean[d] += vectors[i][d];
        }
    }
    for (double& m : mean) {
        m /= static_cast<double>(n);
    }

    double ss_total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        for (size_t d = 0; d < dimension; ++d) {
            const double dev = vectors[i][d] - mean[d];
            ss_total += dev * dev;
        }
    }

    const double count = static_cast<double>(n * dimension);

    FitErrorMetrics m;
    m.sse = sum_squared;
    m.rmse = std::sqrt(sum_squared / count);
    m.mae = sum_abs / count;
    m.max_error = max_abs;
    m.r_squared = (ss_total < kDegenerateVarianceTolerance) ? 1.0 : 1.0 - sum_squared / ss_total;
    m.mean_relative_error = 0.0;
    return m;
}

} // namespace interpfit
