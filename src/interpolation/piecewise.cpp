// SPDX-License-Identifier: MIT
#include "interpfit/interpolation/piecewise.hpp"
#include "interpfit/math/search_index.hpp"
#include "interpfit/support/interpfit_trace.h"
#include "interpfit/support/parallel.hpp"
#include <cmath>

namespace interpfit {

namespace {

std::expected<void, FitError> validate_samples(std::span<const double> x,
                                               std::span<const double> y) {
    if (x.size() != y.size()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_INTERPOLATION,
            static_cast<int>(FitErrorCode::LengthMismatch), x.size(), y.size());
        return std::unexpected(FitError(FitErrorCode::LengthMismatch, x.size(), y.size()));
    }
    if (x.empty()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_INTERPOLATION,
            static_cast<int>(FitErrorCode::EmptyInput), 0, 0);
        return std::unexpected(FitError(FitErrorCode::EmptyInput));
    }
    return {};
}

/// Clamped linear interpolation on validated, non-empty data
double linear_clamped(std::span<const double> x, std::span<const double> y, double q) noexcept {
    const size_t n = x.size();
    if (n == 1) return y[0];
    if (q <= x[0]) return y[0];
    if (q >= x[n - 1]) return y[n - 1];

    const size_t i = find_insertion_point(x, q);
    if (i == 0) return y[0];
    if (i >= n) return y[n - 1];

    return linear(x[i - 1], y[i - 1], x[i], y[i], q);
}

} // namespace

FitResult<double> linear(std::span<const double> x,
                         std::span<const double> y,
                         double query)
{
    if (auto ok = validate_samples(x, y); !ok) {
        return std::unexpected(ok.error());
    }
    return linear_clamped(x, y, query);
}

FitResult<std::vector<double>> linear_batch(std::span<const double> x,
                                            std::span<const double> y,
                                            std::span<const double> queries)
{
    if (auto ok = validate_samples(x, y); !ok) {
        return std::unexpected(ok.error());
    }

    std::vector<double> result(queries.size());
    const size_t n_queries = queries.size();

    INTERPFIT_PRAGMA_PARALLEL_FOR_STATIC
    for (size_t k = 0; k < n_queries; ++k) {
        result[k] = linear_clamped(x, y, queries[k]);
    }

    return result;
}

FitResult<double> log_linear(std::span<const double> freq,
                             std::span<const double> value_db,
                             double target)
{
    if (!(target > 0.0)) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_INTERPOLATION,
            static_cast<int>(FitErrorCode::InvalidDomain), target, 0);
        return std::unexpected(FitError(FitErrorCode::InvalidDomain, freq.size(), 0, target));
    }
    if (auto ok = validate_samples(freq, value_db); !ok) {
        return std::unexpected(ok.error());
    }

    std::vector<double> log_freq(freq.size());
    for (size_t i = 0; i < freq.size(); ++i) {
        if (!(freq[i] > 0.0)) {
            INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_INTERPOLATION,
                static_cast<int>(FitErrorCode::InvalidDomain), freq[i], i);
            return std::unexpected(FitError(FitErrorCode::InvalidDomain, freq.size(), i, freq[i]));
        }
        log_freq[i] = std::log10(freq[i]);
    }

    return linear_clamped(log_freq, value_db, std::log10(target));
}

FitResult<double> nearest(std::span<const double> x,
                          std::span<const double> y,
                          double query)
{
    if (auto ok = validate_samples(x, y); !ok) {
        return std::unexpected(ok.error());
    }

    const size_t n = x.size();
    if (query <= x[0]) return y[0];
    if (query >= x[n - 1]) return y[n - 1];

    const size_t i = find_insertion_point(x, query);
    if (i == 0) return y[0];
    if (i >= n) return y[n - 1];

    const double left_dist = query - x[i - 1];
    const double right_dist = x[i] - query;
    return left_dist <= right_dist ? y[i - 1] : y[i];
}

FitResult<double> bilinear(std::span<const double> x_grid,
                           std::span<const double> y_grid,
                           std::span<const std::vector<double>> table,
                           double qx,
                           double qy)
{
    if (x_grid.empty() || y_grid.empty()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_INTERPOLATION,
            static_cast<int>(FitErrorCode::EmptyInput), x_grid.size(), y_grid.size());
        return std::unexpected(FitError(FitErrorCode::EmptyInput));
    }
    if (table.size() != x_grid.size()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_INTERPOLATION,
            static_cast<int>(FitErrorCode::DimensionMismatch), x_grid.size(), table.size());
        return std::unexpected(FitError(FitErrorCode::DimensionMismatch, x_grid.size(), table.size()));
    }
    for (size_t i = 0; i < table.size(); ++i) {
        if (table[i].size() != y_grid.size()) {
            INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_INTERPOLATION,
                static_cast<int>(FitErrorCode::DimensionMismatch), y_grid.size(), i);
            return std::unexpected(FitError(FitErrorCode::DimensionMismatch, y_grid.size(), i));
        }
    }

    const size_t nx = x_grid.size();
    const size_t ny = y_grid.size();

    // Outside the x range: interpolate along y on the edge row
    if (qx <= x_grid[0]) return linear_clamped(y_grid, table[0], qy);
    if (qx >= x_grid[nx - 1]) return linear_clamped(y_grid, table[nx - 1], qy);

    // Outside the y range: interpolate along x on the edge column
    if (qy <= y_grid[0] || qy >= y_grid[ny - 1]) {
        const size_t col = (qy <= y_grid[0]) ? 0 : ny - 1;
        std::vector<double> column(nx);
        for (size_t i = 0; i < nx; ++i) {
            column[i] = table[i][col];
        }
        return linear_clamped(x_grid, column, qx);
    }

    // Interior: lower-left corner of the bracketing cell
    const size_t i = find_insertion_point(x_grid, qx) - 1;
    const size_t j = find_insertion_point(y_grid, qy) - 1;

    const double x0 = x_grid[i], x1 = x_grid[i + 1];
    const double y0 = y_grid[j], y1 = y_grid[j + 1];

    const double z00 = table[i][j];
    const double z10 = table[i + 1][j];
    const double z01 = table[i][j + 1];
    const double z11 = table[i + 1][j + 1];

    const double tx = (qx - x0) / (x1 - x0);
    const double ty = (qy - y0) / (y1 - y0);

    const double z0 = z00 * (1.0 - tx) + z10 * tx;
    const double z1 = z01 * (1.0 - tx) + z11 * tx;
    return z0 * (1.0 - ty) + z1 * ty;
}

} // namespace interpfit
