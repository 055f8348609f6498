// SPDX-License-Identifier: MIT
#include "interpfit/fitting/rational_fit.hpp"
#include "interpfit/support/interpfit_trace.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace interpfit {

namespace {

/// Sum of squared residuals of P/Q on the samples
FitResult<double> rational_sse(std::span<const double> x,
                               std::span<const double> y,
                               std::span<const double> numerator,
                               std::span<const double> denominator) {
    double sse = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        auto predicted = evaluate_rational(numerator, denominator, x[i]);
        if (!predicted) {
            return std::unexpected(predicted.error());
        }
        const double e = y[i] - *predicted;
        sse += e * e;
    }
    return sse;
}

} // namespace

FitResult<double> evaluate_rational(std::span<const double> numerator,
                                    std::span<const double> denominator,
                                    double x)
{
    const double num = evaluate_polynomial(numerator, x);
    const double den = evaluate_polynomial(denominator, x);

    if (std::abs(den) < kRationalPoleTolerance) {
        return std::unexpected(FitError(FitErrorCode::NearSingularDenominator,
                                        denominator.size(), 0, x));
    }
    return num / den;
}

FitResult<RationalFitResult> fit_rational(
    std::span<const double> x,
    std::span<const double> y,
    size_t num_degree,
    size_t den_degree,
    const RationalFitConfig& config)
{
    if (x.size() != y.size()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_RATIONAL_FIT,
            static_cast<int>(FitErrorCode::LengthMismatch), x.size(), y.size());
        return std::unexpected(FitError(FitErrorCode::LengthMismatch, x.size(), y.size()));
    }
    if (x.empty()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_RATIONAL_FIT,
            static_cast<int>(FitErrorCode::EmptyInput), 0, 0);
        return std::unexpected(FitError(FitErrorCode::EmptyInput));
    }

    const size_t n = x.size();

    // n >= num_degree + den_degree + 1, compared without overflow
    if (num_degree >= n || den_degree >= n - num_degree) {
        constexpr size_t kMax = std::numeric_limits<size_t>::max();
        const size_t required = den_degree >= kMax - num_degree ? kMax
                                                                : num_degree + den_degree + 1;
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_RATIONAL_FIT,
            static_cast<int>(FitErrorCode::InsufficientPoints), n, required);
        return std::unexpected(FitError(FitErrorCode::InsufficientPoints, n, required));
    }
    const size_t total_params = num_degree + den_degree + 1;

    INTERPFIT_TRACE_RATIONAL_START(n, num_degree, den_degree);

    RationalFitResult result;
    result.numerator.assign(num_degree + 1, 0.0);
    result.denominator.assign(den_degree + 1, 0.0);
    result.denominator[0] = 1.0;

    // Columns: [x^0 .. x^num | x^1 .. x^den] (the constant denominator term is fixed)
    Eigen::MatrixXd A(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(total_params));
    std::vector<double> b(n);
    std::vector<double> q(n);

    double prev_sse = std::numeric_limits<double>::infinity();

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        for (size_t i = 0; i < n; ++i) {
            q[i] = evaluate_polynomial(result.denominator, x[i]);
            if (std::abs(q[i]) < config.denominator_floor) {
                INTERPFIT_TRACE_RATIONAL_CLAMP(iter, i);
                q[i] = config.denominator_floor;
            }
        }

        for (size_t i = 0; i < n; ++i) {
            const double inv_q = 1.0 / q[i];
            double power = 1.0;
            for (size_t j = 0; j <= std::max(num_degree, den_degree); ++j) {
                const auto row = static_cast<Eigen::Index>(i);
                if (j <= num_degree) {
                    A(row, static_cast<Eigen::Index>(j)) = power * inv_q;
                }
                if (j >= 1 && j <= den_degree) {
                    A(row, static_cast<Eigen::Index>(num_degree + j)) = -y[i] * power * inv_q;
                }
                power *= x[i];
            }
            b[i] = y[i] * inv_q;
        }

        auto params = solve_normal_equations(A, b, config.solver);
        if (!params) {
            INTERPFIT_TRACE_RUNTIME_ERROR(INTERPFIT_MODULE_RATIONAL_FIT,
                static_cast<int>(params.error().code), iter);
            return std::unexpected(params.error());
        }

        for (size_t j = 0; j <= num_degree; ++j) {
            result.numerator[j] = (*params)[j];
        }
        result.denominator[0] = 1.0;
        for (size_t j = 1; j <= den_degree; ++j) {
            result.denominator[j] = (*params)[num_degree + j];
        }

        auto sse = rational_sse(x, y, result.numerator, result.denominator);
        if (!sse) {
            INTERPFIT_TRACE_RUNTIME_ERROR(INTERPFIT_MODULE_RATIONAL_FIT,
                static_cast<int>(sse.error().code), iter);
            return std::unexpected(sse.error());
        }

        result.iterations = iter + 1;
        result.sse = *sse;

        INTERPFIT_TRACE_CONVERGENCE_ITER(INTERPFIT_MODULE_RATIONAL_FIT,
                                         iter, *sse, config.tolerance);

        if (std::abs(prev_sse - *sse) < config.tolerance) {
            result.converged = true;
            INTERPFIT_TRACE_CONVERGENCE_SUCCESS(INTERPFIT_MODULE_RATIONAL_FIT,
                                                result.iterations, result.sse);
            break;
        }
        prev_sse = *sse;
    }

    if (result.iterations == 0) {
        // max_iter == 0: report the initial iterate P = 0, Q = 1
        double sse = 0.0;
        for (size_t i = 0; i < n; ++i) sse += y[i] * y[i];
        result.sse = sse;
    }

    if (!result.converged) {
        INTERPFIT_TRACE_CONVERGENCE_FAILED(INTERPFIT_MODULE_RATIONAL_FIT,
                                           config.max_iter, result.sse);
    }

    INTERPFIT_TRACE_ALGO_COMPLETE(INTERPFIT_MODULE_RATIONAL_FIT, result.iterations, result.sse);
    return result;
}

} // namespace interpfit
