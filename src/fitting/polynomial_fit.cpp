// SPDX-License-Identifier: MIT
#include "interpfit/fitting/polynomial_fit.hpp"
#include "interpfit/support/interpfit_trace.h"
#include <limits>
#include <utility>

namespace interpfit {

Eigen::MatrixXd vandermonde(std::span<const double> x, size_t degree) {
    const auto rows = static_cast<Eigen::Index>(x.size());
    const auto cols = static_cast<Eigen::Index>(degree + 1);
    Eigen::MatrixXd A(rows, cols);
    for (Eigen::Index i = 0; i < rows; ++i) {
        double power = 1.0;
        for (Eigen::Index j = 0; j < cols; ++j) {
            A(i, j) = power;
            power *= x[static_cast<size_t>(i)];
        }
    }
    return A;
}

FitResult<PolynomialCoefficients> fit_polynomial(
    std::span<const double> x,
    std::span<const double> y,
    size_t degree,
    const DenseSolverConfig& solver_config)
{
    if (x.size() != y.size()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_POLYNOMIAL_FIT,
            static_cast<int>(FitErrorCode::LengthMismatch), x.size(), y.size());
        return std::unexpected(FitError(FitErrorCode::LengthMismatch, x.size(), y.size()));
    }
    if (x.empty()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_POLYNOMIAL_FIT,
            static_cast<int>(FitErrorCode::EmptyInput), 0, degree);
        return std::unexpected(FitError(FitErrorCode::EmptyInput));
    }
    if (degree >= x.size()) {
        // degree + 1 saturates at SIZE_MAX
        const size_t required = degree == std::numeric_limits<size_t>::max() ? degree : degree + 1;
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_POLYNOMIAL_FIT,
            static_cast<int>(FitErrorCode::InsufficientPoints), x.size(), required);
        return std::unexpected(FitError(FitErrorCode::InsufficientPoints, x.size(), required));
    }

    INTERPFIT_TRACE_ALGO_START(INTERPFIT_MODULE_POLYNOMIAL_FIT, x.size(), degree, 0);

    const Eigen::MatrixXd A = vandermonde(x, degree);
    auto coeffs = solve_normal_equations(A, y, solver_config);
    if (!coeffs) {
        INTERPFIT_TRACE_RUNTIME_ERROR(INTERPFIT_MODULE_POLYNOMIAL_FIT,
            static_cast<int>(coeffs.error().code), coeffs.error().index);
        return std::unexpected(coeffs.error());
    }

    INTERPFIT_TRACE_ALGO_COMPLETE(INTERPFIT_MODULE_POLYNOMIAL_FIT, 1, 0.0);
    return std::move(*coeffs);
}

} // namespace interpfit
