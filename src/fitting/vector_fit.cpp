// SPDX-License-Identifier: MIT
#include "interpfit/fitting/vector_fit.hpp"
#include "interpfit/support/interpfit_trace.h"
#include <utility>

namespace interpfit {

FitResult<VectorFitResult> fit_vector(
    std::span<const double> x,
    std::span<const std::vector<double>> vectors,
    size_t degree,
    const DenseSolverConfig& solver_config)
{
    if (vectors.empty()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_VECTOR_FIT,
            static_cast<int>(FitErrorCode::EmptyInput), x.size(), 0);
        return std::unexpected(FitError(FitErrorCode::EmptyInput));
    }
    if (x.size() != vectors.size()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_VECTOR_FIT,
            static_cast<int>(FitErrorCode::LengthMismatch), x.size(), vectors.size());
        return std::unexpected(FitError(FitErrorCode::LengthMismatch, x.size(), vectors.size()));
    }

    const size_t dimension = vectors[0].size();
    if (dimension == 0) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_VECTOR_FIT,
            static_cast<int>(FitErrorCode::EmptyInput), x.size(), 0);
        return std::unexpected(FitError(FitErrorCode::EmptyInput, 0, 0));
    }
    for (size_t i = 1; i < vectors.size(); ++i) {
        if (vectors[i].size() != dimension) {
            INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_VECTOR_FIT,
                static_cast<int>(FitErrorCode::DimensionMismatch), dimension, i);
            return std::unexpected(FitError(FitErrorCode::DimensionMismatch, dimension, i));
        }
    }

    INTERPFIT_TRACE_ALGO_START(INTERPFIT_MODULE_VECTOR_FIT, x.size(), degree, dimension);

    VectorFitResult result;
    result.degree = degree;
    result.components.reserve(dimension);

    std::vector<double> component(x.size());
    for (size_t d = 0; d < dimension; ++d) {
        for (size_t i = 0; i < x.size(); ++i) {
            component[i] = vectors[i][d];
        }

        auto coeffs = fit_polynomial(x, component, degree, solver_config);
        if (!coeffs) {
            return std::unexpected(coeffs.error());
        }
        result.components.push_back(std::move(*coeffs));
    }

    INTERPFIT_TRACE_ALGO_COMPLETE(INTERPFIT_MODULE_VECTOR_FIT, dimension, 0.0);
    return result;
}

std::vector<double> evaluate_vector(const VectorFitResult& fit, double x) {
    std::vector<double> values(fit.dimension());
    for (size_t d = 0; d < fit.dimension(); ++d) {
        values[d] = evaluate_polynomial(fit.components[d], x);
    }
    return values;
}

} // namespace interpfit
