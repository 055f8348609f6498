// SPDX-License-Identifier: MIT
/**
 * @file vector_fit.hpp
 * @brief Per-component polynomial fitting of vector-valued samples
 */

#pragma once

#include "interpfit/fitting/polynomial_fit.hpp"
#include "interpfit/support/error_types.hpp"
#include <cstddef>
#include <span>
#include <vector>

namespace interpfit {

/// One polynomial per component, all of the same degree
struct VectorFitResult {
    std::vector<PolynomialCoefficients> components;
    size_t degree = 0;

    [[nodiscard]] size_t dimension() const noexcept { return components.size(); }
};

/// Fit each component of vectors[i] against x[i] independently
///
/// Errors:
/// - EmptyInput: no samples, or zero-dimension vectors
/// - LengthMismatch: x.size() != vectors.size()
/// - DimensionMismatch: a sample's dimension differs from vectors[0]'s
///   (size = expected dimension, index = offending sample)
/// - any fit_polynomial() error
[[nodiscard]] FitResult<VectorFitResult> fit_vector(
    std::span<const double> x,
    std::span<const std::vector<double>> vectors,
    size_t degree,
    const DenseSolverConfig& solver_config = {});

/// Evaluate every component polynomial at x
[[nodiscard]] std::vector<double> evaluate_vector(const VectorFitResult& fit, double x);

} // namespace interpfit
