// SPDX-License-Identifier: MIT
/**
 * @file interpfit.hpp
 * @brief Convenience header for the whole interpfit API
 */

#pragma once

#include "interpfit/support/error_types.hpp"
#include "interpfit/math/search_index.hpp"
#include "interpfit/math/dense_solver.hpp"
#include "interpfit/interpolation/piecewise.hpp"
#include "interpfit/interpolation/akima_spline.hpp"
#include "interpfit/fitting/polynomial_fit.hpp"
#include "interpfit/fitting/rational_fit.hpp"
#include "interpfit/fitting/vector_fit.hpp"
#include "interpfit/fitting/error_metrics.hpp"
