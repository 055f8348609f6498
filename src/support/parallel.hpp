// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP and sequential execution
 *
 * Usage:
 *   INTERPFIT_PRAGMA_PARALLEL_FOR_STATIC
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 * Only loops whose iterations are independent (pure maps over query points)
 * may be annotated; results are identical to the sequential build.
 */

#if defined(_OPENMP)
    #define INTERPFIT_PRAGMA_PARALLEL_FOR_STATIC  _Pragma("omp parallel for schedule(static)")
#else
    #define INTERPFIT_PRAGMA_PARALLEL_FOR_STATIC
#endif
