// SPDX-License-Identifier: MIT
/**
 * @file interpfit_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the interpfit library
 *
 * The library never prints. Runtime behaviour (fit convergence, singular
 * pivots, validation failures) is observable through probes that can be
 * enabled at runtime with bpftrace, systemtap or perf.
 *
 * When tracing is disabled (default), probes compile to nothing.
 *
 * Example usage with bpftrace:
 *   # Watch rational-fit convergence
 *   sudo bpftrace -e 'usdt:./lib*.so:interpfit:convergence_iter { printf("%d %f\n", arg2, arg3); }'
 *
 *   # Report every input validation failure
 *   sudo bpftrace -e 'usdt:./lib*.so:interpfit:validation_error { ... }'
 */

#ifndef INTERPFIT_TRACE_H
#define INTERPFIT_TRACE_H

#include <stddef.h>

/**
 * On Linux with systemtap-sdt-dev installed the build defines
 * HAVE_SYSTEMTAP_SDT and the probes come from sys/sdt.h.
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all interpfit probes
 */
#define INTERPFIT_PROVIDER interpfit

/**
 * Module identifiers, passed as the first parameter to the generic probes
 */
#define INTERPFIT_MODULE_DENSE_SOLVER     1
#define INTERPFIT_MODULE_INTERPOLATION    2
#define INTERPFIT_MODULE_AKIMA_SPLINE     3
#define INTERPFIT_MODULE_POLYNOMIAL_FIT   4
#define INTERPFIT_MODULE_RATIONAL_FIT     5
#define INTERPFIT_MODULE_VECTOR_FIT       6
#define INTERPFIT_MODULE_ERROR_METRICS    7

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (INTERPFIT_MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., sample count)
 * @param param2: Module-specific parameter (e.g., degree, max_iter)
 * @param param3: Module-specific parameter
 */
#define INTERPFIT_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(INTERPFIT_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an algorithm completes successfully
 * @param module_id: Module identifier
 * @param iterations: Number of iterations/steps completed
 * @param final_metric: Final metric value (e.g., SSE)
 */
#define INTERPFIT_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(INTERPFIT_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Convergence Tracking Probes
 * ============================================================================
 */

/**
 * Fired on each iteration of a convergence loop
 * @param module_id: Module identifier
 * @param iter: Current iteration number
 * @param error: Current error metric
 * @param tolerance: Convergence threshold
 */
#define INTERPFIT_TRACE_CONVERGENCE_ITER(module_id, iter, error, tolerance) \
    DTRACE_PROBE4(INTERPFIT_PROVIDER, convergence_iter, module_id, iter, error, tolerance)

/**
 * Fired when convergence is achieved
 * @param module_id: Module identifier
 * @param final_iter: Number of iterations required
 * @param final_error: Final error achieved
 */
#define INTERPFIT_TRACE_CONVERGENCE_SUCCESS(module_id, final_iter, final_error) \
    DTRACE_PROBE3(INTERPFIT_PROVIDER, convergence_success, module_id, final_iter, final_error)

/**
 * Fired when the iteration cap is reached without convergence
 * @param module_id: Module identifier
 * @param max_iter: Maximum iterations attempted
 * @param final_error: Final error at failure
 */
#define INTERPFIT_TRACE_CONVERGENCE_FAILED(module_id, max_iter, final_error) \
    DTRACE_PROBE3(INTERPFIT_PROVIDER, convergence_failed, module_id, max_iter, final_error)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: FitErrorCode as integer
 * @param param1: Relevant parameter value
 * @param param2: Relevant parameter value or threshold
 */
#define INTERPFIT_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(INTERPFIT_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * Fired when a runtime numerical failure occurs
 * @param module_id: Module identifier
 * @param error_code: FitErrorCode as integer
 * @param context: Context value (e.g., pivot column, iteration)
 */
#define INTERPFIT_TRACE_RUNTIME_ERROR(module_id, error_code, context) \
    DTRACE_PROBE3(INTERPFIT_PROVIDER, runtime_error, module_id, error_code, context)

/**
 * ============================================================================
 * Module-Specific Probes: Dense Solver
 * ============================================================================
 */

/**
 * Fired when a pivot falls below the singularity tolerance
 * @param column: Elimination column
 * @param pivot: Pivot magnitude found
 */
#define INTERPFIT_TRACE_SOLVER_SINGULAR(column, pivot) \
    DTRACE_PROBE3(INTERPFIT_PROVIDER, solver_singular, \
                  INTERPFIT_MODULE_DENSE_SOLVER, column, pivot)

/**
 * ============================================================================
 * Module-Specific Probes: Rational Fit
 * ============================================================================
 */

/**
 * Fired when rational fitting begins
 * @param n_samples: Number of samples
 * @param num_degree: Numerator degree
 * @param den_degree: Denominator degree
 */
#define INTERPFIT_TRACE_RATIONAL_START(n_samples, num_degree, den_degree) \
    INTERPFIT_TRACE_ALGO_START(INTERPFIT_MODULE_RATIONAL_FIT, n_samples, num_degree, den_degree)

/**
 * Fired when a denominator sample is clamped away from zero
 * @param iter: Iteration number
 * @param sample: Sample index
 */
#define INTERPFIT_TRACE_RATIONAL_CLAMP(iter, sample) \
    DTRACE_PROBE3(INTERPFIT_PROVIDER, rational_clamp, \
                  INTERPFIT_MODULE_RATIONAL_FIT, iter, sample)

#endif // INTERPFIT_TRACE_H
