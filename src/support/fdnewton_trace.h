// SPDX-License-Identifier: MIT
/**
 * @file fdnewton_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the fdnewton solvers
 *
 * Probes are NOPs until a tracer attaches. The library never prints; use
 * these to watch iterates, divergence warnings and convergence.
 *
 * Example usage with bpftrace:
 *   # Watch every Newton iteration
 *   sudo bpftrace -e 'usdt:./newton_demo:fdnewton:convergence_iter { printf("%d %d\n", arg0, arg2); }'
 *
 *   # Report divergence warnings
 *   sudo bpftrace -e 'usdt:./newton_demo:fdnewton:newton_divergence { ... }'
 */

#ifndef FDNEWTON_TRACE_H
#define FDNEWTON_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
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
 * Provider name for all fdnewton probes
 */
#define FDNEWTON_PROVIDER fdnewton

/**
 * Module identifiers, passed as the first parameter to the generic probes
 */
#define MODULE_NEWTON_1D        1
#define MODULE_NEWTON_ND        2

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when a solver begins iterating
 * @param module_id: Module identifier (MODULE_* constant)
 * @param max_iter: Iteration budget
 * @param tolerance: Convergence tolerance
 * @param x0: Initial guess (its norm for the multivariate solver)
 */
#define FDNEWTON_TRACE_ALGO_START(module_id, max_iter, tolerance, x0) \
    DTRACE_PROBE4(FDNEWTON_PROVIDER, algo_start, module_id, max_iter, tolerance, x0)

/**
 * ============================================================================
 * Convergence Tracking Probes
 * ============================================================================
 */

/**
 * Fired on each iteration of a convergence loop
 * @param module_id: Module identifier
 * @param iter: Current iteration number
 * @param x: Current iterate (norm for vectors)
 * @param step: Step magnitude |x_new - x|
 * @param tolerance: Convergence threshold
 */
#define FDNEWTON_TRACE_CONVERGENCE_ITER(module_id, iter, x, step, tolerance) \
    DTRACE_PROBE5(FDNEWTON_PROVIDER, convergence_iter, module_id, iter, x, step, tolerance)

/**
 * Fired when convergence is achieved
 * @param module_id: Module identifier
 * @param final_iter: Number of iterations required
 * @param final_step: Last step magnitude
 */
#define FDNEWTON_TRACE_CONVERGENCE_SUCCESS(module_id, final_iter, final_step) \
    DTRACE_PROBE3(FDNEWTON_PROVIDER, convergence_success, module_id, final_iter, final_step)

/**
 * Fired when the iteration budget runs out
 * @param module_id: Module identifier
 * @param max_iter: Iterations attempted
 * @param final_step: Last step magnitude
 */
#define FDNEWTON_TRACE_CONVERGENCE_FAILED(module_id, max_iter, final_step) \
    DTRACE_PROBE3(FDNEWTON_PROVIDER, convergence_failed, module_id, max_iter, final_step)

/**
 * Fired when a single step exceeds the divergence threshold.
 * Iteration continues afterwards.
 * @param module_id: Module identifier
 * @param iter: Iteration number
 * @param step: Step magnitude
 * @param threshold: Configured divergence threshold
 */
#define FDNEWTON_TRACE_NEWTON_DIVERGENCE(module_id, iter, step, threshold) \
    DTRACE_PROBE4(FDNEWTON_PROVIDER, newton_divergence, module_id, iter, step, threshold)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: ValidationErrorCode as int
 * @param value: Offending value
 */
#define FDNEWTON_TRACE_VALIDATION_ERROR(module_id, error_code, value) \
    DTRACE_PROBE3(FDNEWTON_PROVIDER, validation_error, module_id, error_code, value)

/**
 * Fired when a solver aborts mid-iteration
 * @param module_id: Module identifier
 * @param error_code: NewtonErrorCode as int
 * @param iter: Iteration at which the failure happened
 */
#define FDNEWTON_TRACE_RUNTIME_ERROR(module_id, error_code, iter) \
    DTRACE_PROBE3(FDNEWTON_PROVIDER, runtime_error, module_id, error_code, iter)

#endif // FDNEWTON_TRACE_H
