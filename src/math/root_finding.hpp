// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/finite_difference.hpp"
#include "src/math/newton_config.hpp"
#include "src/math/newton_result.hpp"
#include "src/math/objective.hpp"
#include "src/support/error_types.hpp"
#include "src/support/fdnewton_trace.h"
#include <cmath>
#include <cstddef>
#include <expected>
#include <limits>
#include <string>
#include <utility>

namespace fdnewton {

/// Newton iteration on a scalar function with finite-difference derivatives
///
/// Update rule depends on config.mode:
/// - Stationary (default): x_{n+1} = x_n - f'(x_n)/f''(x_n)
///   This is Newton's method applied to f', so it converges to a stationary
///   point of f, NOT to a root of f. For f(x) = x^2 - 2 it returns 0.
/// - Root: x_{n+1} = x_n - f(x_n)/f'(x_n), classical Newton-Raphson on f.
///
/// Both derivatives come from forward differences with step
/// config.fd_epsilon (see finite_difference.hpp).
///
/// **Termination:**
/// - |x_{n+1} - x_n| < tolerance: success, status Converged
/// - max_iter iterations: success, status IterationLimitReached, last iterate
/// - max_iter == 0: x0 returned untouched, no evaluation of f
///
/// **Failures** (std::unexpected):
/// - InvalidArgument: null callable, non-finite x0, invalid config
/// - SingularDerivative: |denominator| <= config.singular_threshold
/// - NonFiniteValue: a derivative estimate or the new iterate is NaN/Inf
///
/// Steps larger than config.divergence_threshold are counted in
/// divergence_warnings and fire the newton_divergence probe; they do not stop
/// the iteration.
///
/// @tparam F Objective function type satisfying ObjectiveFunction
/// @param f Function to iterate on; must be defined at x, x+eps and x+2eps
///          for every visited x
/// @param x0 Initial guess
/// @param config Solver configuration
/// @return Result with estimate and termination status, or NewtonError
///
/// **Example:**
/// ```cpp
/// auto f = [](double x) { return x*x - 2.0; };
/// auto root = newton_method(f, 1.0, {.mode = NewtonMode::Root});
/// // root->root ~ 1.414213...
/// ```
template<ObjectiveFunction F>
[[nodiscard]] std::expected<NewtonResult, NewtonError>
newton_method(F&& f, double x0, const NewtonConfig& config = {}) {
    if (is_null_callable(f)) {
        const ValidationError err(ValidationErrorCode::NullObjective);
        FDNEWTON_TRACE_VALIDATION_ERROR(MODULE_NEWTON_1D, static_cast<int>(err.code), 0.0);
        return std::unexpected(convert_to_newton_error(err));
    }
    if (!std::isfinite(x0)) {
        const ValidationError err(ValidationErrorCode::NonFiniteInitialGuess, x0);
        FDNEWTON_TRACE_VALIDATION_ERROR(MODULE_NEWTON_1D, static_cast<int>(err.code), x0);
        return std::unexpected(convert_to_newton_error(err));
    }
    if (auto valid = validate_config(config); !valid) {
        FDNEWTON_TRACE_VALIDATION_ERROR(MODULE_NEWTON_1D,
                                        static_cast<int>(valid.error().code),
                                        valid.error().value);
        return std::unexpected(convert_to_newton_error(valid.error()));
    }

    size_t evaluations = 0;
    auto counted = [&f, &evaluations](double x) -> double {
        ++evaluations;
        return static_cast<double>(f(x));
    };

    auto fail = [&](NewtonErrorCode code, size_t iter, double x, const char* what) {
        FDNEWTON_TRACE_RUNTIME_ERROR(MODULE_NEWTON_1D, static_cast<int>(code), iter);
        return std::unexpected(NewtonError{
            .code = code,
            .iterations = iter,
            .last_x = x,
            .message = what
        });
    };

    const double eps = config.fd_epsilon;
    const bool stationary = config.mode == NewtonMode::Stationary;

    FDNEWTON_TRACE_ALGO_START(MODULE_NEWTON_1D, config.max_iter, config.tolerance, x0);

    double x = x0;
    double x_new = x0;
    double step = std::numeric_limits<double>::quiet_NaN();
    size_t warnings = 0;

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        const double numerator = stationary
            ? forward_first_derivative(counted, x, eps)
            : counted(x);
        const double denominator = stationary
            ? forward_second_derivative(counted, x, eps)
            : forward_first_derivative(counted, x, eps);

        if (!std::isfinite(numerator) || !std::isfinite(denominator)) {
            return fail(NewtonErrorCode::NonFiniteValue, iter, x,
                        "derivative estimate is not finite");
        }
        if (std::abs(denominator) <= config.singular_threshold) {
            return fail(NewtonErrorCode::SingularDerivative, iter, x,
                        stationary ? "second derivative is zero"
                                   : "first derivative is zero");
        }

        x_new = x - numerator / denominator;
        if (!std::isfinite(x_new)) {
            return fail(NewtonErrorCode::NonFiniteValue, iter, x,
                        "Newton step is not finite");
        }

        step = std::abs(x_new - x);
        FDNEWTON_TRACE_CONVERGENCE_ITER(MODULE_NEWTON_1D, iter, x_new, step, config.tolerance);

        if (step > config.divergence_threshold) {
            ++warnings;
            FDNEWTON_TRACE_NEWTON_DIVERGENCE(MODULE_NEWTON_1D, iter, step,
                                             config.divergence_threshold);
        }

        if (step < config.tolerance) {
            FDNEWTON_TRACE_CONVERGENCE_SUCCESS(MODULE_NEWTON_1D, iter + 1, step);
            return NewtonResult{
                .root = x_new,
                .status = NewtonStatus::Converged,
                .iterations = iter + 1,
                .final_step = step,
                .divergence_warnings = warnings,
                .function_evaluations = evaluations
            };
        }

        x = x_new;
    }

    FDNEWTON_TRACE_CONVERGENCE_FAILED(MODULE_NEWTON_1D, config.max_iter, step);
    return NewtonResult{
        .root = x_new,
        .status = NewtonStatus::IterationLimitReached,
        .iterations = config.max_iter,
        .final_step = step,
        .divergence_warnings = warnings,
        .function_evaluations = evaluations
    };
}

/// Convenience overload with the historical (tolerance, max_iter) signature
template<ObjectiveFunction F>
[[nodiscard]] std::expected<NewtonResult, NewtonError>
newton_method(F&& f, double x0, double tolerance, size_t max_iter) {
    NewtonConfig config;
    config.tolerance = tolerance;
    config.max_iter = max_iter;
    return newton_method(std::forward<F>(f), x0, config);
}

/// Find a stationary point of f (Newton on f'), ignoring config.mode
template<ObjectiveFunction F>
[[nodiscard]] std::expected<NewtonResult, NewtonError>
newton_find_stationary(F&& f, double x0, NewtonConfig config = {}) {
    config.mode = NewtonMode::Stationary;
    return newton_method(std::forward<F>(f), x0, config);
}

/// Find a root of f (Newton-Raphson with a forward-difference f'),
/// ignoring config.mode
template<ObjectiveFunction F>
[[nodiscard]] std::expected<NewtonResult, NewtonError>
newton_find_root(F&& f, double x0, NewtonConfig config = {}) {
    config.mode = NewtonMode::Root;
    return newton_method(std::forward<F>(f), x0, config);
}

}  // namespace fdnewton
