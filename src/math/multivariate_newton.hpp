// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/derivative_provider.hpp"
#include "src/math/newton_config.hpp"
#include "src/math/newton_result.hpp"
#include "src/math/objective.hpp"
#include "src/support/error_types.hpp"
#include "src/support/fdnewton_trace.h"
#include <Eigen/Dense>
#include <cmath>
#include <cstddef>
#include <expected>
#include <limits>
#include <utility>

namespace fdnewton {

/// Multivariate Newton iteration toward a stationary point of f: R^n -> R
///
/// **Algorithm:**
/// 1. g = provider.gradient(f, x), H = provider.hessian(f, x)
/// 2. Solve H·δ = g with full-pivot LU (no explicit inverse)
/// 3. x_new = x - δ
/// 4. Converged when ||x_new - x||_2 < tolerance
///
/// **Singular Hessian:** this is a known failure mode, not something the
/// solver repairs. A rank-deficient LU factorization is reported as
/// SingularDerivative; no regularization or pseudo-inverse is attempted.
/// Nearly singular Hessians pass the rank test and can produce huge steps,
/// which show up as divergence warnings.
///
/// @param f Objective, evaluated only through the provider
/// @param x0 Initial guess (non-empty, finite)
/// @param provider Gradient/Hessian capability
/// @param config Tolerance, iteration budget and divergence threshold
///               (the finite difference steps are unused here)
template<VectorObjectiveFunction F, DerivativeProvider P>
[[nodiscard]] std::expected<MultivariateNewtonResult, NewtonError>
multivariate_newton(F&& f, const Eigen::VectorXd& x0, const P& provider,
                    const MultivariateNewtonConfig& config = {}) {
    auto reject = [](const ValidationError& err) {
        FDNEWTON_TRACE_VALIDATION_ERROR(MODULE_NEWTON_ND, static_cast<int>(err.code), err.value);
        return std::unexpected(convert_to_newton_error(err));
    };

    if (is_null_callable(f)) {
        return reject(ValidationError(ValidationErrorCode::NullObjective));
    }
    if (x0.size() == 0) {
        return reject(ValidationError(ValidationErrorCode::EmptyInitialGuess));
    }
    for (Eigen::Index i = 0; i < x0.size(); ++i) {
        if (!std::isfinite(x0(i))) {
            return reject(ValidationError(ValidationErrorCode::NonFiniteInitialGuess,
                                          x0(i), static_cast<size_t>(i)));
        }
    }
    if (auto valid = validate_config(config); !valid) {
        return reject(valid.error());
    }

    auto fail = [](NewtonErrorCode code, size_t iter, const Eigen::VectorXd& x,
                   const char* what) {
        FDNEWTON_TRACE_RUNTIME_ERROR(MODULE_NEWTON_ND, static_cast<int>(code), iter);
        return std::unexpected(NewtonError{
            .code = code,
            .iterations = iter,
            .last_x = x.norm(),
            .message = what
        });
    };

    const Eigen::Index n = x0.size();
    FDNEWTON_TRACE_ALGO_START(MODULE_NEWTON_ND, config.max_iter, config.tolerance, x0.norm());

    Eigen::VectorXd x = x0;
    double step = std::numeric_limits<double>::quiet_NaN();
    size_t warnings = 0;

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        const Eigen::VectorXd grad = provider.gradient(f, x);
        const Eigen::MatrixXd hess = provider.hessian(f, x);

        if (grad.size() != n || hess.rows() != n || hess.cols() != n) {
            return fail(NewtonErrorCode::DimensionMismatch, iter, x,
                        "gradient or Hessian size does not match x");
        }
        if (!grad.allFinite() || !hess.allFinite()) {
            return fail(NewtonErrorCode::NonFiniteValue, iter, x,
                        "gradient or Hessian is not finite");
        }

        const Eigen::FullPivLU<Eigen::MatrixXd> lu(hess);
        if (!lu.isInvertible()) {
            return fail(NewtonErrorCode::SingularDerivative, iter, x,
                        "Hessian is singular");
        }

        const Eigen::VectorXd delta = lu.solve(grad);
        if (!delta.allFinite()) {
            return fail(NewtonErrorCode::NonFiniteValue, iter, x,
                        "Newton step is not finite");
        }

        Eigen::VectorXd x_new = x - delta;
        step = (x_new - x).norm();
        FDNEWTON_TRACE_CONVERGENCE_ITER(MODULE_NEWTON_ND, iter, x_new.norm(), step,
                                        config.tolerance);

        if (step > config.divergence_threshold) {
            ++warnings;
            FDNEWTON_TRACE_NEWTON_DIVERGENCE(MODULE_NEWTON_ND, iter, step,
                                             config.divergence_threshold);
        }

        x = std::move(x_new);

        if (step < config.tolerance) {
            FDNEWTON_TRACE_CONVERGENCE_SUCCESS(MODULE_NEWTON_ND, iter + 1, step);
            return MultivariateNewtonResult{
                .x = std::move(x),
                .status = NewtonStatus::Converged,
                .iterations = iter + 1,
                .final_step = step,
                .divergence_warnings = warnings
            };
        }
    }

    FDNEWTON_TRACE_CONVERGENCE_FAILED(MODULE_NEWTON_ND, config.max_iter, step);
    return MultivariateNewtonResult{
        .x = std::move(x),
        .status = NewtonStatus::IterationLimitReached,
        .iterations = config.max_iter,
        .final_step = step,
        .divergence_warnings = warnings
    };
}

/// Multivariate Newton with the finite-difference provider built from
/// config.gradient_fd_epsilon and config.hessian_fd_epsilon
template<VectorObjectiveFunction F>
[[nodiscard]] std::expected<MultivariateNewtonResult, NewtonError>
multivariate_newton(F&& f, const Eigen::VectorXd& x0,
                    const MultivariateNewtonConfig& config = {}) {
    const FiniteDifferenceDerivatives provider{
        .gradient_epsilon = config.gradient_fd_epsilon,
        .hessian_epsilon = config.hessian_fd_epsilon
    };
    return multivariate_newton(std::forward<F>(f), x0, provider, config);
}

}  // namespace fdnewton
