// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/error_types.hpp"
#include "src/math/finite_difference.hpp"
#include <cmath>
#include <cstddef>
#include <expected>

namespace fdnewton {

/// Which equation the univariate solver drives to zero
enum class NewtonMode {
    /// x <- x - f'(x)/f''(x): Newton applied to f', converges to a
    /// stationary point of f (a minimizer for convex f)
    Stationary,

    /// x <- x - f(x)/f'(x): classical Newton-Raphson on f
    Root
};

/// Configuration for the univariate solver
struct NewtonConfig {
    /// Maximum iterations (0 returns the initial guess untouched)
    size_t max_iter = 100;

    /// Absolute tolerance on |x_new - x|
    double tolerance = 1e-6;

    /// Finite difference step for f' and f''
    double fd_epsilon = kDefaultFdEpsilon;

    /// Steps larger than this raise a divergence warning (iteration continues)
    double divergence_threshold = 1e6;

    /// A denominator with magnitude <= this is treated as singular
    double singular_threshold = 0.0;

    NewtonMode mode = NewtonMode::Stationary;
};

/// Configuration for the multivariate solver
struct MultivariateNewtonConfig {
    size_t max_iter = 100;

    /// Tolerance on ||x_new - x||_2
    double tolerance = 1e-6;

    // Finite difference steps, used when no derivative provider is given
    double gradient_fd_epsilon = kDefaultGradientEpsilon;  ///< Gradient step
    double hessian_fd_epsilon = kDefaultFdEpsilon;         ///< Jacobian-of-gradient step

    double divergence_threshold = 1e6;
};

namespace detail {

[[nodiscard]] inline std::expected<void, ValidationError>
validate_common(double tolerance, double divergence_threshold) {
    if (!(tolerance > 0.0) || !std::isfinite(tolerance)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTolerance, tolerance));
    }
    if (!(divergence_threshold > 0.0)) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidDivergenceThreshold, divergence_threshold));
    }
    return {};
}

[[nodiscard]] inline std::expected<void, ValidationError>
validate_step(double eps) {
    if (!(eps > 0.0) || !std::isfinite(eps)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidStepSize, eps));
    }
    return {};
}

}  // namespace detail

/// Validate a univariate configuration
///
/// NaN fails every check because each test is written as !(value > bound).
[[nodiscard]] inline std::expected<void, ValidationError>
validate_config(const NewtonConfig& config) {
    if (auto ok = detail::validate_common(config.tolerance, config.divergence_threshold); !ok) {
        return ok;
    }
    if (auto ok = detail::validate_step(config.fd_epsilon); !ok) {
        return ok;
    }
    if (!(config.singular_threshold >= 0.0)) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidSingularThreshold, config.singular_threshold));
    }
    return {};
}

/// Validate a multivariate configuration
[[nodiscard]] inline std::expected<void, ValidationError>
validate_config(const MultivariateNewtonConfig& config) {
    if (auto ok = detail::validate_common(config.tolerance, config.divergence_threshold); !ok) {
        return ok;
    }
    if (auto ok = detail::validate_step(config.gradient_fd_epsilon); !ok) {
        return ok;
    }
    return detail::validate_step(config.hessian_fd_epsilon);
}

}  // namespace fdnewton
