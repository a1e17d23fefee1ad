// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/objective.hpp"
#include <Eigen/Dense>

namespace fdnewton {

/// Default step for the scalar estimators and the Hessian
inline constexpr double kDefaultFdEpsilon = 1e-5;

/// Default step for the multivariate gradient
inline constexpr double kDefaultGradientEpsilon = 1e-8;

/// Forward-difference first derivative
///
/// f'(x) ~ (f(x + eps) - f(x)) / eps, accurate to O(eps).
///
/// eps is not checked: eps == 0 yields inf or NaN. Solvers validate their
/// configured step before calling in.
///
/// @param f Function to differentiate, evaluated at x and x + eps
/// @param x Evaluation point
/// @param eps Step size
[[nodiscard]] double forward_first_derivative(ObjectiveFunction auto&& f,
                                              double x,
                                              double eps = kDefaultFdEpsilon) {
    return (f(x + eps) - f(x)) / eps;
}

/// Forward-difference second derivative
///
/// Nested forward difference of forward_first_derivative:
///   f''(x) ~ (D(x + eps) - D(x)) / eps,   D = forward_first_derivative
///
/// This differentiates an already truncated estimate, so truncation error
/// and cancellation compound; even for a quadratic the result is never
/// exactly 2a. Evaluates f at x, x + eps and x + 2 eps (four calls).
[[nodiscard]] double forward_second_derivative(ObjectiveFunction auto&& f,
                                               double x,
                                               double eps = kDefaultFdEpsilon) {
    return (forward_first_derivative(f, x + eps, eps) -
            forward_first_derivative(f, x, eps)) / eps;
}

/// Forward-difference gradient of f: R^n -> R
///
/// Component j is (f(x + eps e_j) - f(x)) / eps. Costs n + 1 evaluations.
[[nodiscard]] Eigen::VectorXd forward_gradient(VectorObjectiveFunction auto&& f,
                                               const Eigen::VectorXd& x,
                                               double eps = kDefaultGradientEpsilon) {
    const Eigen::Index n = x.size();
    const double f0 = f(x);

    Eigen::VectorXd grad(n);
    Eigen::VectorXd x_pert = x;
    for (Eigen::Index j = 0; j < n; ++j) {
        x_pert(j) = x(j) + eps;
        grad(j) = (f(x_pert) - f0) / eps;
        x_pert(j) = x(j);
    }
    return grad;
}

/// Forward-difference Jacobian of g: R^n -> R^m
///
/// Column j is (g(x + eps e_j) - g(x)) / eps.
[[nodiscard]] Eigen::MatrixXd forward_jacobian(VectorFunction auto&& g,
                                               const Eigen::VectorXd& x,
                                               double eps = kDefaultFdEpsilon) {
    const Eigen::Index n = x.size();
    const Eigen::VectorXd g0 = g(x);

    Eigen::MatrixXd jac(g0.size(), n);
    Eigen::VectorXd x_pert = x;
    for (Eigen::Index j = 0; j < n; ++j) {
        x_pert(j) = x(j) + eps;
        jac.col(j) = (Eigen::VectorXd(g(x_pert)) - g0) / eps;
        x_pert(j) = x(j);
    }
    return jac;
}

/// Approximate Hessian as the forward Jacobian of the forward gradient
///
/// The raw Jacobian-of-gradient is not symmetric; the returned matrix is
/// (J + J^T) / 2.
///
/// @param gradient_eps Step used inside each gradient evaluation
/// @param hessian_eps Step used to difference the gradient
[[nodiscard]] Eigen::MatrixXd forward_hessian(VectorObjectiveFunction auto&& f,
                                              const Eigen::VectorXd& x,
                                              double gradient_eps = kDefaultGradientEpsilon,
                                              double hessian_eps = kDefaultFdEpsilon) {
    auto grad = [&f, gradient_eps](const Eigen::VectorXd& p) {
        return forward_gradient(f, p, gradient_eps);
    };
    const Eigen::MatrixXd jac = forward_jacobian(grad, x, hessian_eps);
    return 0.5 * (jac + jac.transpose());
}

}  // namespace fdnewton
