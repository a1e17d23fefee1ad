// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/finite_difference.hpp"
#include "src/math/objective.hpp"
#include <Eigen/Dense>
#include <concepts>
#include <functional>
#include <utility>

namespace fdnewton {

/// Concept for the gradient/Hessian capability injected into the
/// multivariate solver
///
/// A provider exposes gradient(f, x) and hessian(f, x). Finite-difference
/// providers use f; analytic providers may ignore it.
template<typename P>
concept DerivativeProvider = requires(const P& p,
                                      const std::function<double(const Eigen::VectorXd&)>& f,
                                      const Eigen::VectorXd& x) {
    { p.gradient(f, x) } -> std::convertible_to<Eigen::VectorXd>;
    { p.hessian(f, x) } -> std::convertible_to<Eigen::MatrixXd>;
};

/// Forward-difference gradient and Jacobian-of-gradient Hessian
struct FiniteDifferenceDerivatives {
    double gradient_epsilon = kDefaultGradientEpsilon;
    double hessian_epsilon = kDefaultFdEpsilon;

    template<VectorObjectiveFunction F>
    [[nodiscard]] Eigen::VectorXd gradient(F&& f, const Eigen::VectorXd& x) const {
        return forward_gradient(f, x, gradient_epsilon);
    }

    template<VectorObjectiveFunction F>
    [[nodiscard]] Eigen::MatrixXd hessian(F&& f, const Eigen::VectorXd& x) const {
        return forward_hessian(f, x, gradient_epsilon, hessian_epsilon);
    }
};

/// Closed-form derivatives supplied by the caller
///
/// @tparam Grad Callable const Eigen::VectorXd& -> Eigen::VectorXd
/// @tparam Hess Callable const Eigen::VectorXd& -> Eigen::MatrixXd
///
/// **Example:**
/// ```cpp
/// AnalyticDerivatives exact{
///     [](const Eigen::VectorXd& x) -> Eigen::VectorXd { return A * x - b; },
///     [](const Eigen::VectorXd&) -> Eigen::MatrixXd { return A; }};
/// auto result = multivariate_newton(f, x0, exact);
/// ```
template<typename Grad, typename Hess>
class AnalyticDerivatives {
public:
    AnalyticDerivatives(Grad grad, Hess hess)
        : grad_(std::move(grad))
        , hess_(std::move(hess))
    {}

    template<typename F>
    [[nodiscard]] Eigen::VectorXd gradient(F&& /*f*/, const Eigen::VectorXd& x) const {
        return grad_(x);
    }

    template<typename F>
    [[nodiscard]] Eigen::MatrixXd hessian(F&& /*f*/, const Eigen::VectorXd& x) const {
        return hess_(x);
    }

private:
    Grad grad_;
    Hess hess_;
};

}  // namespace fdnewton
