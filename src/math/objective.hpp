// SPDX-License-Identifier: MIT
#pragma once

#include <Eigen/Dense>
#include <concepts>
#include <functional>
#include <type_traits>

namespace fdnewton {

/// Concept for scalar objective functions f: R -> R
///
/// Works with any callable that takes a double and returns a double.
/// This includes lambdas, function objects, function pointers, and std::function.
template<typename F>
concept ObjectiveFunction = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Concept for multivariate objective functions f: R^n -> R
template<typename F>
concept VectorObjectiveFunction = requires(F f, const Eigen::VectorXd& x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Concept for vector-valued functions g: R^n -> R^m (Jacobian input)
template<typename G>
concept VectorFunction = requires(G g, const Eigen::VectorXd& x) {
    { g(x) } -> std::convertible_to<Eigen::VectorXd>;
};

namespace detail {

template<typename T>
struct is_std_function : std::false_type {};

template<typename R, typename... Args>
struct is_std_function<std::function<R(Args...)>> : std::true_type {};

}  // namespace detail

/// True when a callable has no target: an empty std::function or a null
/// function pointer. Lambdas and functors are always callable.
template<typename F>
[[nodiscard]] bool is_null_callable(const F& f) noexcept {
    using D = std::remove_cvref_t<F>;
    if constexpr (std::is_pointer_v<D>) {
        return f == nullptr;
    } else if constexpr (detail::is_std_function<D>::value) {
        return !static_cast<bool>(f);
    } else {
        return false;
    }
}

}  // namespace fdnewton
