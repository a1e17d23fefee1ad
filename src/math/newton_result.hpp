// SPDX-License-Identifier: MIT
#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <ostream>

namespace fdnewton {

/// How a successful solve terminated
enum class NewtonStatus {
    Converged,             ///< Step fell below tolerance
    IterationLimitReached  ///< max_iter exhausted; estimate is the last iterate
};

inline const char* to_string(NewtonStatus status) {
    switch (status) {
        case NewtonStatus::Converged:             return "converged";
        case NewtonStatus::IterationLimitReached: return "iteration limit reached";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, NewtonStatus status) {
    return os << to_string(status);
}

/// Result from the univariate solver
struct NewtonResult {
    /// Final estimate: a stationary point of f (NewtonMode::Stationary)
    /// or a root of f (NewtonMode::Root)
    double root;

    NewtonStatus status;

    /// Iterations performed
    size_t iterations;

    /// |x_new - x| of the last iteration (NaN when no iteration ran)
    double final_step;

    /// Number of steps that exceeded the divergence threshold
    size_t divergence_warnings;

    /// Number of objective evaluations
    size_t function_evaluations;

    [[nodiscard]] bool converged() const noexcept {
        return status == NewtonStatus::Converged;
    }
};

/// Result from the multivariate solver
struct MultivariateNewtonResult {
    Eigen::VectorXd x;
    NewtonStatus status;
    size_t iterations;

    /// ||x_new - x||_2 of the last iteration (NaN when no iteration ran)
    double final_step;

    size_t divergence_warnings;

    [[nodiscard]] bool converged() const noexcept {
        return status == NewtonStatus::Converged;
    }
};

}  // namespace fdnewton
