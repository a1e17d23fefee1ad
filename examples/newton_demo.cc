// SPDX-License-Identifier: MIT
#include "src/math/multivariate_newton.hpp"
#include "src/math/root_finding.hpp"
#include <iomanip>
#include <iostream>

namespace {

double f(double x) { return x * x - 2.0; }

void report(const char* label,
            const std::expected<fdnewton::NewtonResult, fdnewton::NewtonError>& result) {
    if (!result) {
        std::cerr << label << ": failed: " << result.error() << "\n";
        return;
    }
    std::cout << label << ": " << result->root
              << " (" << result->status << " after " << result->iterations
              << " iterations, " << result->function_evaluations << " evaluations)\n";
    if (result->divergence_warnings > 0) {
        std::cout << "  warning: " << result->divergence_warnings
                  << " step(s) exceeded the divergence threshold\n";
    }
}

}  // namespace

int main() {
    std::cout << std::setprecision(10);
    std::cout << "f(x) = x^2 - 2, x0 = 1.0\n";

    // Newton on f': the stationary point of f, which is 0 here
    report("stationary point", fdnewton::newton_method(f, 1.0));

    // Newton-Raphson on f: sqrt(2)
    report("root", fdnewton::newton_find_root(f, 1.0));

    // Convex quadratic 2x^2 + xy + 1.5y^2 - x - 2y, minimizer (1/11, 7/11)
    auto q = [](const Eigen::VectorXd& v) {
        return 2.0 * v(0) * v(0) + v(0) * v(1) + 1.5 * v(1) * v(1) - v(0) - 2.0 * v(1);
    };
    Eigen::VectorXd x0(2);
    x0 << 5.0, -5.0;

    auto result = fdnewton::multivariate_newton(q, x0);
    if (!result) {
        std::cerr << "multivariate: failed: " << result.error() << "\n";
        return 1;
    }
    std::cout << "multivariate minimizer: [" << result->x.transpose() << "] ("
              << result->status << " after " << result->iterations << " iterations)\n";

    return 0;
}
