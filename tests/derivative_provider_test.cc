// SPDX-License-Identifier: MIT
#include "src/math/derivative_provider.hpp"
#include <gtest/gtest.h>

using namespace fdnewton;

namespace {

auto coupled_quadratic = [](const Eigen::VectorXd& v) {
    return v(0) * v(0) + v(0) * v(1) + 2.0 * v(1) * v(1);
};

Eigen::VectorXd point() {
    Eigen::VectorXd x(2);
    x << 0.1, -0.2;
    return x;
}

struct MissingHessian {
    Eigen::VectorXd gradient(const std::function<double(const Eigen::VectorXd&)>&,
                             const Eigen::VectorXd& x) const {
        return x;
    }
};

}  // namespace

static_assert(DerivativeProvider<FiniteDifferenceDerivatives>);
static_assert(!DerivativeProvider<MissingHessian>);

TEST(FiniteDifferenceDerivativesTest, MatchesFreeFunctions) {
    const FiniteDifferenceDerivatives fd;

    EXPECT_TRUE(fd.gradient(coupled_quadratic, point())
                    .isApprox(forward_gradient(coupled_quadratic, point())));
    EXPECT_TRUE(fd.hessian(coupled_quadratic, point())
                    .isApprox(forward_hessian(coupled_quadratic, point())));
}

TEST(FiniteDifferenceDerivativesTest, ApproximatesCoupledQuadratic) {
    const FiniteDifferenceDerivatives fd;

    const Eigen::VectorXd g = fd.gradient(coupled_quadratic, point());
    const Eigen::MatrixXd H = fd.hessian(coupled_quadratic, point());

    // grad = (2x + y, x + 4y) = (0, -0.7)
    EXPECT_NEAR(g(0), 0.0, 1e-6);
    EXPECT_NEAR(g(1), -0.7, 1e-6);
    EXPECT_NEAR(H(0, 0), 2.0, 1e-3);
    EXPECT_NEAR(H(1, 0), 1.0, 1e-3);
    EXPECT_NEAR(H(1, 1), 4.0, 1e-3);
}

TEST(FiniteDifferenceDerivativesTest, CustomStepsAreUsed) {
    const FiniteDifferenceDerivatives coarse{.gradient_epsilon = 1e-2, .hessian_epsilon = 1e-2};
    auto cubic = [](const Eigen::VectorXd& v) { return v(0) * v(0) * v(0); };
    Eigen::VectorXd x(1);
    x << 1.0;

    // Forward difference of x^3 at 1 with h = 1e-2: 3 + 3h + h^2
    EXPECT_NEAR(coarse.gradient(cubic, x)(0), 3.0301, 1e-9);
}

TEST(AnalyticDerivativesTest, IgnoresObjectiveAndReturnsClosedForms) {
    size_t objective_calls = 0;
    auto f = [&objective_calls](const Eigen::VectorXd& v) {
        ++objective_calls;
        return v.squaredNorm();
    };
    AnalyticDerivatives exact{
        [](const Eigen::VectorXd& v) -> Eigen::VectorXd { return 2.0 * v; },
        [](const Eigen::VectorXd& v) -> Eigen::MatrixXd {
            return 2.0 * Eigen::MatrixXd::Identity(v.size(), v.size());
        }};
    static_assert(DerivativeProvider<decltype(exact)>);

    const Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(3, 1.0, 3.0);

    EXPECT_TRUE(exact.gradient(f, x).isApprox(2.0 * x));
    EXPECT_TRUE(exact.hessian(f, x).isApprox(2.0 * Eigen::MatrixXd::Identity(3, 3)));
    EXPECT_EQ(objective_calls, 0u);
}
