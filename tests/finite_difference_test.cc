// SPDX-License-Identifier: MIT
#include "src/math/finite_difference.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <vector>

using namespace fdnewton;

namespace {

double square(double x) { return x * x; }

}  // namespace

// ============================================================================
// Scalar estimators
// ============================================================================

TEST(ForwardFirstDerivativeTest, SquareAtOneIsFirstOrderAccurate) {
    const double d = forward_first_derivative(square, 1.0, 1e-5);

    // Forward difference of x^2 is exactly 2x + eps before rounding
    EXPECT_NEAR(d, 2.0, 2e-5);
    EXPECT_NEAR(d, 2.0 + 1e-5, 1e-9);
    EXPECT_GT(d, 2.0);
}

TEST(ForwardFirstDerivativeTest, DefaultStepIsOneEMinusFive) {
    EXPECT_DOUBLE_EQ(kDefaultFdEpsilon, 1e-5);
    EXPECT_DOUBLE_EQ(forward_first_derivative(square, 1.0),
                     forward_first_derivative(square, 1.0, 1e-5));
}

TEST(ForwardFirstDerivativeTest, CubicErrorScalesWithStep) {
    auto cube = [](double x) { return x * x * x; };

    const double coarse = forward_first_derivative(cube, 2.0, 1e-3);
    const double fine = forward_first_derivative(cube, 2.0, 1e-5);

    EXPECT_NEAR(fine, 12.0, 1e-4);
    EXPECT_LT(std::abs(fine - 12.0), std::abs(coarse - 12.0));
}

TEST(ForwardFirstDerivativeTest, ZeroStepIsNotGuarded) {
    const double d = forward_first_derivative(square, 1.0, 0.0);
    EXPECT_FALSE(std::isfinite(d));
}

TEST(ForwardSecondDerivativeTest, SquareIsApproximatelyTwoEverywhere) {
    for (double x : {-3.0, 0.5, 1.0, 2.0, 10.0}) {
        const double d2 = forward_second_derivative(square, x);
        EXPECT_NEAR(d2, 2.0, 1e-3) << "x = " << x;
    }
}

TEST(ForwardSecondDerivativeTest, SquareIsNotExactlyTwo) {
    // Nested differencing loses digits to cancellation
    EXPECT_NE(forward_second_derivative(square, 1.0), 2.0);
    EXPECT_NE(forward_second_derivative(square, 0.0), 2.0);
}

TEST(ForwardSecondDerivativeTest, EvaluatesAtThreeDistinctPoints) {
    std::vector<double> points;
    auto record = [&points](double x) {
        points.push_back(x);
        return x * x;
    };

    (void)forward_second_derivative(record, 1.0, 0.5);

    ASSERT_EQ(points.size(), 4u);
    std::sort(points.begin(), points.end());
    points.erase(std::unique(points.begin(), points.end()), points.end());
    ASSERT_EQ(points.size(), 3u);
    EXPECT_DOUBLE_EQ(points[0], 1.0);
    EXPECT_DOUBLE_EQ(points[1], 1.5);
    EXPECT_DOUBLE_EQ(points[2], 2.0);
}

TEST(ForwardSecondDerivativeTest, ZeroStepIsNotGuarded) {
    EXPECT_FALSE(std::isfinite(forward_second_derivative(square, 1.0, 0.0)));
}

// ============================================================================
// Multivariate estimators
// ============================================================================

TEST(ForwardGradientTest, SeparableQuadratic) {
    auto f = [](const Eigen::VectorXd& v) { return v(0) * v(0) + 3.0 * v(1) * v(1); };
    Eigen::VectorXd x(2);
    x << 1.0, 2.0;

    const Eigen::VectorXd g = forward_gradient(f, x);

    ASSERT_EQ(g.size(), 2);
    EXPECT_NEAR(g(0), 2.0, 1e-5);
    EXPECT_NEAR(g(1), 12.0, 1e-5);
}

TEST(ForwardGradientTest, CostsOneEvaluationPerCoordinatePlusOne) {
    size_t calls = 0;
    auto f = [&calls](const Eigen::VectorXd& v) {
        ++calls;
        return v.squaredNorm();
    };

    (void)forward_gradient(f, Eigen::VectorXd::Ones(5));
    EXPECT_EQ(calls, 6u);
}

TEST(ForwardJacobianTest, NonlinearMap) {
    auto g = [](const Eigen::VectorXd& v) {
        Eigen::VectorXd out(2);
        out << v(0) * v(1), v(0) + std::sin(v(1));
        return out;
    };
    Eigen::VectorXd x(2);
    x << 1.5, 0.5;

    const Eigen::MatrixXd J = forward_jacobian(g, x);

    ASSERT_EQ(J.rows(), 2);
    ASSERT_EQ(J.cols(), 2);
    EXPECT_NEAR(J(0, 0), 0.5, 1e-4);
    EXPECT_NEAR(J(0, 1), 1.5, 1e-4);
    EXPECT_NEAR(J(1, 0), 1.0, 1e-4);
    EXPECT_NEAR(J(1, 1), std::cos(0.5), 1e-4);
}

TEST(ForwardJacobianTest, RectangularOutput) {
    auto g = [](const Eigen::VectorXd& v) {
        Eigen::VectorXd out(3);
        out << v(0), 2.0 * v(1), v(0) + v(1);
        return out;
    };

    const Eigen::MatrixXd J = forward_jacobian(g, Eigen::VectorXd::Zero(2));

    EXPECT_EQ(J.rows(), 3);
    EXPECT_EQ(J.cols(), 2);
    EXPECT_NEAR(J(1, 1), 2.0, 1e-8);
    EXPECT_NEAR(J(2, 0), 1.0, 1e-8);
}

TEST(ForwardHessianTest, CoupledQuadratic) {
    auto f = [](const Eigen::VectorXd& v) {
        return v(0) * v(0) + v(0) * v(1) + 2.0 * v(1) * v(1);
    };
    Eigen::VectorXd x(2);
    x << 0.1, -0.2;

    const Eigen::MatrixXd H = forward_hessian(f, x);

    EXPECT_NEAR(H(0, 0), 2.0, 1e-3);
    EXPECT_NEAR(H(0, 1), 1.0, 1e-3);
    EXPECT_NEAR(H(1, 1), 4.0, 1e-3);
    EXPECT_DOUBLE_EQ(H(0, 1), H(1, 0));
}

TEST(ForwardHessianTest, ConstantFunctionGivesZeroMatrix) {
    auto f = [](const Eigen::VectorXd&) { return 5.0; };

    const Eigen::MatrixXd H = forward_hessian(f, Eigen::VectorXd::Ones(3));

    EXPECT_TRUE(H.isZero(0.0));
}
