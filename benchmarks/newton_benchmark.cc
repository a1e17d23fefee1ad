// SPDX-License-Identifier: MIT
/**
 * @file newton_benchmark.cc
 * @brief Cost of the finite-difference Newton solvers
 *
 * - Scalar solve in both modes
 * - Multivariate solve on quadratics of growing dimension, finite-difference
 *   vs analytic derivatives
 */

#include "src/math/multivariate_newton.hpp"
#include "src/math/root_finding.hpp"
#include <benchmark/benchmark.h>
#include <cmath>

using namespace fdnewton;

namespace {

Eigen::MatrixXd make_spd(Eigen::Index n) {
    Eigen::MatrixXd A = Eigen::MatrixXd::Identity(n, n) * 4.0;
    for (Eigen::Index i = 0; i + 1 < n; ++i) {
        A(i, i + 1) = 1.0;
        A(i + 1, i) = 1.0;
    }
    return A;
}

}  // namespace

static void BM_ScalarRoot(benchmark::State& state) {
    auto f = [](double x) { return std::exp(x) - 3.0 * x; };
    for (auto _ : state) {
        auto result = newton_find_root(f, 1.0);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ScalarRoot);

static void BM_ScalarStationary(benchmark::State& state) {
    auto f = [](double x) { return std::exp(x) - 3.0 * x; };
    for (auto _ : state) {
        auto result = newton_find_stationary(f, 1.0);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ScalarStationary);

static void BM_MultivariateFiniteDifference(benchmark::State& state) {
    const Eigen::Index n = state.range(0);
    const Eigen::MatrixXd A = make_spd(n);
    const Eigen::VectorXd b = Eigen::VectorXd::Ones(n);
    auto f = [&](const Eigen::VectorXd& x) { return 0.5 * x.dot(A * x) - b.dot(x); };

    for (auto _ : state) {
        auto result = multivariate_newton(f, Eigen::VectorXd::Zero(n));
        benchmark::DoNotOptimize(result);
    }
    state.SetComplexityN(n);
}
BENCHMARK(BM_MultivariateFiniteDifference)->RangeMultiplier(2)->Range(2, 32)->Complexity();

static void BM_MultivariateAnalytic(benchmark::State& state) {
    const Eigen::Index n = state.range(0);
    const Eigen::MatrixXd A = make_spd(n);
    const Eigen::VectorXd b = Eigen::VectorXd::Ones(n);
    auto f = [&](const Eigen::VectorXd& x) { return 0.5 * x.dot(A * x) - b.dot(x); };
    AnalyticDerivatives exact{
        [&](const Eigen::VectorXd& x) -> Eigen::VectorXd { return A * x - b; },
        [&](const Eigen::VectorXd&) -> Eigen::MatrixXd { return A; }};

    for (auto _ : state) {
        auto result = multivariate_newton(f, Eigen::VectorXd::Zero(n), exact);
        benchmark::DoNotOptimize(result);
    }
    state.SetComplexityN(n);
}
BENCHMARK(BM_MultivariateAnalytic)->RangeMultiplier(2)->Range(2, 32)->Complexity();

BENCHMARK_MAIN();
