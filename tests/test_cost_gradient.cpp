#include "test_framework.hpp"
#include "../include/cost_gradient.hpp"
#include <cmath>

TEST(CostGradient, cost_and_gradients_at_origin) {
    CostGradientEngine engine({1.0, 2.0, 3.0}, {2.0, 4.0, 6.0});
    LinearParameters theta;

    TEST_APPROX(engine.compute_cost(theta), 56.0 / 6.0, 1e-12);

    Gradients grads = engine.compute_gradients(theta);
    TEST_APPROX(grads.theta0, -4.0, 1e-12);
    TEST_APPROX(grads.theta1, -28.0 / 3.0, 1e-12);
}

TEST(CostGradient, exact_fit_has_zero_cost_and_gradient) {
    CostGradientEngine engine({1.0, 2.0, 3.0}, {2.0, 4.0, 6.0});
    LinearParameters theta{0.0, 2.0};

    TEST_APPROX(engine.compute_cost(theta), 0.0, 1e-15);
    Gradients grads = engine.compute_gradients(theta);
    TEST_APPROX(grads.theta0, 0.0, 1e-15);
    TEST_APPROX(grads.theta1, 0.0, 1e-15);
}

TEST(CostGradient, rejects_empty_or_mismatched_series) {
    TEST_THROWS(CostGradientEngine(Series{}, Series{}), std::invalid_argument);
    TEST_THROWS(CostGradientEngine(Series{1.0, 2.0}, Series{1.0}), std::invalid_argument);
}

TEST(CostGradient, parallel_path_matches_serial_sums) {
    const size_t n = CostGradientEngine::PARALLEL_THRESHOLD + 1000;
    Series x(n), y(n);
    for (size_t i = 0; i < n; ++i) {
        x[i] = static_cast<double>(i % 97) / 97.0 - 0.5;
        y[i] = 3.0 * x[i] - 0.25 + 0.01 * std::sin(static_cast<double>(i));
    }
    CostGradientEngine engine(x, y);
    LinearParameters theta{0.1, 1.5};

    double sum_sq = 0.0, sum_err = 0.0, sum_w = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double e = theta.theta0 + theta.theta1 * x[i] - y[i];
        sum_sq += e * e;
        sum_err += e;
        sum_w += e * x[i];
    }

    TEST_APPROX(engine.compute_cost(theta), sum_sq / (2.0 * n), 1e-9);
    Gradients grads = engine.compute_gradients(theta);
    TEST_APPROX(grads.theta0, sum_err / n, 1e-9);
    TEST_APPROX(grads.theta1, sum_w / n, 1e-9);
    TEST_ASSERT(engine.size() == n);
}
