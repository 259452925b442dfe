#include "../include/cost_gradient.hpp"
#include <omp.h>
#include <stdexcept>
#include <utility>

CostGradientEngine::CostGradientEngine(Series x_norm, Series y_norm)
    : x_data(std::move(x_norm)), y_data(std::move(y_norm)), m(x_data.size()) {
    if (m == 0) {
        throw std::invalid_argument("Gradient descent requires at least one sample");
    }
    if (y_data.size() != m) {
        throw std::invalid_argument("x_data and y_data must have the same length");
    }
}

double CostGradientEngine::compute_cost(const LinearParameters& theta) const {
    const double* x = x_data.data();
    const double* y = y_data.data();
    const long long n = static_cast<long long>(m);
    double sum_sq = 0.0;

    #pragma omp parallel for reduction(+:sum_sq) if(m >= PARALLEL_THRESHOLD)
    for (long long i = 0; i < n; ++i) {
        double error = theta.theta0 + theta.theta1 * x[i] - y[i];
        sum_sq += error * error;
    }

    return sum_sq / (2.0 * static_cast<double>(m));
}

Gradients CostGradientEngine::compute_gradients(const LinearParameters& theta) const {
    const double* x = x_data.data();
    const double* y = y_data.data();
    const long long n = static_cast<long long>(m);
    double sum_error = 0.0;
    double sum_weighted = 0.0;

    #pragma omp parallel for reduction(+:sum_error, sum_weighted) if(m >= PARALLEL_THRESHOLD)
    for (long long i = 0; i < n; ++i) {
        double error = theta.theta0 + theta.theta1 * x[i] - y[i];
        sum_error += error;
        sum_weighted += error * x[i];
    }

    Gradients grads;
    grads.theta0 = sum_error / static_cast<double>(m);
    grads.theta1 = sum_weighted / static_cast<double>(m);
    return grads;
}
