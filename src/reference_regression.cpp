#include "../include/reference_regression.hpp"
#include "../include/regression_trainer.hpp"
#include "../include/training/metrics_tracker.hpp"
#include <cmath>
#include <numeric>
#include <stdexcept>

ReferenceFit ReferenceRegression::fit(const Series& x, const Series& y) {
    if (x.empty() || y.empty()) {
        throw std::invalid_argument("Reference fit requires non-empty data");
    }
    if (x.size() != y.size()) {
        throw std::invalid_argument("x_data and y_data must have the same length");
    }

    const double n = static_cast<double>(x.size());
    const double x_mean = std::accumulate(x.begin(), x.end(), 0.0) / n;
    const double y_mean = std::accumulate(y.begin(), y.end(), 0.0) / n;

    double sxx = 0.0;
    double sxy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double dx = x[i] - x_mean;
        sxx += dx * dx;
        sxy += dx * (y[i] - y_mean);
    }

    if (!std::isfinite(sxx) || !std::isfinite(sxy)) {
        throw std::runtime_error("Reference fit failed: non-finite input");
    }

    ReferenceFit result;
    // Constant x: the least-squares slope is 0 and the line is the mean of y
    result.slope = sxx == 0.0 ? 0.0 : sxy / sxx;
    result.intercept = y_mean - result.slope * x_mean;

    result.predictions.resize(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        result.predictions[i] = result.intercept + result.slope * x[i];
    }

    result.rmse = MetricsTracker::calculate_rmse(y, result.predictions);
    result.mae = MetricsTracker::calculate_mae(y, result.predictions);
    result.r2 = MetricsTracker::calculate_r2(y, result.predictions);
    result.equation = format_equation(result.intercept, result.slope);
    return result;
}
