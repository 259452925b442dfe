#include "../../include/training/metrics_tracker.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

void MetricsTracker::check_inputs(const Series& y_true, const Series& y_pred) {
    if (y_true.empty()) {
        throw std::invalid_argument("Metrics require at least one sample");
    }
    if (y_true.size() != y_pred.size()) {
        throw std::invalid_argument("Predictions and targets must have the same size");
    }
}

double MetricsTracker::calculate_mse(const Series& y_true, const Series& y_pred) {
    check_inputs(y_true, y_pred);
    double sum_sq = 0.0;
    for (size_t i = 0; i < y_true.size(); ++i) {
        double err = y_true[i] - y_pred[i];
        sum_sq += err * err;
    }
    return sum_sq / y_true.size();
}

double MetricsTracker::calculate_rmse(const Series& y_true, const Series& y_pred) {
    return std::sqrt(calculate_mse(y_true, y_pred));
}

double MetricsTracker::calculate_mae(const Series& y_true, const Series& y_pred) {
    check_inputs(y_true, y_pred);
    double sum_abs = 0.0;
    for (size_t i = 0; i < y_true.size(); ++i) {
        sum_abs += std::abs(y_true[i] - y_pred[i]);
    }
    return sum_abs / y_true.size();
}

double MetricsTracker::calculate_r2(const Series& y_true, const Series& y_pred) {
    check_inputs(y_true, y_pred);
    double mean = std::accumulate(y_true.begin(), y_true.end(), 0.0) / y_true.size();

    double ss_res = 0.0;
    double ss_tot = 0.0;
    for (size_t i = 0; i < y_true.size(); ++i) {
        double res = y_true[i] - y_pred[i];
        double dev = y_true[i] - mean;
        ss_res += res * res;
        ss_tot += dev * dev;
    }

    if (ss_tot == 0.0) {
        return 0.0;
    }
    return 1.0 - ss_res / ss_tot;
}

RegressionMetrics MetricsTracker::calculate_metrics(const Series& y_true, const Series& y_pred,
                                                    size_t epoch) {
    RegressionMetrics metrics;
    metrics.rmse = calculate_rmse(y_true, y_pred);
    metrics.mae = calculate_mae(y_true, y_pred);
    metrics.r2 = calculate_r2(y_true, y_pred);
    metrics.epoch = epoch;

    history.push_back(metrics);
    return metrics;
}

std::optional<RegressionMetrics> MetricsTracker::get_latest_metrics() const {
    if (history.empty()) {
        return std::nullopt;
    }
    return history.back();
}

namespace {

template <typename Getter>
MetricSummary summarize(const std::vector<RegressionMetrics>& history, Getter get) {
    MetricSummary summary;
    auto [min_it, max_it] = std::minmax_element(
        history.begin(), history.end(),
        [&](const RegressionMetrics& a, const RegressionMetrics& b) { return get(a) < get(b); });
    summary.min = get(*min_it);
    summary.max = get(*max_it);
    summary.current = get(history.back());
    summary.improvement = history.size() > 1 ? get(history.front()) - get(history.back()) : 0.0;
    return summary;
}

} // namespace

std::optional<MetricsSummary> MetricsTracker::get_metrics_summary() const {
    if (history.empty()) {
        return std::nullopt;
    }

    MetricsSummary summary;
    summary.rmse = summarize(history, [](const RegressionMetrics& m) { return m.rmse; });
    summary.mae = summarize(history, [](const RegressionMetrics& m) { return m.mae; });
    summary.r2 = summarize(history, [](const RegressionMetrics& m) { return m.r2; });
    return summary;
}
