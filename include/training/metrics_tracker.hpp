#pragma once
#include "../types.hpp"
#include <optional>
#include <vector>

/// Regression metrics recorded for one epoch (original scale).
struct RegressionMetrics {
    double rmse = 0.0;
    double mae = 0.0;
    double r2 = 0.0;
    size_t epoch = 0;
};

struct MetricSummary {
    double min = 0.0;
    double max = 0.0;
    double current = 0.0;
    double improvement = 0.0;  ///< first recorded value minus the latest one
};

struct MetricsSummary {
    MetricSummary rmse;
    MetricSummary mae;
    MetricSummary r2;
};

/**
 * @brief Per-epoch RMSE / MAE / R^2 accumulator for one training run.
 *
 * History is append-only; a new run gets a new tracker.
 */
class MetricsTracker {
  public:
    /**
     * @brief Computes the metrics for one epoch and appends them to the history.
     * @throws std::invalid_argument on empty or mismatched series (nothing is recorded)
     */
    RegressionMetrics calculate_metrics(const Series& y_true, const Series& y_pred, size_t epoch);

    std::optional<RegressionMetrics> get_latest_metrics() const;
    std::optional<MetricsSummary> get_metrics_summary() const;
    const std::vector<RegressionMetrics>& get_metrics_history() const { return history; }
    size_t get_epoch_count() const { return history.size(); }

    static double calculate_mse(const Series& y_true, const Series& y_pred);
    static double calculate_rmse(const Series& y_true, const Series& y_pred);
    static double calculate_mae(const Series& y_true, const Series& y_pred);
    // 0.0 for a constant target, where SS_tot is zero
    static double calculate_r2(const Series& y_true, const Series& y_pred);

  private:
    std::vector<RegressionMetrics> history;

    static void check_inputs(const Series& y_true, const Series& y_pred);
};
