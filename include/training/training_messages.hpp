#pragma once
#include "../reference_regression.hpp"
#include "../regression_trainer.hpp"
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

/**
 * @brief Everything reported once a session run has ended.
 *
 * Ranges cover the full dataset; test metrics cover the held-out split.
 */
struct FinalReport {
    bool stopped = false;
    bool diverged = false;
    size_t epochs_completed = 0;
    LinearParameters final_params;
    double test_mse = 0.0;
    double test_r2 = 0.0;
    std::pair<double, double> x_range{0.0, 0.0};
    std::pair<double, double> y_range{0.0, 0.0};
    RegressionMetrics final_metrics;
    ModelSummary model_summary;
    std::optional<ReferenceFit> reference;
    std::string reference_message;  ///< set when the reference fit failed
};

void to_json(nlohmann::json& j, const EpochResult& r);
void to_json(nlohmann::json& j, const MetricSummary& s);
void to_json(nlohmann::json& j, const MetricsSummary& s);
void to_json(nlohmann::json& j, const ModelSummary& s);
void to_json(nlohmann::json& j, const ReferenceFit& f);
void to_json(nlohmann::json& j, const FinalReport& r);

// Stream message builders; every message carries a "type" field
nlohmann::json make_epoch_message(const EpochResult& result, const LinearParameters& original);
nlohmann::json make_final_message(const FinalReport& report);
nlohmann::json make_error_message(const std::string& message);

/// Frames one message as "data: <json>\n\n".
std::string format_event(const nlohmann::json& message);
