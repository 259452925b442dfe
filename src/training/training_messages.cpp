#include "../../include/training/training_messages.hpp"
#include <cmath>

namespace {

nlohmann::json finite_or_null(double value) {
    if (!std::isfinite(value)) {
        return nullptr;
    }
    return value;
}

} // namespace

void to_json(nlohmann::json& j, const EpochResult& r) {
    j = nlohmann::json{{"epoch", r.epoch},
                       {"max_epochs", r.max_epochs},
                       {"theta0", r.theta0},
                       {"theta1", r.theta1},
                       {"cost", finite_or_null(r.cost)},
                       {"cost_change", finite_or_null(r.cost_change)},
                       {"converged", r.converged},
                       {"is_complete", r.is_complete},
                       {"rmse", r.rmse},
                       {"mae", r.mae},
                       {"r2", r.r2}};
}

void to_json(nlohmann::json& j, const MetricSummary& s) {
    j = nlohmann::json{
        {"min", s.min}, {"max", s.max}, {"current", s.current}, {"improvement", s.improvement}};
}

void to_json(nlohmann::json& j, const MetricsSummary& s) {
    j = nlohmann::json{{"rmse", s.rmse}, {"mae", s.mae}, {"r2", s.r2}};
}

void to_json(nlohmann::json& j, const ModelSummary& s) {
    j = nlohmann::json{{"normalized_theta0", s.normalized_theta0},
                       {"normalized_theta1", s.normalized_theta1},
                       {"original_theta0", s.original_theta0},
                       {"original_theta1", s.original_theta1},
                       {"equation_normalized", s.equation_normalized},
                       {"equation_original", s.equation_original},
                       {"training_examples", s.training_examples},
                       {"final_cost", finite_or_null(s.final_cost)}};
    if (s.metrics_summary) {
        j["metrics_summary"] = *s.metrics_summary;
    } else {
        j["metrics_summary"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const ReferenceFit& f) {
    j = nlohmann::json{{"intercept", f.intercept},
                       {"slope", f.slope},
                       {"predictions", f.predictions},
                       {"rmse", f.rmse},
                       {"mae", f.mae},
                       {"r2", f.r2},
                       {"equation", f.equation}};
}

void to_json(nlohmann::json& j, const FinalReport& r) {
    j = nlohmann::json{{"training_complete", true},
                       {"stopped", r.stopped},
                       {"diverged", r.diverged},
                       {"epochs_completed", r.epochs_completed},
                       {"final_theta0", r.final_params.theta0},
                       {"final_theta1", r.final_params.theta1},
                       {"equation", format_equation(r.final_params.theta0, r.final_params.theta1)},
                       {"test_mse", finite_or_null(r.test_mse)},
                       {"test_r2", finite_or_null(r.test_r2)},
                       {"x_range", {r.x_range.first, r.x_range.second}},
                       {"y_range", {r.y_range.first, r.y_range.second}},
                       {"final_rmse", r.final_metrics.rmse},
                       {"final_mae", r.final_metrics.mae},
                       {"final_r2", r.final_metrics.r2},
                       {"metrics_summary", r.model_summary}};

    nlohmann::json comparison;
    if (r.reference) {
        comparison["status"] = "success";
        comparison["results"] = *r.reference;
    } else {
        comparison["status"] = "failed";
        comparison["results"] = nullptr;
        comparison["message"] = r.reference_message;
    }
    j["reference_comparison"] = comparison;
}

nlohmann::json make_epoch_message(const EpochResult& result, const LinearParameters& original) {
    nlohmann::json j = result;
    j["type"] = "epoch";
    j["original_theta0"] = original.theta0;
    j["original_theta1"] = original.theta1;
    return j;
}

nlohmann::json make_final_message(const FinalReport& report) {
    nlohmann::json j = report;
    j["type"] = "final";
    return j;
}

nlohmann::json make_error_message(const std::string& message) {
    return nlohmann::json{{"type", "error"}, {"error", true}, {"message", message}};
}

std::string format_event(const nlohmann::json& message) {
    return "data: " + message.dump() + "\n\n";
}
