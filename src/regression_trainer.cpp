#include "../include/regression_trainer.hpp"
#include "../include/logger.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>

std::string format_equation(double intercept, double slope, const std::string& lhs,
                            const std::string& var) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << lhs << " = " << intercept << " + " << slope
        << " * " << var;
    return oss.str();
}

// ---------------------------------------------------------------------------
// EpochStream
// ---------------------------------------------------------------------------

EpochStream::EpochStream(RegressionTrainer& trainer, double learning_rate, size_t max_epochs,
                         double tolerance, bool early_stopping)
    : trainer_(trainer),
      learning_rate_(learning_rate),
      max_epochs_(max_epochs),
      tolerance_(tolerance),
      early_stopping_(early_stopping),
      previous_cost_(std::numeric_limits<double>::infinity()) {}

EpochStep EpochStream::finish(EpochStatus status, const std::string& message) {
    exhausted_ = true;
    EpochStep step;
    step.status = status;
    step.message = message;
    return step;
}

EpochStep EpochStream::next() {
    if (exhausted_ || epoch_ >= max_epochs_) {
        return finish(EpochStatus::Finished);
    }

    const size_t epoch = epoch_ + 1;
    LinearParameters theta = trainer_.theta_;
    double current_cost = 0.0;

    try {
        current_cost = trainer_.gradient_engine_->compute_cost(theta);
        Gradients grads = trainer_.gradient_engine_->compute_gradients(theta);

        theta.theta0 -= learning_rate_ * grads.theta0;
        theta.theta1 -= learning_rate_ * grads.theta1;
    } catch (const std::exception& e) {
        failed_ = true;
        Logger::getInstance().log("Epoch " + std::to_string(epoch) +
                                      " computation failed: " + std::string(e.what()),
                                  true);
        return finish(EpochStatus::Failed, e.what());
    }

    // Divergence ends the run silently; the last finite parameters stand
    if (!std::isfinite(theta.theta0) || !std::isfinite(theta.theta1)) {
        diverged_ = true;
        Logger::getInstance().log("Parameters diverged at epoch " + std::to_string(epoch) +
                                  ", stopping run");
        return finish(EpochStatus::Diverged, "Parameters became non-finite");
    }

    trainer_.theta_ = theta;

    double cost_change = std::abs(previous_cost_ - current_cost);
    bool converged = cost_change < tolerance_;

    if (early_stopping_ && converged) {
        no_improvement_++;
        if (no_improvement_ >= RegressionTrainer::EARLY_STOPPING_PATIENCE) {
            Logger::getInstance().log("Early stopping triggered after " + std::to_string(epoch) +
                                      " epochs (patience: " +
                                      std::to_string(RegressionTrainer::EARLY_STOPPING_PATIENCE) +
                                      ")");
            return finish(EpochStatus::Finished);
        }
    } else {
        no_improvement_ = 0;
    }

    epoch_ = epoch;
    RegressionMetrics metrics = trainer_.record_epoch_metrics(epoch);

    EpochStep step;
    step.status = EpochStatus::Epoch;
    step.result.epoch = epoch;
    step.result.max_epochs = max_epochs_;
    step.result.theta0 = theta.theta0;
    step.result.theta1 = theta.theta1;
    step.result.cost = current_cost;
    step.result.cost_change = cost_change;
    step.result.converged = converged;
    step.result.is_complete = epoch >= max_epochs_ || converged;
    step.result.rmse = metrics.rmse;
    step.result.mae = metrics.mae;
    step.result.r2 = metrics.r2;

    previous_cost_ = current_cost;

    if (epoch >= max_epochs_ || (converged && !early_stopping_)) {
        exhausted_ = true;
    }
    return step;
}

// ---------------------------------------------------------------------------
// RegressionTrainer
// ---------------------------------------------------------------------------

RegressionTrainer::RegressionTrainer(Series x_data, Series y_data, unsigned int random_seed)
    : x_original_(std::move(x_data)), y_original_(std::move(y_data)), rng_(random_seed) {
    rebuild_components();
}

void RegressionTrainer::rebuild_components() {
    if (x_original_.size() != y_original_.size()) {
        throw std::invalid_argument("x_data and y_data must have the same length");
    }

    auto normalizer = std::make_unique<DataNormalizer>(x_original_, y_original_);
    auto [x_norm, y_norm] = normalizer->normalize(x_original_, y_original_);
    auto engine = std::make_unique<CostGradientEngine>(std::move(x_norm), std::move(y_norm));

    normalizer_ = std::move(normalizer);
    gradient_engine_ = std::move(engine);
}

TrainTestSplit RegressionTrainer::train_test_split(double train_ratio) {
    if (!(train_ratio > 0.0 && train_ratio < 1.0)) {
        throw std::invalid_argument("train_ratio must be between 0.0 and 1.0");
    }

    const size_t n_samples = x_original_.size();
    const size_t n_train = static_cast<size_t>(std::floor(n_samples * train_ratio));

    std::vector<size_t> indices(n_samples);
    std::iota(indices.begin(), indices.end(), 0);
    std::shuffle(indices.begin(), indices.end(), rng_);

    TrainTestSplit split;
    split.x_train.reserve(n_train);
    split.y_train.reserve(n_train);
    split.x_test.reserve(n_samples - n_train);
    split.y_test.reserve(n_samples - n_train);

    for (size_t i = 0; i < n_samples; ++i) {
        size_t idx = indices[i];
        if (i < n_train) {
            split.x_train.push_back(x_original_[idx]);
            split.y_train.push_back(y_original_[idx]);
        } else {
            split.x_test.push_back(x_original_[idx]);
            split.y_test.push_back(y_original_[idx]);
        }
    }
    return split;
}

void RegressionTrainer::set_training_data(Series x_train, Series y_train) {
    Series previous_x = std::move(x_original_);
    Series previous_y = std::move(y_original_);
    x_original_ = std::move(x_train);
    y_original_ = std::move(y_train);

    try {
        rebuild_components();
    } catch (...) {
        x_original_ = std::move(previous_x);
        y_original_ = std::move(previous_y);
        throw;
    }
}

EpochStream RegressionTrainer::train_epoch_by_epoch(double learning_rate, size_t max_epochs,
                                                    double tolerance, bool early_stopping) {
    if (!(learning_rate > 0.0) || !std::isfinite(learning_rate)) {
        throw std::invalid_argument("learning_rate must be positive");
    }
    if (max_epochs == 0) {
        throw std::invalid_argument("max_epochs must be at least 1");
    }
    if (!(tolerance >= 0.0)) {
        throw std::invalid_argument("tolerance must be non-negative");
    }
    return EpochStream(*this, learning_rate, max_epochs, tolerance, early_stopping);
}

RegressionMetrics RegressionTrainer::record_epoch_metrics(size_t epoch) {
    try {
        Series predictions = predict(x_original_);
        return metrics_tracker_.calculate_metrics(y_original_, predictions, epoch);
    } catch (const std::exception& e) {
        Logger::getInstance().log("Metrics computation failed at epoch " + std::to_string(epoch) +
                                      ": " + std::string(e.what()),
                                  true);
        RegressionMetrics zeros;
        zeros.epoch = epoch;
        return zeros;
    }
}

Series RegressionTrainer::predict(const Series& x_values) const {
    try {
        Series x_norm = normalizer_->normalize_input(x_values);
        Series preds_norm(x_norm.size());
        for (size_t i = 0; i < x_norm.size(); ++i) {
            preds_norm[i] = theta_.theta0 + theta_.theta1 * x_norm[i];
        }
        return normalizer_->denormalize_predictions(preds_norm);
    } catch (const std::exception& e) {
        throw std::runtime_error("Prediction failed: " + std::string(e.what()));
    }
}

LinearParameters RegressionTrainer::get_original_scale_parameters() const {
    return normalizer_->get_original_scale_parameters(theta_.theta0, theta_.theta1);
}

std::optional<RegressionMetrics> RegressionTrainer::get_latest_metrics() const {
    return metrics_tracker_.get_latest_metrics();
}

ModelSummary RegressionTrainer::get_model_summary() const {
    LinearParameters original = get_original_scale_parameters();

    ModelSummary summary;
    summary.normalized_theta0 = theta_.theta0;
    summary.normalized_theta1 = theta_.theta1;
    summary.original_theta0 = original.theta0;
    summary.original_theta1 = original.theta1;
    summary.equation_normalized =
        format_equation(theta_.theta0, theta_.theta1, "y_norm", "x_norm");
    summary.equation_original = format_equation(original.theta0, original.theta1);
    summary.training_examples = x_original_.size();
    summary.final_cost = gradient_engine_->compute_cost(theta_);
    summary.metrics_summary = metrics_tracker_.get_metrics_summary();
    return summary;
}
