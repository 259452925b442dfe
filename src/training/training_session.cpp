#include "../../include/training/training_session.hpp"
#include "../../include/logger.hpp"
#include "../../include/reference_regression.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <random>
#include <stdexcept>
#include <utility>

namespace {

// Resets the session flags on every exit path of run()
class FlagReset {
  public:
    explicit FlagReset(std::function<void()> reset) : reset_(std::move(reset)) {}
    ~FlagReset() { reset_(); }

    FlagReset(const FlagReset&) = delete;
    FlagReset& operator=(const FlagReset&) = delete;

  private:
    std::function<void()> reset_;
};

} // namespace

TrainingSession::TrainingSession(SessionConfig config) : config_(config) {}

void TrainingSession::set_dataset(CleanedDataset dataset) {
    std::lock_guard<std::mutex> lock(mutex_);
    dataset_ = std::move(dataset);
}

bool TrainingSession::has_dataset() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dataset_.has_value();
}

void TrainingSession::start(const TrainingParameters& params) {
    params.validate();

    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        throw std::runtime_error("Training already in progress");
    }
    if (!dataset_) {
        Logger::getInstance().log("Attempted to start training without cleaned data", true);
        throw std::runtime_error("No cleaned data available for training");
    }

    unsigned int seed = params.random_seed ? *params.random_seed : std::random_device{}();
    auto model = std::make_shared<RegressionTrainer>(dataset_->x, dataset_->y, seed);
    TrainTestSplit split = model->train_test_split(params.train_split);
    model->set_training_data(split.x_train, split.y_train);

    params_ = params;
    split_ = std::move(split);
    current_model_ = std::move(model);
    active_ = true;
    paused_ = false;
    ++generation_;
    // Wakes a previous run still pacing so it sees the new generation
    cv_.notify_all();

    Logger::getInstance().log("Training setup complete: train_ratio=" +
                              std::to_string(params.train_split) +
                              ", train_size=" + std::to_string(split_.x_train.size()));
}

void TrainingSession::run(const MessageSink& sink) {
    std::shared_ptr<RegressionTrainer> model;
    TrainingParameters params;
    TrainTestSplit split;
    CleanedDataset dataset;
    size_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_ || !current_model_ || !dataset_) {
            Logger::getInstance().log("run() called without a started training session", true);
            sink(make_error_message("No active training session"));
            return;
        }
        model = current_model_;
        params = params_;
        split = split_;
        dataset = *dataset_;
        generation = generation_;
    }

    FlagReset reset([this, generation]() { reset_flags(generation); });

    try {
        Logger::getInstance().log("Training stream started: epochs=" +
                                  std::to_string(params.max_epochs) +
                                  ", lr=" + std::to_string(params.learning_rate) +
                                  ", early_stopping=" + (params.early_stopping ? "true" : "false"));

        EpochStream stream = model->train_epoch_by_epoch(params.learning_rate, params.max_epochs,
                                                         params.tolerance, params.early_stopping);
        const auto delay = training_delay(params.training_speed);
        bool stopped = false;

        while (true) {
            if (!wait_while_paused(generation)) {
                Logger::getInstance().log("Training stream stopped by request");
                stopped = true;
                break;
            }

            EpochStep step = stream.next();
            if (step.status == EpochStatus::Finished) {
                break;
            }
            if (step.status == EpochStatus::Diverged || step.status == EpochStatus::Failed) {
                Logger::getInstance().log("Training ended early: " + step.message, true);
                break;
            }

            sink(make_epoch_message(step.result, model->get_original_scale_parameters()));

            if (stream.exhausted()) {
                break;
            }
            if (!step.result.is_complete) {
                pace(delay, generation);
            }
        }

        FinalReport report = build_final_report(*model, dataset, split, stream, stopped);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            trained_model_ = model;
        }
        Logger::getInstance().log("Training stream completed after " +
                                  std::to_string(report.epochs_completed) + " epochs");
        sink(make_final_message(report));
    } catch (const std::exception& e) {
        Logger::getInstance().log("Training stream failed: " + std::string(e.what()), true);
        sink(make_error_message(e.what()));
    }
}

FinalReport TrainingSession::build_final_report(RegressionTrainer& model,
                                                const CleanedDataset& dataset,
                                                const TrainTestSplit& split,
                                                const EpochStream& stream, bool stopped) const {
    FinalReport report;
    report.stopped = stopped;
    report.diverged = stream.diverged();
    report.epochs_completed = stream.epochs_completed();

    try {
        Series test_predictions = model.predict(split.x_test);
        report.test_mse = MetricsTracker::calculate_mse(split.y_test, test_predictions);
        report.test_r2 = MetricsTracker::calculate_r2(split.y_test, test_predictions);
    } catch (const std::exception& e) {
        Logger::getInstance().log("Final results computation failed; defaulting metrics: " +
                                      std::string(e.what()),
                                  true);
        report.test_mse = 0.0;
        report.test_r2 = 0.0;
    }

    report.final_params = model.get_original_scale_parameters();
    auto x_bounds = std::minmax_element(dataset.x.begin(), dataset.x.end());
    auto y_bounds = std::minmax_element(dataset.y.begin(), dataset.y.end());
    report.x_range = {*x_bounds.first, *x_bounds.second};
    report.y_range = {*y_bounds.first, *y_bounds.second};
    report.final_metrics = model.get_latest_metrics().value_or(RegressionMetrics());
    report.model_summary = model.get_model_summary();

    try {
        report.reference = ReferenceRegression::fit(dataset.x, dataset.y);
    } catch (const std::exception& e) {
        Logger::getInstance().log("Reference comparison failed: " + std::string(e.what()), true);
        report.reference_message = e.what();
    }
    return report;
}

// Caller holds mutex_
bool TrainingSession::is_current(size_t generation) const {
    return active_ && generation_ == generation;
}

bool TrainingSession::wait_while_paused(size_t generation) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (paused_ && is_current(generation)) {
        Logger::getInstance().log("Training paused; waiting...");
    }
    while (paused_ && is_current(generation)) {
        cv_.wait_for(lock, std::chrono::milliseconds(config_.pause_poll_interval_ms));
    }
    return is_current(generation);
}

void TrainingSession::pace(std::chrono::duration<double> delay, size_t generation) {
    if (delay.count() <= 0.0) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, delay, [this, generation]() { return !is_current(generation); });
}

void TrainingSession::reset_flags(size_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ != generation) {
            Logger::getInstance().log("Previous training run finished; newer session left active");
            return;
        }
        active_ = false;
        paused_ = false;
    }
    cv_.notify_all();
    Logger::getInstance().log("Training state cleaned up");
}

std::string TrainingSession::pause() {
    std::string message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ && !paused_) {
            paused_ = true;
            message = "Training paused";
        } else if (paused_) {
            message = "Training already paused";
        } else {
            message = "No active training to pause";
        }
    }
    cv_.notify_all();
    Logger::getInstance().log(message);
    return message;
}

std::string TrainingSession::resume() {
    std::string message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ && paused_) {
            paused_ = false;
            message = "Training resumed";
        } else if (!paused_) {
            message = "Training not paused";
        } else {
            message = "No active training to resume";
        }
    }
    cv_.notify_all();
    Logger::getInstance().log(message);
    return message;
}

std::string TrainingSession::stop() {
    std::string message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_) {
            active_ = false;
            paused_ = false;
            message = "Training stop requested";
        } else {
            message = "No active training to stop";
        }
    }
    cv_.notify_all();
    Logger::getInstance().log(message);
    return message;
}

bool TrainingSession::is_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

bool TrainingSession::is_paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

std::shared_ptr<RegressionTrainer> TrainingSession::trained_model() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trained_model_;
}

double TrainingSession::base_delay_seconds(double training_speed) {
    static constexpr std::array<std::pair<double, double>, 5> SPEED_DELAYS = {
        {{1.0, 0.1}, {0.8, 0.3}, {0.6, 0.6}, {0.4, 1.0}, {0.2, 1.5}}};

    auto closest = std::min_element(
        SPEED_DELAYS.begin(), SPEED_DELAYS.end(), [training_speed](const auto& a, const auto& b) {
            return std::abs(a.first - training_speed) < std::abs(b.first - training_speed);
        });
    return closest->second;
}

std::chrono::duration<double> TrainingSession::training_delay(double training_speed) const {
    return std::chrono::duration<double>(base_delay_seconds(training_speed) * config_.pacing_scale);
}
