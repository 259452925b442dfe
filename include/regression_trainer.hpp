#pragma once
#include "cost_gradient.hpp"
#include "normalizer.hpp"
#include "training/metrics_tracker.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <random>
#include <string>

/**
 * @brief Training state after one gradient-descent epoch.
 *
 * theta0/theta1 are normalized-space parameters; rmse/mae/r2 are computed on
 * original-scale predictions over the full training set.
 */
struct EpochResult {
    size_t epoch = 0;
    size_t max_epochs = 0;
    double theta0 = 0.0;
    double theta1 = 0.0;
    double cost = 0.0;
    double cost_change = 0.0;
    bool converged = false;
    bool is_complete = false;
    double rmse = 0.0;
    double mae = 0.0;
    double r2 = 0.0;
};

enum class EpochStatus {
    Epoch,     ///< an epoch was computed, result is valid
    Finished,  ///< max epochs, convergence or early stopping ended the run
    Diverged,  ///< parameters became non-finite; the step was dropped
    Failed     ///< cost or gradient computation threw
};

struct EpochStep {
    EpochStatus status = EpochStatus::Finished;
    EpochResult result;
    std::string message;
};

struct TrainTestSplit {
    Series x_train;
    Series y_train;
    Series x_test;
    Series y_test;
};

struct ModelSummary {
    double normalized_theta0 = 0.0;
    double normalized_theta1 = 0.0;
    double original_theta0 = 0.0;
    double original_theta1 = 0.0;
    std::string equation_normalized;
    std::string equation_original;
    size_t training_examples = 0;
    double final_cost = 0.0;
    std::optional<MetricsSummary> metrics_summary;
};

class RegressionTrainer;

/**
 * @brief One gradient-descent run, produced an epoch at a time.
 *
 * Each call to next() performs one epoch on the owning trainer and returns a
 * tagged step. Once exhausted() is true every further call returns a
 * Finished step. The trainer must outlive the stream.
 */
class EpochStream {
  public:
    EpochStep next();

    /// True once the run has ended; the last Epoch step was the final one.
    bool exhausted() const { return exhausted_; }
    bool diverged() const { return diverged_; }
    bool failed() const { return failed_; }
    size_t epochs_completed() const { return epoch_; }

  private:
    friend class RegressionTrainer;

    EpochStream(RegressionTrainer& trainer, double learning_rate, size_t max_epochs,
                double tolerance, bool early_stopping);

    RegressionTrainer& trainer_;
    double learning_rate_;
    size_t max_epochs_;
    double tolerance_;
    bool early_stopping_;

    size_t epoch_ = 0;
    double previous_cost_;
    size_t no_improvement_ = 0;
    bool exhausted_ = false;
    bool diverged_ = false;
    bool failed_ = false;

    EpochStep finish(EpochStatus status, const std::string& message = "");
};

/**
 * @brief Univariate linear regression trained by batch gradient descent.
 *
 * Data is normalized before training for numeric stability; parameters,
 * predictions and metrics are reported on the original scale.
 */
class RegressionTrainer {
  public:
    /// Consecutive low-improvement epochs that end a run with early stopping
    static constexpr size_t EARLY_STOPPING_PATIENCE = 15;

    /**
     * @brief Stores the data and builds the normalizer and cost engine.
     * @throws std::invalid_argument on empty or mismatched series
     * @throws std::runtime_error on non-finite values
     */
    RegressionTrainer(Series x_data, Series y_data,
                      unsigned int random_seed = std::random_device{}());

    /**
     * @brief Randomly splits the current data into train and test sets.
     *
     * The first floor(n * train_ratio) permuted indices form the training set.
     *
     * @throws std::invalid_argument unless 0 < train_ratio < 1
     */
    TrainTestSplit train_test_split(double train_ratio = 0.8);

    /**
     * @brief Replaces the data and rebuilds normalizer and cost engine.
     *
     * Parameters are kept, so a following run continues from them.
     */
    void set_training_data(Series x_train, Series y_train);

    /**
     * @brief Starts a new gradient-descent run from the current parameters.
     * @throws std::invalid_argument on a non-positive learning rate, zero
     *         max_epochs or a negative tolerance
     */
    EpochStream train_epoch_by_epoch(double learning_rate, size_t max_epochs,
                                     double tolerance = 1e-6, bool early_stopping = true);

    /**
     * @brief Predicts on the original scale.
     * @throws std::runtime_error on non-finite input
     */
    Series predict(const Series& x_values) const;

    ModelSummary get_model_summary() const;
    std::optional<RegressionMetrics> get_latest_metrics() const;
    LinearParameters get_original_scale_parameters() const;
    LinearParameters get_normalized_parameters() const { return theta_; }
    size_t training_examples() const { return x_original_.size(); }
    const MetricsTracker& metrics() const { return metrics_tracker_; }
    const DataNormalizer& normalizer() const { return *normalizer_; }

  private:
    friend class EpochStream;

    Series x_original_;
    Series y_original_;
    std::unique_ptr<DataNormalizer> normalizer_;
    std::unique_ptr<CostGradientEngine> gradient_engine_;
    MetricsTracker metrics_tracker_;
    LinearParameters theta_;
    std::mt19937 rng_;

    void rebuild_components();
    RegressionMetrics record_epoch_metrics(size_t epoch);
};

/// Formats "<lhs> = a + b * <var>" with four decimals.
std::string format_equation(double intercept, double slope, const std::string& lhs = "y",
                            const std::string& var = "x");
