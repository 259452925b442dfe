#pragma once
#include "../config.hpp"
#include "../csv_loader.hpp"
#include "../regression_trainer.hpp"
#include "training_messages.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

/**
 * @brief Drives one streamed training run and its pause/resume/stop control.
 *
 * start() prepares a run on the calling thread, run() computes and emits the
 * epochs, and the control calls may come from any other thread. The
 * active/paused pair is the only state shared between them.
 *
 * A start() after stop() may overlap with the previous run() still draining;
 * that run sees a newer generation, ends as stopped and leaves the new
 * session's flags alone.
 */
class TrainingSession {
  public:
    using MessageSink = std::function<void(const nlohmann::json&)>;

    explicit TrainingSession(SessionConfig config = SessionConfig());

    void set_dataset(CleanedDataset dataset);
    bool has_dataset() const;

    /**
     * @brief Builds the model, splits the data and marks the session active.
     * @throws std::invalid_argument on invalid parameters
     * @throws std::runtime_error without a dataset or while a run is active
     */
    void start(const TrainingParameters& params);

    /**
     * @brief Runs the started session to its end, emitting every message to sink.
     *
     * Emits one "epoch" message per completed epoch and then one "final"
     * message, or a single "error" message if the run fails. Never throws for
     * training failures; the session is idle again when it returns.
     */
    void run(const MessageSink& sink);

    std::string pause();
    std::string resume();
    std::string stop();

    bool is_active() const;
    bool is_paused() const;

    /// Model of the last run that reached its final message, or nullptr.
    std::shared_ptr<RegressionTrainer> trained_model() const;

    /// Pacing delay for a speed setting, scaled by the session's pacing scale.
    std::chrono::duration<double> training_delay(double training_speed) const;

    /// Unscaled delay in seconds for the nearest of 1.0, 0.8, 0.6, 0.4, 0.2.
    static double base_delay_seconds(double training_speed);

  private:
    SessionConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool active_ = false;
    bool paused_ = false;
    size_t generation_ = 0;  ///< Bumped by every start(); a run only acts while it matches

    std::optional<CleanedDataset> dataset_;
    TrainingParameters params_;
    TrainTestSplit split_;
    std::shared_ptr<RegressionTrainer> current_model_;
    std::shared_ptr<RegressionTrainer> trained_model_;

    bool is_current(size_t generation) const;
    bool wait_while_paused(size_t generation);
    void pace(std::chrono::duration<double> delay, size_t generation);
    void reset_flags(size_t generation);

    FinalReport build_final_report(RegressionTrainer& model, const CleanedDataset& dataset,
                                   const TrainTestSplit& split, const EpochStream& stream,
                                   bool stopped) const;
};
