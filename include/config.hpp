#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Hyperparameters of one training run.
 */
struct TrainingParameters {
    double learning_rate = 0.01;
    size_t max_epochs = 1000;
    double tolerance = 1e-6;
    bool early_stopping = true;
    double train_split = 0.8;
    double training_speed = 1.0;             ///< nearest of 1.0, 0.8, 0.6, 0.4, 0.2
    std::optional<unsigned int> random_seed; ///< fixed split when set

    /**
     * @brief Checks ranges.
     * @throws std::invalid_argument naming the first offending field
     */
    void validate() const;
};

struct DataConfig {
    std::string csv_path;
    std::string x_column = "x";
    std::string y_column = "y";
    bool remove_duplicates = true;
    bool remove_outliers = false;
    std::string handle_missing = "remove";
    bool remove_strings = true;
};

struct SessionConfig {
    size_t pause_poll_interval_ms = 500;
    double pacing_scale = 1.0;  ///< multiplies the per-speed epoch delay
};

struct LoggingConfig {
    bool enabled = true;
    std::string log_file = "logs/regression_trainer.log";
    bool console_echo = false;
};

/**
 * @brief Configuration of the command-line trainer.
 *
 * Groups the settings of every component:
 * - Training hyperparameters
 * - Input data and cleaning options
 * - Session pacing and pause polling
 * - Logging
 */
struct AppConfig {
    TrainingParameters training;
    DataConfig data;
    SessionConfig session;
    LoggingConfig logging;

    /**
     * @brief Loads configuration from a JSON file.
     *
     * Missing sections and keys keep their defaults.
     *
     * @throws std::runtime_error if the file cannot be read or holds invalid values
     */
    void load_from_json(const std::string& config_path);

    /// Same as load_from_json() for an already parsed document.
    void load_from_json(const nlohmann::json& j);
};

// JSON serialization declarations
void to_json(nlohmann::json& j, const TrainingParameters& p);
void from_json(const nlohmann::json& j, TrainingParameters& p);

void to_json(nlohmann::json& j, const SessionConfig& s);
void from_json(const nlohmann::json& j, SessionConfig& s);

#endif // CONFIG_HPP
