#include "../include/config.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

void TrainingParameters::validate() const {
    if (!(learning_rate > 0.0) || !std::isfinite(learning_rate)) {
        throw std::invalid_argument("learning_rate must be positive");
    }
    if (max_epochs < 1) {
        throw std::invalid_argument("max_epochs must be at least 1");
    }
    if (!(tolerance >= 0.0)) {
        throw std::invalid_argument("tolerance must be non-negative");
    }
    if (!(train_split > 0.0 && train_split < 1.0)) {
        throw std::invalid_argument("train_split must be between 0.0 and 1.0");
    }
    if (!(training_speed > 0.0) || !std::isfinite(training_speed)) {
        throw std::invalid_argument("training_speed must be positive");
    }
}

void to_json(nlohmann::json& j, const TrainingParameters& p) {
    j = nlohmann::json{{"learning_rate", p.learning_rate},
                       {"max_epochs", p.max_epochs},
                       {"tolerance", p.tolerance},
                       {"early_stopping", p.early_stopping},
                       {"train_split", p.train_split},
                       {"training_speed", p.training_speed}};
    if (p.random_seed) {
        j["random_seed"] = *p.random_seed;
    }
}

void from_json(const nlohmann::json& j, TrainingParameters& p) {
    p.learning_rate = j.value("learning_rate", p.learning_rate);
    // Read signed so a negative count is rejected instead of wrapping
    long long max_epochs = j.value("max_epochs", static_cast<long long>(p.max_epochs));
    if (max_epochs < 1) {
        throw std::invalid_argument("max_epochs must be at least 1");
    }
    p.max_epochs = static_cast<size_t>(max_epochs);
    p.tolerance = j.value("tolerance", p.tolerance);
    p.early_stopping = j.value("early_stopping", p.early_stopping);
    p.train_split = j.value("train_split", p.train_split);
    p.training_speed = j.value("training_speed", p.training_speed);
    if (j.contains("random_seed") && !j["random_seed"].is_null()) {
        p.random_seed = j["random_seed"].get<unsigned int>();
    }
}

void to_json(nlohmann::json& j, const SessionConfig& s) {
    j = nlohmann::json{{"pause_poll_interval_ms", s.pause_poll_interval_ms},
                       {"pacing_scale", s.pacing_scale}};
}

void from_json(const nlohmann::json& j, SessionConfig& s) {
    long long poll_ms =
        j.value("pause_poll_interval_ms", static_cast<long long>(s.pause_poll_interval_ms));
    if (poll_ms < 1) {
        throw std::invalid_argument("pause_poll_interval_ms must be positive");
    }
    s.pause_poll_interval_ms = static_cast<size_t>(poll_ms);
    s.pacing_scale = j.value("pacing_scale", s.pacing_scale);
}

void AppConfig::load_from_json(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw std::runtime_error("Error loading config from JSON: Could not open config file: " +
                                 config_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("Error loading config from JSON: " + std::string(e.what()));
    }
    load_from_json(j);
}

void AppConfig::load_from_json(const nlohmann::json& j) {
    try {
        // Load training parameters
        if (j.contains("training")) {
            from_json(j["training"], training);
            training.validate();
        }

        // Load data source and cleaning options
        if (j.contains("data")) {
            const auto& d = j["data"];
            data.csv_path = d.value("csv_path", data.csv_path);
            data.x_column = d.value("x_column", data.x_column);
            data.y_column = d.value("y_column", data.y_column);
            data.remove_duplicates = d.value("remove_duplicates", data.remove_duplicates);
            data.remove_outliers = d.value("remove_outliers", data.remove_outliers);
            data.handle_missing = d.value("handle_missing", data.handle_missing);
            data.remove_strings = d.value("remove_strings", data.remove_strings);
        }

        // Load session pacing
        if (j.contains("session")) {
            from_json(j["session"], session);
            if (session.pacing_scale < 0.0) {
                throw std::invalid_argument("pacing_scale must be non-negative");
            }
        }

        // Load logging settings
        if (j.contains("logging")) {
            const auto& l = j["logging"];
            logging.enabled = l.value("enabled", logging.enabled);
            logging.log_file = l.value("log_file", logging.log_file);
            logging.console_echo = l.value("console_echo", logging.console_echo);
        }
    } catch (const std::exception& e) {
        throw std::runtime_error("Error loading config from JSON: " + std::string(e.what()));
    }
}
