#include "../include/config.hpp"
#include "../include/csv_loader.hpp"
#include "../include/logger.hpp"
#include "../include/training/session_control.hpp"
#include "../include/training/training_session.hpp"
#include <atomic>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [config.json] [--data file.csv] [--analyze]\n"
              << "Commands on stdin while training: pause, resume, stop" << std::endl;
}

// Reads stdin commands for the session; replies go to stderr. Joined on
// scope exit so the reader never outlives main.
class ControlThread {
  public:
    explicit ControlThread(TrainingSession& session)
        : thread_([this, &session]() {
              read_session_commands(STDIN_FILENO, session, done_, std::cerr);
          }) {}

    ~ControlThread() {
        done_ = true;
        thread_.join();
    }

    ControlThread(const ControlThread&) = delete;
    ControlThread& operator=(const ControlThread&) = delete;

  private:
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/training_config.json";
    std::string data_override;
    bool config_given = false;
    bool analyze_only = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--data" && i + 1 < argc) {
            data_override = argv[++i];
        } else if (arg == "--analyze") {
            analyze_only = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-') {
            config_path = arg;
            config_given = true;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    Logger& logger = Logger::getInstance();

    try {
        AppConfig config;
        if (config_given || std::filesystem::exists(config_path)) {
            config.load_from_json(config_path);
        }
        if (!data_override.empty()) {
            config.data.csv_path = data_override;
        }

        if (config.logging.enabled) {
            logger.startLogging(config.logging.log_file);
            logger.setConsoleEcho(config.logging.console_echo);
        } else {
            logger.disableLogging();
        }

        if (config.data.csv_path.empty()) {
            throw std::runtime_error("No CSV file given (set data.csv_path or pass --data)");
        }

        CSVLoader loader(config.data.x_column, config.data.y_column);
        CSVTable table = CSVLoader::read_csv_file(config.data.csv_path);

        DataQualityReport report = loader.analyze_data_quality(table);
        std::cerr << "Data quality (" << report.total_rows << " rows):" << std::endl;
        for (const auto& line : report.summary) {
            std::cerr << "  " << line << std::endl;
        }
        if (analyze_only) {
            logger.stopLogging();
            return 0;
        }

        CleaningOptions options;
        options.remove_duplicates = config.data.remove_duplicates;
        options.remove_outliers = config.data.remove_outliers;
        options.handle_missing = config.data.handle_missing;
        options.remove_strings = config.data.remove_strings;

        CleanedDataset dataset = loader.clean_data(table, options);
        const CleaningSummary& summary = loader.get_cleaning_summary();
        std::cerr << "Cleaned " << summary.original_rows << " -> " << summary.cleaned_rows
                  << " rows (duplicates " << summary.duplicates_removed << ", outliers "
                  << summary.outliers_removed << ", missing " << summary.missing_values_removed
                  << ", non-numeric " << summary.non_numeric_removed << ")" << std::endl;

        TrainingSession session(config.session);
        session.set_dataset(std::move(dataset));
        session.start(config.training);

        ControlThread control(session);
        session.run([](const nlohmann::json& message) {
            std::cout << format_event(message) << std::flush;
        });
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        logger.log(e.what(), true);
        logger.stopLogging();
        return 1;
    }

    logger.stopLogging();
    return 0;
}
