#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Thread-safe logging system for training runs.
 *
 * The Logger class implements a singleton pattern to provide centralized
 * logging functionality throughout the application. Features include:
 * - File output with optional mirroring to std::clog
 * - Error level distinction
 * - Timestamp recording
 * - Enable/disable control
 *
 * Standard output is left untouched since it carries the training event
 * stream.
 */
class Logger {
  private:
    std::ofstream log_file;      ///< Output file stream for logging
    bool logging_enabled;        ///< Whether logging is currently active
    bool console_echo;           ///< Mirror entries to std::clog
    std::string log_file_path;   ///< Path to the current log file
    std::mutex log_mutex;        ///< Serializes writers from control and training threads

    /// Singleton instance
    static std::unique_ptr<Logger> instance;
    static std::once_flag instance_flag;

    /**
     * @brief Private constructor for singleton pattern.
     *
     * Initializes logging system in disabled state with
     * no file output.
     */
    Logger();

    void closeFile();

  public:
    /**
     * @brief Gets the singleton logger instance.
     * @return Reference to the global logger
     */
    static Logger& getInstance();

    /**
     * @brief Starts logging to a file.
     *
     * Opens the specified file for logging. Creates directories if needed.
     *
     * @param file_path Path to log file (default: "regression_trainer.log")
     * @throws std::runtime_error if file cannot be opened
     */
    void startLogging(const std::string& file_path = "regression_trainer.log");

    /**
     * @brief Stops logging and closes the log file.
     */
    void stopLogging();

    /**
     * @brief Logs a message with optional error level.
     *
     * Writes a timestamped message to the log file and, when console echo
     * is on, to std::clog.
     *
     * @param message Text to log
     * @param is_error Whether to mark as error (default: false)
     */
    void log(const std::string& message, bool is_error = false);

    /**
     * @brief Checks if logging is currently enabled.
     * @return true if logging is active
     */
    bool isLoggingEnabled() const {
        return logging_enabled;
    }

    /**
     * @brief Temporarily disables logging.
     *
     * Stops writing entries but keeps the file open.
     */
    void disableLogging();

    /**
     * @brief Re-enables logging after disable.
     */
    void enableLogging();

    /**
     * @brief Mirrors every entry to std::clog.
     *
     * Works with or without a log file, so command-line runs can show
     * progress on stderr.
     */
    void setConsoleEcho(bool enabled);

    const std::string& getLogFilePath() const {
        return log_file_path;
    }

    // Prevent copying and assignment for singleton
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Destructor that ensures proper cleanup.
     */
    ~Logger();
};

#endif // LOGGER_HPP
