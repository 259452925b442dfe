#include "../include/logger.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>

std::unique_ptr<Logger> Logger::instance = nullptr;
std::once_flag Logger::instance_flag;

Logger::Logger() : logging_enabled(false), console_echo(false) {}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(log_mutex);
    closeFile();
}

Logger& Logger::getInstance() {
    std::call_once(instance_flag, []() { instance = std::unique_ptr<Logger>(new Logger()); });
    return *instance;
}

void Logger::startLogging(const std::string& file_path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    closeFile();

    log_file_path = file_path;

    // Create directories if they don't exist
    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    log_file.open(file_path, std::ios::out | std::ios::trunc);
    if (!log_file.is_open()) {
        throw std::runtime_error("Failed to open log file: " + file_path);
    }

    logging_enabled = true;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    log_file << "=== Logging started at " << std::ctime(&time) << "===" << std::endl;
}

void Logger::stopLogging() {
    std::lock_guard<std::mutex> lock(log_mutex);
    closeFile();
    logging_enabled = console_echo;
}

void Logger::closeFile() {
    if (!log_file.is_open()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    log_file << "\n=== Logging stopped at " << std::ctime(&time) << "===" << std::endl;
    log_file.close();
}

void Logger::disableLogging() {
    std::lock_guard<std::mutex> lock(log_mutex);
    logging_enabled = false;
}

void Logger::enableLogging() {
    std::lock_guard<std::mutex> lock(log_mutex);
    logging_enabled = log_file.is_open() || console_echo;
}

void Logger::setConsoleEcho(bool enabled) {
    std::lock_guard<std::mutex> lock(log_mutex);
    console_echo = enabled;
    if (enabled) {
        logging_enabled = true;
    } else if (!log_file.is_open()) {
        logging_enabled = false;
    }
}

void Logger::log(const std::string& message, bool is_error) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!logging_enabled) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::string timestamp(std::ctime(&time));
    timestamp = timestamp.substr(0, timestamp.length() - 1); // Remove trailing newline

    const char* level = is_error ? "ERROR: " : "INFO: ";
    if (log_file.is_open()) {
        log_file << "[" << timestamp << "] " << level << message << std::endl;
    }
    if (console_echo) {
        std::clog << "[" << timestamp << "] " << level << message << std::endl;
    }
}
