// include/forecast_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "forecast_ngin/core/config_base.hpp"

namespace forecast_ngin {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Per-step numerical detail
    DEBUG,    // Request flow detail
    INFO,     // Lifecycle events (bootstrap, persistence, tuning)
    WARNING,  // Recoverable anomalies
    ERR,      // Failed requests
    FATAL     // Unusable configuration
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,
    FILE,
    BOTH
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        default:
            return "UNKNOWN";
    }
}

inline LogLevel level_from_string(const std::string& value, LogLevel fallback) {
    if (value == "TRACE")
        return LogLevel::TRACE;
    if (value == "DEBUG")
        return LogLevel::DEBUG;
    if (value == "INFO")
        return LogLevel::INFO;
    if (value == "WARNING")
        return LogLevel::WARNING;
    if (value == "ERROR")
        return LogLevel::ERR;
    if (value == "FATAL")
        return LogLevel::FATAL;
    return fallback;
}

inline std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
        default:
            return "UNKNOWN";
    }
}

inline LogDestination log_destination_from_string(const std::string& value,
                                                  LogDestination fallback) {
    if (value == "CONSOLE")
        return LogDestination::CONSOLE;
    if (value == "FILE")
        return LogDestination::FILE;
    if (value == "BOTH")
        return LogDestination::BOTH;
    return fallback;
}

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"forecast_ngin"};
    bool include_timestamp{true};
    bool include_level{true};
    bool utc_timestamps{true};               // Forecast grids are UTC, keep logs aligned
    size_t max_file_size{50 * 1024 * 1024};  // 50MB per part
    size_t max_files{10};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["min_level"] = level_to_string(min_level);
        j["destination"] = log_destination_to_string(destination);
        j["log_directory"] = log_directory;
        j["filename_prefix"] = filename_prefix;
        j["include_timestamp"] = include_timestamp;
        j["include_level"] = include_level;
        j["utc_timestamps"] = utc_timestamps;
        j["max_file_size"] = max_file_size;
        j["max_files"] = max_files;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_level"))
            min_level = level_from_string(j.at("min_level").get<std::string>(), min_level);
        if (j.contains("destination"))
            destination =
                log_destination_from_string(j.at("destination").get<std::string>(), destination);
        if (j.contains("log_directory"))
            log_directory = j.at("log_directory").get<std::string>();
        if (j.contains("filename_prefix"))
            filename_prefix = j.at("filename_prefix").get<std::string>();
        if (j.contains("include_timestamp"))
            include_timestamp = j.at("include_timestamp").get<bool>();
        if (j.contains("include_level"))
            include_level = j.at("include_level").get<bool>();
        if (j.contains("utc_timestamps"))
            utc_timestamps = j.at("utc_timestamps").get<bool>();
        if (j.contains("max_file_size"))
            max_file_size = j.at("max_file_size").get<size_t>();
        if (j.contains("max_files"))
            max_files = j.at("max_files").get<size_t>();
    }
};

/**
 * @brief Thread-safe process-wide logger
 */
class Logger {
public:
    /**
     * @brief Get the singleton instance
     */
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @throws std::runtime_error if the log directory or file cannot be opened
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Close any open file and forget the session, for test isolation
     */
    static void reset_for_tests();

    /**
     * @brief Log a message with specified level
     */
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Path of the file currently written to, empty for console-only logging
     */
    std::filesystem::path current_file() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_path_;
    }

    /**
     * @brief Tag subsequent messages from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // All helpers below assume mutex_ is held
    void open_part();
    void enforce_retention(const std::filesystem::path& log_dir) const;
    void write_line(const std::string& line);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::filesystem::path current_path_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string session_stamp_;  // YYYYMMDD_HHMMSS
    int part_number_{1};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Bootstrapped " << asset << " var=" << var)
 */
#define LOG(level, message)                                                        \
    do {                                                                           \
        if (level >= ::forecast_ngin::Logger::instance().get_min_level()) {        \
            std::ostringstream os;                                                 \
            os << message;                                                         \
            ::forecast_ngin::Logger::instance().log(level, os.str());              \
        }                                                                          \
    } while (0)

#define TRACE(message) LOG(::forecast_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::forecast_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::forecast_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::forecast_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::forecast_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::forecast_ngin::LogLevel::FATAL, message)
}  // namespace forecast_ngin
