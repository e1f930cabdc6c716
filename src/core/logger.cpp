// src/core/logger.cpp

#include "forecast_ngin/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <vector>
#include "forecast_ngin/core/time_utils.hpp"

namespace forecast_ngin {

thread_local std::string Logger::current_component_;

namespace {

std::string stamp_now(const char* format, bool utc) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm time_info;
    if (utc) {
        core::safe_gmtime(&now_c, &time_info);
    } else {
        core::safe_localtime(&now_c, &time_info);
    }
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), format, &time_info);
    return std::string(buffer);
}

}  // namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.current_path_.clear();
    logger.session_stamp_.clear();
    logger.part_number_ = 1;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (log_file_.is_open()) {
        log_file_.close();
    }
    current_path_.clear();

    if (config_.destination != LogDestination::CONSOLE) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        session_stamp_ = stamp_now("%Y%m%d_%H%M%S", config_.utc_timestamps);
        part_number_ = 1;
        open_part();

        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file: " + current_path_.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    std::string line = format_message(level, message);

    if (config_.destination != LogDestination::FILE) {
        std::cout << line << std::endl;
    }
    if (config_.destination != LogDestination::CONSOLE) {
        write_line(line);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;
    if (config_.include_timestamp) {
        ss << stamp_now("%Y-%m-%d %H:%M:%S", config_.utc_timestamps) << " ";
    }
    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }
    ss << message;
    return ss.str();
}

void Logger::write_line(const std::string& line) {
    if (!log_file_.is_open()) {
        return;
    }
    log_file_ << line << std::endl;

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        log_file_.close();
        ++part_number_;
        open_part();
    }
}

void Logger::open_part() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    enforce_retention(log_dir);

    // prefix_YYYYMMDD_HHMMSS_partN.log
    current_path_ = log_dir / (config_.filename_prefix + "_" + session_stamp_ + "_part" +
                               std::to_string(part_number_) + ".log");
    log_file_.open(current_path_, std::ios::app);
}

void Logger::enforce_retention(const std::filesystem::path& log_dir) const {
    std::vector<std::filesystem::path> log_files;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir, ec)) {
        const auto& path = entry.path();
        if (entry.is_regular_file() && path.extension() == ".log" &&
            path.filename().string().rfind(config_.filename_prefix, 0) == 0) {
            log_files.push_back(path);
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    // Leave room for the file about to be opened
    while (!log_files.empty() && log_files.size() >= config_.max_files) {
        std::filesystem::remove(log_files.front(), ec);
        log_files.erase(log_files.begin());
    }
}

}  // namespace forecast_ngin
