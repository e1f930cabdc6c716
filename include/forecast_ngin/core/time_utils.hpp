#pragma once

#include <time.h>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include "forecast_ngin/core/types.hpp"

namespace forecast_ngin {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Seconds since the Unix epoch, fractional part kept
 */
inline double to_epoch_seconds(const Timestamp& ts) {
    return std::chrono::duration<double>(ts.time_since_epoch()).count();
}

/**
 * @brief Build a timestamp from seconds since the Unix epoch
 */
inline Timestamp from_epoch_seconds(double seconds) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::duration<double>(seconds)));
}

/**
 * @brief Whole seconds since the Unix epoch (used as grid keys)
 */
inline int64_t to_epoch_second_key(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

/**
 * @brief Format a timestamp in UTC with a strftime pattern
 */
inline std::string format_utc(const Timestamp& ts, const char* format) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm result;
    safe_gmtime(&t, &result);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Drop sub-second precision, matching what to_iso8601 preserves
 */
inline Timestamp truncate_to_seconds(const Timestamp& ts) {
    return std::chrono::time_point_cast<std::chrono::seconds>(ts);
}

/**
 * @brief ISO-8601 UTC representation with second precision ("2025-01-02T14:30:00Z")
 */
inline std::string to_iso8601(const Timestamp& ts) {
    return format_utc(ts, "%Y-%m-%dT%H:%M:%SZ");
}

/**
 * @brief Parse an ISO-8601 UTC timestamp ("YYYY-MM-DDTHH:MM:SS", optional trailing Z)
 * @return std::nullopt if the string cannot be parsed
 */
inline std::optional<Timestamp> from_iso8601(const std::string& value) {
    std::tm tm{};
    std::istringstream ss(value);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
#ifdef _WIN32
    std::time_t t = _mkgmtime(&tm);
#else
    std::time_t t = timegm(&tm);
#endif
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

/**
 * @brief Truncate a timestamp to 00:00:00 UTC of the same day
 */
inline Timestamp utc_day_start(const Timestamp& ts) {
    int64_t seconds = to_epoch_second_key(ts);
    int64_t day = seconds >= 0 ? seconds / 86400 : (seconds - 86399) / 86400;
    return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(day * 86400));
}

}  // namespace core
}  // namespace forecast_ngin
