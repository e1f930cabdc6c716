// include/forecast_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <variant>

namespace forecast_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * All timestamps are interpreted as UTC
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Source of the current time, injectable for tests
 */
using Clock = std::function<Timestamp()>;

inline Timestamp system_now() {
    return std::chrono::system_clock::now();
}

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Number of ensemble members returned per request
 * Index 0 is the deterministic flat path, 1..999 are stochastic
 */
constexpr int kEnsembleSize = 1000;
constexpr int kStochasticPaths = kEnsembleSize - 1;

/**
 * @brief Asset class enumeration
 */
enum class AssetClass {
    CRYPTO,
    COMMODITY,
    EQUITY
};

inline std::string asset_class_to_string(AssetClass asset_class) {
    switch (asset_class) {
        case AssetClass::CRYPTO:
            return "CRYPTO";
        case AssetClass::COMMODITY:
            return "COMMODITY";
        case AssetClass::EQUITY:
            return "EQUITY";
        default:
            return "UNKNOWN";
    }
}

inline AssetClass asset_class_from_string(const std::string& value) {
    if (value == "EQUITY")
        return AssetClass::EQUITY;
    if (value == "COMMODITY")
        return AssetClass::COMMODITY;
    return AssetClass::CRYPTO;
}

/**
 * @brief Student-t innovations with df degrees of freedom
 */
struct StudentT {
    double df{5.0};
};

/**
 * @brief Gaussian innovations
 */
struct Gaussian {};

/**
 * @brief Innovation distribution used by the path generator
 */
using DistributionFamily = std::variant<StudentT, Gaussian>;

inline std::string family_to_string(const DistributionFamily& family) {
    if (std::holds_alternative<Gaussian>(family)) {
        return "gaussian";
    }
    std::ostringstream out;
    out << "student_t(" << std::get<StudentT>(family).df << ")";
    return out.str();
}

/**
 * @brief Request cadence label
 * HIGH: 60s increments over one hour, LOW: 300s increments over one day
 */
enum class HorizonLabel {
    LOW,
    HIGH,
    CUSTOM
};

inline std::string horizon_label_to_string(HorizonLabel label) {
    switch (label) {
        case HorizonLabel::LOW:
            return "low";
        case HorizonLabel::HIGH:
            return "high";
        case HorizonLabel::CUSTOM:
            return "custom";
        default:
            return "unknown";
    }
}

inline HorizonLabel horizon_label_from_string(const std::string& value) {
    if (value == "low")
        return HorizonLabel::LOW;
    if (value == "high")
        return HorizonLabel::HIGH;
    return HorizonLabel::CUSTOM;
}

/**
 * @brief Grouping of forecast steps by elapsed time from t0
 */
enum class HorizonBucket {
    SHORT,
    MEDIUM,
    LONG
};

inline std::string horizon_bucket_to_string(HorizonBucket bucket) {
    switch (bucket) {
        case HorizonBucket::SHORT:
            return "short";
        case HorizonBucket::MEDIUM:
            return "medium";
        case HorizonBucket::LONG:
            return "long";
        default:
            return "unknown";
    }
}

inline HorizonBucket horizon_bucket_from_string(const std::string& value) {
    if (value == "medium")
        return HorizonBucket::MEDIUM;
    if (value == "long")
        return HorizonBucket::LONG;
    return HorizonBucket::SHORT;
}

/**
 * @brief Names of the parameters under governance
 */
namespace parameters {
constexpr const char* LAMBDA = "lambda";
constexpr const char* DF = "df";
constexpr const char* SIGMA_CAP_DAILY = "sigma_cap_daily";
}  // namespace parameters

}  // namespace forecast_ngin
