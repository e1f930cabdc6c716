// include/forecast_ngin/evaluation/prediction_record.hpp
#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/types.hpp"
#include "forecast_ngin/simulation/path_ensemble.hpp"

namespace forecast_ngin {

/**
 * @brief Model parameters in force when an ensemble was generated
 */
struct ParameterSnapshot {
    std::string family;
    double df{0.0};
    double lambda{0.0};
    double sigma_cap_daily{0.0};
    double shrink_high{1.0};
    double variance{0.0};
    double sigma_step{0.0};
    std::string model_version;

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief A retained forecast, scored later against realized prices
 */
struct PredictionRecord {
    std::string asset_id;
    Timestamp t0{};
    Timestamp request_time{};
    HorizonLabel label{HorizonLabel::CUSTOM};
    int64_t increment_seconds{0};
    int step_count{0};
    ParameterSnapshot parameters;
    PathEnsemble ensemble;

    nlohmann::json to_json() const;

    /**
     * @brief Parse a logged record
     * @return JSON_PARSE_ERROR or INVALID_DATA for malformed input
     */
    static Result<PredictionRecord> from_json(const nlohmann::json& j);
};

}  // namespace forecast_ngin
