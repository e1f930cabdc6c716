// src/evaluation/prediction_record.cpp

#include "forecast_ngin/evaluation/prediction_record.hpp"
#include "forecast_ngin/core/time_utils.hpp"

namespace forecast_ngin {

nlohmann::json ParameterSnapshot::to_json() const {
    nlohmann::json j;
    j["family"] = family;
    j["df"] = df;
    j["lambda"] = lambda;
    j["sigma_cap_daily"] = sigma_cap_daily;
    j["shrink_high"] = shrink_high;
    j["variance"] = variance;
    j["sigma_step"] = sigma_step;
    j["model_version"] = model_version;
    return j;
}

void ParameterSnapshot::from_json(const nlohmann::json& j) {
    if (j.contains("family"))
        family = j.at("family").get<std::string>();
    if (j.contains("df"))
        df = j.at("df").get<double>();
    if (j.contains("lambda"))
        lambda = j.at("lambda").get<double>();
    if (j.contains("sigma_cap_daily"))
        sigma_cap_daily = j.at("sigma_cap_daily").get<double>();
    if (j.contains("shrink_high"))
        shrink_high = j.at("shrink_high").get<double>();
    if (j.contains("variance"))
        variance = j.at("variance").get<double>();
    if (j.contains("sigma_step"))
        sigma_step = j.at("sigma_step").get<double>();
    if (j.contains("model_version"))
        model_version = j.at("model_version").get<std::string>();
}

nlohmann::json PredictionRecord::to_json() const {
    nlohmann::json j;
    j["asset"] = asset_id;
    j["t0"] = core::to_iso8601(t0);
    j["t0_epoch"] = core::to_epoch_seconds(t0);
    j["request_time"] = core::to_epoch_seconds(request_time);
    j["prompt"] = horizon_label_to_string(label);
    j["time_increment"] = increment_seconds;
    j["step_count"] = step_count;
    j["parameters"] = parameters.to_json();
    j["ensemble"] = ensemble.to_json();
    return j;
}

Result<PredictionRecord> PredictionRecord::from_json(const nlohmann::json& j) {
    try {
        PredictionRecord record;
        record.asset_id = j.at("asset").get<std::string>();
        record.t0 = core::from_epoch_seconds(j.at("t0_epoch").get<double>());
        record.request_time = core::from_epoch_seconds(j.at("request_time").get<double>());
        record.label = horizon_label_from_string(j.at("prompt").get<std::string>());
        record.increment_seconds = j.at("time_increment").get<int64_t>();
        record.step_count = j.at("step_count").get<int>();
        record.parameters.from_json(j.at("parameters"));

        auto ensemble = PathEnsemble::from_json(j.at("ensemble"));
        if (ensemble.is_error()) {
            return forward_error<PredictionRecord>(ensemble, "PredictionRecord");
        }
        record.ensemble = ensemble.take_value();

        if (record.ensemble.step_count != record.step_count ||
            record.ensemble.increment_seconds != record.increment_seconds ||
            record.ensemble.asset_id != record.asset_id) {
            return make_error<PredictionRecord>(ErrorCode::INVALID_DATA,
                                                "Ensemble metadata disagrees with record",
                                                "PredictionRecord");
        }
        return Result<PredictionRecord>(std::move(record));
    } catch (const nlohmann::json::exception& e) {
        return make_error<PredictionRecord>(ErrorCode::JSON_PARSE_ERROR,
                                            std::string("Malformed prediction record: ") +
                                                e.what(),
                                            "PredictionRecord");
    }
}

}  // namespace forecast_ngin
