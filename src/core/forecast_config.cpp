// src/core/forecast_config.cpp

#include "forecast_ngin/core/forecast_config.hpp"
#include <cmath>

namespace forecast_ngin {

namespace {

template <typename T>
void read_if_present(const nlohmann::json& j, const char* key, T& target) {
    if (j.contains(key))
        target = j.at(key).get<T>();
}

nlohmann::json bounds_to_json(const ParameterBounds& b) {
    nlohmann::json j;
    j["min"] = b.min_value;
    j["max"] = b.max_value;
    j["max_step"] = b.max_step;
    j["integral"] = b.integral;
    return j;
}

void bounds_from_json(const nlohmann::json& j, ParameterBounds& b) {
    read_if_present(j, "min", b.min_value);
    read_if_present(j, "max", b.max_value);
    read_if_present(j, "max_step", b.max_step);
    read_if_present(j, "integral", b.integral);
}

void check_open_unit(double value, const std::string& field,
                     std::vector<ConfigValidationError>& errors) {
    if (!std::isfinite(value) || value <= 0.0 || value >= 1.0) {
        errors.push_back({field, "must be in (0, 1)"});
    }
}

void check_positive(double value, const std::string& field,
                    std::vector<ConfigValidationError>& errors) {
    if (!std::isfinite(value) || value <= 0.0) {
        errors.push_back({field, "must be positive"});
    }
}

void check_bounds(const ParameterBounds& b, const std::string& field,
                  std::vector<ConfigValidationError>& errors) {
    if (!(b.min_value < b.max_value)) {
        errors.push_back({field, "min must be below max"});
    }
    if (!(b.max_step > 0.0)) {
        errors.push_back({field + ".max_step", "must be positive"});
    }
}

AssetProfile make_profile(AssetClass cls, double lambda, double df, double cap, double shrink,
                          int64_t lookback_hours, double fallback) {
    AssetProfile p;
    p.asset_class = cls;
    p.lambda = lambda;
    p.df = df;
    p.sigma_cap_daily = cap;
    p.shrink_high = shrink;
    p.bootstrap_lookback_seconds = lookback_hours * 3600;
    p.fallback_variance = fallback;
    p.market_hours_required = (cls == AssetClass::EQUITY);
    return p;
}

}  // namespace

// AssetProfile

nlohmann::json AssetProfile::to_json() const {
    nlohmann::json j;
    j["asset_class"] = asset_class_to_string(asset_class);
    j["lambda"] = lambda;
    j["df"] = df;
    j["sigma_cap_daily"] = sigma_cap_daily;
    j["shrink_high"] = shrink_high;
    j["bootstrap_lookback_seconds"] = bootstrap_lookback_seconds;
    j["fallback_variance"] = fallback_variance;
    j["market_hours_required"] = market_hours_required;
    return j;
}

void AssetProfile::from_json(const nlohmann::json& j) {
    if (j.contains("asset_class"))
        asset_class = asset_class_from_string(j.at("asset_class").get<std::string>());
    read_if_present(j, "lambda", lambda);
    read_if_present(j, "df", df);
    read_if_present(j, "sigma_cap_daily", sigma_cap_daily);
    read_if_present(j, "shrink_high", shrink_high);
    read_if_present(j, "bootstrap_lookback_seconds", bootstrap_lookback_seconds);
    read_if_present(j, "fallback_variance", fallback_variance);
    read_if_present(j, "market_hours_required", market_hours_required);
}

DistributionFamily AssetProfile::family_for(double live_df, double gaussian_df_threshold) const {
    if (asset_class == AssetClass::EQUITY && live_df >= gaussian_df_threshold) {
        return Gaussian{};
    }
    return StudentT{live_df};
}

// Sub-configurations

nlohmann::json ScalerConfig::to_json() const {
    nlohmann::json j;
    j["base_interval_seconds"] = base_interval_seconds;
    j["seconds_per_day"] = seconds_per_day;
    return j;
}

void ScalerConfig::from_json(const nlohmann::json& j) {
    read_if_present(j, "base_interval_seconds", base_interval_seconds);
    read_if_present(j, "seconds_per_day", seconds_per_day);
}

nlohmann::json MarketHoursConfig::to_json() const {
    nlohmann::json j;
    j["open_minute_utc"] = open_minute_utc;
    j["close_minute_utc"] = close_minute_utc;
    return j;
}

void MarketHoursConfig::from_json(const nlohmann::json& j) {
    read_if_present(j, "open_minute_utc", open_minute_utc);
    read_if_present(j, "close_minute_utc", close_minute_utc);
}

nlohmann::json BootstrapConfig::to_json() const {
    nlohmann::json j;
    j["min_returns"] = min_returns;
    j["bar_seconds"] = bar_seconds;
    return j;
}

void BootstrapConfig::from_json(const nlohmann::json& j) {
    read_if_present(j, "min_returns", min_returns);
    read_if_present(j, "bar_seconds", bar_seconds);
}

nlohmann::json GeneratorConfig::to_json() const {
    nlohmann::json j;
    j["significant_digits"] = significant_digits;
    j["gaussian_df_threshold"] = gaussian_df_threshold;
    if (seed.has_value()) {
        j["seed"] = *seed;
    } else {
        j["seed"] = nullptr;
    }
    return j;
}

void GeneratorConfig::from_json(const nlohmann::json& j) {
    read_if_present(j, "significant_digits", significant_digits);
    read_if_present(j, "gaussian_df_threshold", gaussian_df_threshold);
    if (j.contains("seed")) {
        if (j.at("seed").is_null()) {
            seed.reset();
        } else {
            seed = j.at("seed").get<uint64_t>();
        }
    }
}

nlohmann::json BucketConfig::to_json() const {
    nlohmann::json j;
    j["short_max_seconds"] = short_max_seconds;
    j["medium_max_seconds"] = medium_max_seconds;
    return j;
}

void BucketConfig::from_json(const nlohmann::json& j) {
    read_if_present(j, "short_max_seconds", short_max_seconds);
    read_if_present(j, "medium_max_seconds", medium_max_seconds);
}

nlohmann::json DiagnosticsConfig::to_json() const {
    nlohmann::json j;
    j["rolling_window_days"] = rolling_window_days;
    return j;
}

void DiagnosticsConfig::from_json(const nlohmann::json& j) {
    read_if_present(j, "rolling_window_days", rolling_window_days);
}

std::optional<ParameterBounds> GovernanceConfig::bounds_for(const std::string& parameter) const {
    if (parameter == parameters::LAMBDA)
        return lambda_bounds;
    if (parameter == parameters::DF)
        return df_bounds;
    if (parameter == parameters::SIGMA_CAP_DAILY)
        return cap_bounds;
    return std::nullopt;
}

nlohmann::json GovernanceConfig::to_json() const {
    nlohmann::json j;
    j["first_tuning_wait_days"] = first_tuning_wait_days;
    j["min_days_between_tunings"] = min_days_between_tunings;
    j["observation_days"] = observation_days;
    j["cap_cadence_days"] = cap_cadence_days;
    j["bounds"][parameters::LAMBDA] = bounds_to_json(lambda_bounds);
    j["bounds"][parameters::DF] = bounds_to_json(df_bounds);
    j["bounds"][parameters::SIGMA_CAP_DAILY] = bounds_to_json(cap_bounds);
    j["good_crps_threshold"] = good_crps_threshold;
    j["short_crps_threshold"] = short_crps_threshold;
    j["long_crps_threshold"] = long_crps_threshold;
    j["coverage_95_low"] = coverage_95_low;
    j["coverage_95_high"] = coverage_95_high;
    j["min_points_for_suggestion"] = min_points_for_suggestion;
    return j;
}

void GovernanceConfig::from_json(const nlohmann::json& j) {
    read_if_present(j, "first_tuning_wait_days", first_tuning_wait_days);
    read_if_present(j, "min_days_between_tunings", min_days_between_tunings);
    read_if_present(j, "observation_days", observation_days);
    read_if_present(j, "cap_cadence_days", cap_cadence_days);
    if (j.contains("bounds")) {
        const auto& b = j.at("bounds");
        if (b.contains(parameters::LAMBDA))
            bounds_from_json(b.at(parameters::LAMBDA), lambda_bounds);
        if (b.contains(parameters::DF))
            bounds_from_json(b.at(parameters::DF), df_bounds);
        if (b.contains(parameters::SIGMA_CAP_DAILY))
            bounds_from_json(b.at(parameters::SIGMA_CAP_DAILY), cap_bounds);
    }
    read_if_present(j, "good_crps_threshold", good_crps_threshold);
    read_if_present(j, "short_crps_threshold", short_crps_threshold);
    read_if_present(j, "long_crps_threshold", long_crps_threshold);
    read_if_present(j, "coverage_95_low", coverage_95_low);
    read_if_present(j, "coverage_95_high", coverage_95_high);
    read_if_present(j, "min_points_for_suggestion", min_points_for_suggestion);
}

nlohmann::json PersistenceConfig::to_json() const {
    nlohmann::json j;
    j["data_directory"] = data_directory;
    j["state_key"] = state_key;
    j["ledger_key"] = ledger_key;
    j["persist_interval_seconds"] = persist_interval_seconds;
    j["force_persist_interval_seconds"] = force_persist_interval_seconds;
    j["sample_interval_low_seconds"] = sample_interval_low_seconds;
    j["sample_interval_high_seconds"] = sample_interval_high_seconds;
    j["sample_interval_custom_seconds"] = sample_interval_custom_seconds;
    j["model_version"] = model_version;
    return j;
}

void PersistenceConfig::from_json(const nlohmann::json& j) {
    read_if_present(j, "data_directory", data_directory);
    read_if_present(j, "state_key", state_key);
    read_if_present(j, "ledger_key", ledger_key);
    read_if_present(j, "persist_interval_seconds", persist_interval_seconds);
    read_if_present(j, "force_persist_interval_seconds", force_persist_interval_seconds);
    read_if_present(j, "sample_interval_low_seconds", sample_interval_low_seconds);
    read_if_present(j, "sample_interval_high_seconds", sample_interval_high_seconds);
    read_if_present(j, "sample_interval_custom_seconds", sample_interval_custom_seconds);
    read_if_present(j, "model_version", model_version);
}

// ForecastConfig

ForecastConfig ForecastConfig::defaults() {
    ForecastConfig config;
    auto& a = config.assets;
    a["BTC"] = make_profile(AssetClass::CRYPTO, 0.94, 5, 0.10, 0.9, 6, 5e-6);
    a["ETH"] = make_profile(AssetClass::CRYPTO, 0.93, 5, 0.12, 0.9, 6, 8e-6);
    a["SOL"] = make_profile(AssetClass::CRYPTO, 0.90, 4, 0.18, 0.9, 6, 1.2e-5);
    a["XAU"] = make_profile(AssetClass::COMMODITY, 0.97, 10, 0.03, 0.95, 12, 2e-6);
    a["SPYX"] = make_profile(AssetClass::EQUITY, 0.98, 30, 0.02, 1.0, 48, 1e-6);
    a["NVDAX"] = make_profile(AssetClass::EQUITY, 0.97, 20, 0.04, 1.0, 48, 1e-6);
    a["TSLAX"] = make_profile(AssetClass::EQUITY, 0.97, 20, 0.05, 1.0, 48, 1e-6);
    a["AAPLX"] = make_profile(AssetClass::EQUITY, 0.98, 30, 0.02, 1.0, 48, 1e-6);
    a["GOOGLX"] = make_profile(AssetClass::EQUITY, 0.98, 30, 0.02, 1.0, 48, 1e-6);
    config.default_profile = make_profile(AssetClass::CRYPTO, 0.95, 5, 0.10, 1.0, 6, 5e-6);
    return config;
}

const AssetProfile& ForecastConfig::profile_for(const std::string& asset) const {
    auto it = assets.find(asset);
    if (it == assets.end()) {
        return default_profile;
    }
    return it->second;
}

std::vector<ConfigValidationError> ForecastConfig::validate() const {
    std::vector<ConfigValidationError> errors;

    auto check_profile = [&](const std::string& prefix, const AssetProfile& p) {
        check_open_unit(p.lambda, prefix + ".lambda", errors);
        if (!std::isfinite(p.df) || p.df <= 2.0) {
            errors.push_back({prefix + ".df", "must be greater than 2"});
        }
        check_positive(p.sigma_cap_daily, prefix + ".sigma_cap_daily", errors);
        if (!std::isfinite(p.shrink_high) || p.shrink_high <= 0.0 || p.shrink_high > 1.0) {
            errors.push_back({prefix + ".shrink_high", "must be in (0, 1]"});
        }
        if (p.bootstrap_lookback_seconds <= 0) {
            errors.push_back({prefix + ".bootstrap_lookback_seconds", "must be positive"});
        }
        check_positive(p.fallback_variance, prefix + ".fallback_variance", errors);
    };

    for (const auto& [asset, profile] : assets) {
        check_profile("assets." + asset, profile);
    }
    check_profile("default_profile", default_profile);

    if (scaler.base_interval_seconds <= 0) {
        errors.push_back({"scaler.base_interval_seconds", "must be positive"});
    }
    if (scaler.seconds_per_day <= 0) {
        errors.push_back({"scaler.seconds_per_day", "must be positive"});
    }
    if (market_hours.open_minute_utc < 0 || market_hours.close_minute_utc > 24 * 60 ||
        market_hours.open_minute_utc >= market_hours.close_minute_utc) {
        errors.push_back({"market_hours", "open must precede close within one UTC day"});
    }
    if (bootstrap.min_returns == 0) {
        errors.push_back({"bootstrap.min_returns", "must be at least 1"});
    }
    if (generator.significant_digits < 1 || generator.significant_digits > 17) {
        errors.push_back({"generator.significant_digits", "must be in [1, 17]"});
    }
    if (buckets.short_max_seconds <= 0 || buckets.short_max_seconds >= buckets.medium_max_seconds) {
        errors.push_back({"buckets", "short boundary must be positive and below medium"});
    }
    if (diagnostics.rolling_window_days <= 0) {
        errors.push_back({"diagnostics.rolling_window_days", "must be positive"});
    }
    if (governance.first_tuning_wait_days < 0 || governance.min_days_between_tunings < 0 ||
        governance.observation_days < 0 || governance.cap_cadence_days < 0) {
        errors.push_back({"governance", "waiting periods must be non-negative"});
    }
    check_bounds(governance.lambda_bounds, "governance.bounds.lambda", errors);
    check_bounds(governance.df_bounds, "governance.bounds.df", errors);
    check_bounds(governance.cap_bounds, "governance.bounds.sigma_cap_daily", errors);
    if (persistence.persist_interval_seconds < 0 ||
        persistence.force_persist_interval_seconds < persistence.persist_interval_seconds) {
        errors.push_back({"persistence", "force interval must not be shorter than persist interval"});
    }

    return errors;
}

nlohmann::json ForecastConfig::to_json() const {
    nlohmann::json j;
    for (const auto& [asset, profile] : assets) {
        j["assets"][asset] = profile.to_json();
    }
    j["default_profile"] = default_profile.to_json();
    j["scaler"] = scaler.to_json();
    j["market_hours"] = market_hours.to_json();
    j["bootstrap"] = bootstrap.to_json();
    j["generator"] = generator.to_json();
    j["buckets"] = buckets.to_json();
    j["diagnostics"] = diagnostics.to_json();
    j["governance"] = governance.to_json();
    j["persistence"] = persistence.to_json();
    j["logging"] = logging.to_json();
    return j;
}

void ForecastConfig::from_json(const nlohmann::json& j) {
    if (j.contains("assets")) {
        for (const auto& [asset, value] : j.at("assets").items()) {
            AssetProfile profile = profile_for(asset);
            profile.from_json(value);
            assets[asset] = profile;
        }
    }
    if (j.contains("default_profile"))
        default_profile.from_json(j.at("default_profile"));
    if (j.contains("scaler"))
        scaler.from_json(j.at("scaler"));
    if (j.contains("market_hours"))
        market_hours.from_json(j.at("market_hours"));
    if (j.contains("bootstrap"))
        bootstrap.from_json(j.at("bootstrap"));
    if (j.contains("generator"))
        generator.from_json(j.at("generator"));
    if (j.contains("buckets"))
        buckets.from_json(j.at("buckets"));
    if (j.contains("diagnostics"))
        diagnostics.from_json(j.at("diagnostics"));
    if (j.contains("governance"))
        governance.from_json(j.at("governance"));
    if (j.contains("persistence"))
        persistence.from_json(j.at("persistence"));
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
}

}  // namespace forecast_ngin
