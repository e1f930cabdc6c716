// include/forecast_ngin/core/forecast_config.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "forecast_ngin/core/config_base.hpp"
#include "forecast_ngin/core/logger.hpp"
#include "forecast_ngin/core/types.hpp"

namespace forecast_ngin {

/**
 * @brief Validation failure for one configuration field
 */
struct ConfigValidationError {
    std::string field;
    std::string message;
};

/**
 * @brief Per-asset model defaults
 *
 * lambda, df and sigma_cap_daily are the initial live values; governance may
 * move them afterwards through the ParameterStore.
 */
struct AssetProfile : public ConfigBase {
    AssetClass asset_class{AssetClass::CRYPTO};
    double lambda{0.95};
    double df{5.0};
    double sigma_cap_daily{0.10};
    double shrink_high{1.0};
    int64_t bootstrap_lookback_seconds{6 * 3600};
    double fallback_variance{5e-6};
    bool market_hours_required{false};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Innovation family for this asset given a live df
     * Equities with df >= gaussian_df_threshold sample Gaussian, everything else Student-t(df)
     */
    DistributionFamily family_for(double live_df, double gaussian_df_threshold) const;
};

/**
 * @brief Step volatility conversion settings
 */
struct ScalerConfig : public ConfigBase {
    int64_t base_interval_seconds{60};  // Granularity of the stored EWMA variance
    int64_t seconds_per_day{86400};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Regular equity session expressed in UTC minutes of day, Monday to Friday
 */
struct MarketHoursConfig : public ConfigBase {
    int open_minute_utc{14 * 60 + 30};
    int close_minute_utc{21 * 60};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct BootstrapConfig : public ConfigBase {
    size_t min_returns{30};
    int64_t bar_seconds{60};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct GeneratorConfig : public ConfigBase {
    int significant_digits{8};
    double gaussian_df_threshold{20.0};
    std::optional<uint64_t> seed;  // Fixed seed for reproducible runs, random otherwise

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Horizon bucket boundaries, in seconds elapsed from t0
 */
struct BucketConfig : public ConfigBase {
    int64_t short_max_seconds{300};
    int64_t medium_max_seconds{3600};

    HorizonBucket bucket_for(int64_t elapsed_seconds) const {
        if (elapsed_seconds <= short_max_seconds)
            return HorizonBucket::SHORT;
        if (elapsed_seconds <= medium_max_seconds)
            return HorizonBucket::MEDIUM;
        return HorizonBucket::LONG;
    }

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct DiagnosticsConfig : public ConfigBase {
    int rolling_window_days{7};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Absolute bound and maximum single change for a governed parameter
 */
struct ParameterBounds {
    double min_value{0.0};
    double max_value{0.0};
    double max_step{0.0};
    bool integral{false};
};

struct GovernanceConfig : public ConfigBase {
    int first_tuning_wait_days{14};
    int min_days_between_tunings{30};
    int observation_days{14};
    int cap_cadence_days{90};

    ParameterBounds lambda_bounds{0.80, 0.99, 0.01, false};
    ParameterBounds df_bounds{3.0, 50.0, 1.0, true};
    ParameterBounds cap_bounds{0.01, 0.20, 0.01, false};

    // Advisory thresholds used by suggest_changes
    double good_crps_threshold{50.0};
    double short_crps_threshold{100.0};
    double long_crps_threshold{200.0};
    double coverage_95_low{0.93};
    double coverage_95_high{0.97};
    size_t min_points_for_suggestion{10};

    std::optional<ParameterBounds> bounds_for(const std::string& parameter) const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct PersistenceConfig : public ConfigBase {
    std::string data_directory{"data"};
    std::string state_key{"state/volatility_state.json"};
    std::string ledger_key{"state/tuning_history.json"};
    int64_t persist_interval_seconds{300};
    int64_t force_persist_interval_seconds{3600};
    int64_t sample_interval_low_seconds{1800};
    int64_t sample_interval_high_seconds{900};
    int64_t sample_interval_custom_seconds{1800};
    std::string model_version{"ewma-1.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Top-level configuration of the forecasting engine
 */
struct ForecastConfig : public ConfigBase {
    std::map<std::string, AssetProfile> assets;
    AssetProfile default_profile;
    ScalerConfig scaler;
    MarketHoursConfig market_hours;
    BootstrapConfig bootstrap;
    GeneratorConfig generator;
    BucketConfig buckets;
    DiagnosticsConfig diagnostics;
    GovernanceConfig governance;
    PersistenceConfig persistence;
    LoggerConfig logging;

    /**
     * @brief Configuration populated with the production asset table
     */
    static ForecastConfig defaults();

    /**
     * @brief Profile of a known asset, or the default profile for unknown symbols
     */
    const AssetProfile& profile_for(const std::string& asset) const;

    /**
     * @brief Check every numeric field against its admissible range
     * @return Empty when the configuration is usable
     */
    std::vector<ConfigValidationError> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace forecast_ngin
