// include/forecast_ngin/core/parameter_store.hpp
#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/forecast_config.hpp"

namespace forecast_ngin {

/**
 * @brief Live values of the governed parameters for one asset
 */
struct LiveParameters {
    double lambda{0.0};
    double df{0.0};
    double sigma_cap_daily{0.0};

    nlohmann::json to_json() const {
        nlohmann::json j;
        j[parameters::LAMBDA] = lambda;
        j[parameters::DF] = df;
        j[parameters::SIGMA_CAP_DAILY] = sigma_cap_daily;
        return j;
    }
};

/**
 * @brief Thread-safe holder of the parameters read by the volatility model and generator
 *
 * Values start at the configured asset profile and are only overwritten by
 * governance (directly or by replaying the tuning ledger on restart).
 */
class ParameterStore {
public:
    explicit ParameterStore(std::shared_ptr<const ForecastConfig> config);

    /**
     * @brief Consistent snapshot of all three parameters for an asset
     */
    LiveParameters get(const std::string& asset) const;

    /**
     * @brief Read one parameter by name
     * @return INVALID_ARGUMENT for an unconfigured asset or an unknown parameter name
     */
    Result<double> get_value(const std::string& asset, const std::string& parameter) const;

    /**
     * @brief Overwrite one parameter by name
     * @return INVALID_ARGUMENT for an unconfigured asset, an unknown parameter name
     *         or a non-finite value
     */
    Result<void> set_value(const std::string& asset, const std::string& parameter, double value);

    /**
     * @brief Live values of every configured asset
     */
    std::map<std::string, LiveParameters> current_values() const;

    const ForecastConfig& config() const {
        return *config_;
    }

private:
    LiveParameters defaults_for(const std::string& asset) const;

    std::shared_ptr<const ForecastConfig> config_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, LiveParameters> overrides_;
};

}  // namespace forecast_ngin
