// include/forecast_ngin/volatility/volatility_scaler.hpp
#pragma once

#include <cstdint>
#include <memory>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/forecast_config.hpp"
#include "forecast_ngin/core/parameter_store.hpp"
#include "forecast_ngin/core/types.hpp"
#include "forecast_ngin/volatility/volatility_state.hpp"

namespace forecast_ngin {

/**
 * @brief Step volatility together with how it was obtained
 */
struct ScaledVolatility {
    double sigma_step{0.0};
    double uncapped_sigma_step{0.0};
    bool capped{false};
    double shrink{1.0};
};

/**
 * @brief Converts a base-interval EWMA variance into a per-step volatility
 *
 * sigma_step = sqrt(variance) * sqrt(increment / base_interval), then the
 * daily equivalent sigma_step * sqrt(day / increment) is clamped to the live
 * sigma_cap_daily and projected back. HIGH requests are finally multiplied by
 * the asset's shrink factor.
 */
class VolatilityScaler {
public:
    VolatilityScaler(std::shared_ptr<const ForecastConfig> config,
                     std::shared_ptr<ParameterStore> parameters);

    /**
     * @brief Scaled volatility for one request
     * @param state Snapshot of the asset's volatility state
     * @param increment_seconds Step size of the requested grid
     * @param label Request cadence
     * @return INVALID_SCALING if the result is not strictly positive and finite
     */
    Result<ScaledVolatility> scale(const VolatilityState& state, int64_t increment_seconds,
                                   HorizonLabel label) const;

    /**
     * @brief Same as scale() returning only sigma_step
     */
    Result<double> to_step_volatility(const VolatilityState& state, int64_t increment_seconds,
                                      HorizonLabel label) const;

    /**
     * @brief HIGH for 60s over one hour, LOW for 300s over one day, CUSTOM otherwise
     */
    static HorizonLabel classify(int64_t increment_seconds, int64_t horizon_seconds);

private:
    std::shared_ptr<const ForecastConfig> config_;
    std::shared_ptr<ParameterStore> parameters_;
};

}  // namespace forecast_ngin
