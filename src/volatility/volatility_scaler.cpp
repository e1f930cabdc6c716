// src/volatility/volatility_scaler.cpp

#include "forecast_ngin/volatility/volatility_scaler.hpp"
#include <algorithm>
#include <cmath>
#include "forecast_ngin/core/logger.hpp"

namespace forecast_ngin {

VolatilityScaler::VolatilityScaler(std::shared_ptr<const ForecastConfig> config,
                                   std::shared_ptr<ParameterStore> parameters)
    : config_(std::move(config)), parameters_(std::move(parameters)) {}

HorizonLabel VolatilityScaler::classify(int64_t increment_seconds, int64_t horizon_seconds) {
    if (increment_seconds == 60 && horizon_seconds == 3600)
        return HorizonLabel::HIGH;
    if (increment_seconds == 300 && horizon_seconds == 86400)
        return HorizonLabel::LOW;
    return HorizonLabel::CUSTOM;
}

Result<ScaledVolatility> VolatilityScaler::scale(const VolatilityState& state,
                                                 int64_t increment_seconds,
                                                 HorizonLabel label) const {
    if (increment_seconds <= 0) {
        return make_error<ScaledVolatility>(ErrorCode::INVALID_ARGUMENT,
                                            "Increment must be positive", "VolatilityScaler");
    }

    const double base = static_cast<double>(config_->scaler.base_interval_seconds);
    const double day = static_cast<double>(config_->scaler.seconds_per_day);
    const double increment = static_cast<double>(increment_seconds);
    const double cap_daily = parameters_->get(state.asset_id).sigma_cap_daily;

    if (!std::isfinite(state.variance_estimate) || state.variance_estimate < 0.0) {
        return make_error<ScaledVolatility>(ErrorCode::INVALID_SCALING,
                                            "Variance is not a finite non-negative number for " +
                                                state.asset_id,
                                            "VolatilityScaler");
    }
    if (!std::isfinite(cap_daily) || cap_daily <= 0.0) {
        return make_error<ScaledVolatility>(ErrorCode::INVALID_SCALING,
                                            "Daily cap must be positive for " + state.asset_id,
                                            "VolatilityScaler");
    }

    ScaledVolatility out;
    out.uncapped_sigma_step = std::sqrt(state.variance_estimate) * std::sqrt(increment / base);

    double daily_equivalent = out.uncapped_sigma_step * std::sqrt(day / increment);
    double capped_daily = std::min(daily_equivalent, cap_daily);
    out.capped = capped_daily < daily_equivalent;
    out.sigma_step = capped_daily * std::sqrt(increment / day);

    if (label == HorizonLabel::HIGH) {
        out.shrink = config_->profile_for(state.asset_id).shrink_high;
        out.sigma_step *= out.shrink;
    }

    if (!std::isfinite(out.sigma_step) || out.sigma_step <= 0.0) {
        ERROR("Scaled volatility " << out.sigma_step << " for " << state.asset_id
                                   << " (variance=" << state.variance_estimate << ")");
        return make_error<ScaledVolatility>(ErrorCode::INVALID_SCALING,
                                            "Scaled volatility must be strictly positive for " +
                                                state.asset_id,
                                            "VolatilityScaler");
    }

    if (out.capped) {
        DEBUG(state.asset_id << " step volatility capped at daily " << cap_daily);
    }
    return out;
}

Result<double> VolatilityScaler::to_step_volatility(const VolatilityState& state,
                                                    int64_t increment_seconds,
                                                    HorizonLabel label) const {
    auto scaled = scale(state, increment_seconds, label);
    if (scaled.is_error()) {
        return forward_error<double>(scaled, "VolatilityScaler");
    }
    return scaled.value().sigma_step;
}

}  // namespace forecast_ngin
