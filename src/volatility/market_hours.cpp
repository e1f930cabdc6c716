// src/volatility/market_hours.cpp

#include "forecast_ngin/volatility/market_hours.hpp"
#include <ctime>
#include "forecast_ngin/core/time_utils.hpp"

namespace forecast_ngin {

MarketHoursGate::MarketHoursGate(std::shared_ptr<const ForecastConfig> config)
    : config_(std::move(config)) {}

bool MarketHoursGate::is_market_open(const Timestamp& t) const {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm utc;
    if (core::safe_gmtime(&tt, &utc) == nullptr) {
        return false;
    }

    // tm_wday: 0 = Sunday, 6 = Saturday
    if (utc.tm_wday == 0 || utc.tm_wday == 6) {
        return false;
    }

    int minute_of_day = utc.tm_hour * 60 + utc.tm_min;
    return minute_of_day >= config_->market_hours.open_minute_utc &&
           minute_of_day < config_->market_hours.close_minute_utc;
}

bool MarketHoursGate::should_flatten(const std::string& asset, const Timestamp& t0) const {
    if (!config_->profile_for(asset).market_hours_required) {
        return false;
    }
    return !is_market_open(t0);
}

}  // namespace forecast_ngin
