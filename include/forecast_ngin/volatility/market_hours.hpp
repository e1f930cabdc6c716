// include/forecast_ngin/volatility/market_hours.hpp
#pragma once

#include <memory>
#include <string>
#include "forecast_ngin/core/forecast_config.hpp"
#include "forecast_ngin/core/types.hpp"

namespace forecast_ngin {

/**
 * @brief Decides whether a request must return flat paths
 *
 * Only assets whose profile requires market hours are gated. The session is
 * [open, close) in UTC on Monday to Friday; holidays are not modelled.
 */
class MarketHoursGate {
public:
    explicit MarketHoursGate(std::shared_ptr<const ForecastConfig> config);

    bool is_market_open(const Timestamp& t) const;

    /**
     * @brief True for a market-hours asset whose t0 falls outside the session
     */
    bool should_flatten(const std::string& asset, const Timestamp& t0) const;

private:
    std::shared_ptr<const ForecastConfig> config_;
};

}  // namespace forecast_ngin
