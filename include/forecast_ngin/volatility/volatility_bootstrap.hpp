// include/forecast_ngin/volatility/volatility_bootstrap.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/forecast_config.hpp"
#include "forecast_ngin/data/price_source.hpp"
#include "forecast_ngin/volatility/volatility_state.hpp"

namespace forecast_ngin {

/**
 * @brief Initial variance computed from a price history
 */
struct BootstrapEstimate {
    double variance{0.0};
    size_t returns_used{0};
    bool used_fallback{false};
    std::optional<Price> last_price;
    std::optional<Timestamp> last_timestamp;
};

/**
 * @brief Cold-start estimator for assets without a persisted state
 */
class VolatilityBootstrap {
public:
    VolatilityBootstrap(std::shared_ptr<PriceSource> prices,
                        std::shared_ptr<const ForecastConfig> config);

    virtual ~VolatilityBootstrap() = default;

    /**
     * @brief Build the initial state of an asset
     *
     * Uses the asset's lookback window ending at now. When the history is
     * unavailable or yields fewer than min_returns returns, the asset's
     * fallback variance is used instead.
     *
     * @param asset Asset identifier
     * @param now End of the lookback window
     * @param lambda Decay recorded on the new state
     */
    virtual Result<VolatilityState> bootstrap(const std::string& asset, const Timestamp& now,
                                              double lambda);

    /**
     * @brief mean(r^2) of consecutive bar-to-bar log returns
     *
     * Pairs whose spacing differs from bar_seconds, or whose prices are not
     * finite and positive, are skipped rather than interpolated.
     */
    static BootstrapEstimate estimate(const std::vector<PricePoint>& history, size_t min_returns,
                                      int64_t bar_seconds, double fallback_variance);

private:
    std::shared_ptr<PriceSource> prices_;
    std::shared_ptr<const ForecastConfig> config_;
};

}  // namespace forecast_ngin
