// src/volatility/volatility_bootstrap.cpp

#include "forecast_ngin/volatility/volatility_bootstrap.hpp"
#include <chrono>
#include <cmath>
#include "forecast_ngin/core/logger.hpp"

namespace forecast_ngin {

VolatilityBootstrap::VolatilityBootstrap(std::shared_ptr<PriceSource> prices,
                                         std::shared_ptr<const ForecastConfig> config)
    : prices_(std::move(prices)), config_(std::move(config)) {}

BootstrapEstimate VolatilityBootstrap::estimate(const std::vector<PricePoint>& history,
                                                size_t min_returns, int64_t bar_seconds,
                                                double fallback_variance) {
    BootstrapEstimate result;
    double sum_sq = 0.0;
    const PricePoint* previous = nullptr;

    for (const auto& point : history) {
        if (!std::isfinite(point.price) || point.price <= 0.0) {
            previous = nullptr;
            continue;
        }
        if (previous != nullptr) {
            auto spacing = std::chrono::duration_cast<std::chrono::seconds>(point.timestamp -
                                                                            previous->timestamp)
                               .count();
            if (spacing == bar_seconds) {
                double r = std::log(point.price / previous->price);
                if (std::isfinite(r)) {
                    sum_sq += r * r;
                    ++result.returns_used;
                }
            }
        }
        previous = &point;
        result.last_price = point.price;
        result.last_timestamp = point.timestamp;
    }

    if (result.returns_used >= min_returns && result.returns_used > 0) {
        result.variance = sum_sq / static_cast<double>(result.returns_used);
    } else {
        result.variance = fallback_variance;
        result.used_fallback = true;
    }
    return result;
}

Result<VolatilityState> VolatilityBootstrap::bootstrap(const std::string& asset,
                                                       const Timestamp& now, double lambda) {
    const AssetProfile& profile = config_->profile_for(asset);

    std::vector<PricePoint> history;
    if (prices_) {
        auto fetched = prices_->get_history(asset, now,
                                            std::chrono::seconds(profile.bootstrap_lookback_seconds));
        if (fetched.is_ok()) {
            history = fetched.value();
        } else {
            WARN("History unavailable for " << asset << ", using fallback variance: "
                                            << fetched.error()->what());
        }
    }

    BootstrapEstimate est = estimate(history, config_->bootstrap.min_returns,
                                     config_->bootstrap.bar_seconds, profile.fallback_variance);

    if (!std::isfinite(est.variance) || est.variance < 0.0) {
        return make_error<VolatilityState>(ErrorCode::INVALID_DATA,
                                           "Bootstrap produced an invalid variance for " + asset,
                                           "VolatilityBootstrap");
    }

    if (est.used_fallback) {
        INFO("Bootstrap " << asset << ": " << est.returns_used
                          << " returns, using fallback variance " << est.variance);
    } else {
        DEBUG("Bootstrap " << asset << ": mean(r^2)=" << est.variance << " over "
                           << est.returns_used << " returns");
    }

    VolatilityState state;
    state.asset_id = asset;
    state.variance_estimate = est.variance;
    state.decay_lambda = lambda;
    state.last_update_ts = est.last_timestamp.value_or(now);
    state.sample_count = 0;
    state.last_price = est.last_price;
    return state;
}

}  // namespace forecast_ngin
