// src/core/parameter_store.cpp

#include "forecast_ngin/core/parameter_store.hpp"
#include <cmath>
#include <mutex>

namespace forecast_ngin {

ParameterStore::ParameterStore(std::shared_ptr<const ForecastConfig> config)
    : config_(std::move(config)) {}

LiveParameters ParameterStore::defaults_for(const std::string& asset) const {
    const AssetProfile& profile = config_->profile_for(asset);
    return LiveParameters{profile.lambda, profile.df, profile.sigma_cap_daily};
}

LiveParameters ParameterStore::get(const std::string& asset) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = overrides_.find(asset);
    if (it != overrides_.end()) {
        return it->second;
    }
    return defaults_for(asset);
}

Result<double> ParameterStore::get_value(const std::string& asset,
                                         const std::string& parameter) const {
    if (config_->assets.count(asset) == 0) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Unknown asset: " + asset,
                                  "ParameterStore");
    }
    LiveParameters live = get(asset);
    if (parameter == parameters::LAMBDA)
        return live.lambda;
    if (parameter == parameters::DF)
        return live.df;
    if (parameter == parameters::SIGMA_CAP_DAILY)
        return live.sigma_cap_daily;
    return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Unknown parameter: " + parameter,
                              "ParameterStore");
}

Result<void> ParameterStore::set_value(const std::string& asset, const std::string& parameter,
                                       double value) {
    if (!std::isfinite(value)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Non-finite value for " + asset + "." + parameter,
                                "ParameterStore");
    }

    if (parameter != parameters::LAMBDA && parameter != parameters::DF &&
        parameter != parameters::SIGMA_CAP_DAILY) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Unknown parameter: " + parameter,
                                "ParameterStore");
    }

    if (config_->assets.count(asset) == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Unknown asset: " + asset,
                                "ParameterStore");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = overrides_.find(asset);
    if (it == overrides_.end()) {
        it = overrides_.emplace(asset, defaults_for(asset)).first;
    }

    if (parameter == parameters::LAMBDA) {
        it->second.lambda = value;
    } else if (parameter == parameters::DF) {
        it->second.df = value;
    } else {
        it->second.sigma_cap_daily = value;
    }
    return Result<void>();
}

std::map<std::string, LiveParameters> ParameterStore::current_values() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, LiveParameters> values;
    for (const auto& entry : config_->assets) {
        values[entry.first] = defaults_for(entry.first);
    }
    for (const auto& [asset, live] : overrides_) {
        values[asset] = live;
    }
    return values;
}

}  // namespace forecast_ngin
