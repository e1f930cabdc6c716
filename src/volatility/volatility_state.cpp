// src/volatility/volatility_state.cpp

#include "forecast_ngin/volatility/volatility_state.hpp"
#include <cmath>
#include "forecast_ngin/core/logger.hpp"
#include "forecast_ngin/core/time_utils.hpp"
#include "forecast_ngin/volatility/volatility_bootstrap.hpp"

namespace forecast_ngin {

nlohmann::json VolatilityState::to_json() const {
    nlohmann::json j;
    j["asset_id"] = asset_id;
    j["variance_estimate"] = variance_estimate;
    j["decay_lambda"] = decay_lambda;
    j["last_update_ts"] = core::to_epoch_seconds(last_update_ts);
    j["sample_count"] = sample_count;
    if (last_price.has_value()) {
        j["last_price"] = *last_price;
    } else {
        j["last_price"] = nullptr;
    }
    return j;
}

Result<VolatilityState> VolatilityState::from_json(const nlohmann::json& j) {
    auto corrupt = [](const std::string& why) {
        return make_error<VolatilityState>(ErrorCode::CORRUPT_PERSISTED_STATE, why,
                                           "VolatilityState");
    };

    try {
        if (!j.is_object()) {
            return corrupt("record is not an object");
        }
        for (const char* key :
             {"asset_id", "variance_estimate", "decay_lambda", "last_update_ts", "sample_count"}) {
            if (!j.contains(key)) {
                return corrupt(std::string("missing field ") + key);
            }
        }

        VolatilityState state;
        state.asset_id = j.at("asset_id").get<std::string>();
        state.variance_estimate = j.at("variance_estimate").get<double>();
        state.decay_lambda = j.at("decay_lambda").get<double>();
        double ts = j.at("last_update_ts").get<double>();

        const auto& count = j.at("sample_count");
        if (!count.is_number_integer() || count.get<int64_t>() < 0) {
            return corrupt("sample_count must be a non-negative integer");
        }
        state.sample_count = count.get<uint64_t>();

        if (state.asset_id.empty()) {
            return corrupt("empty asset_id");
        }
        if (!std::isfinite(state.variance_estimate) || state.variance_estimate < 0.0) {
            return corrupt("variance_estimate must be finite and non-negative");
        }
        if (!std::isfinite(state.decay_lambda) || state.decay_lambda <= 0.0 ||
            state.decay_lambda >= 1.0) {
            return corrupt("decay_lambda must be in (0, 1)");
        }
        if (!std::isfinite(ts)) {
            return corrupt("last_update_ts must be finite");
        }
        state.last_update_ts = core::from_epoch_seconds(ts);

        if (j.contains("last_price") && !j.at("last_price").is_null()) {
            double price = j.at("last_price").get<double>();
            if (!std::isfinite(price) || price <= 0.0) {
                return corrupt("last_price must be finite and positive");
            }
            state.last_price = price;
        }
        return state;
    } catch (const nlohmann::json::exception& e) {
        return corrupt(std::string("malformed record: ") + e.what());
    }
}

VolatilityStateStore::VolatilityStateStore(std::shared_ptr<ParameterStore> parameters,
                                           std::shared_ptr<VolatilityBootstrap> bootstrap,
                                           Clock clock)
    : parameters_(std::move(parameters)),
      bootstrap_(std::move(bootstrap)),
      clock_(std::move(clock)) {}

std::shared_ptr<VolatilityStateStore::Entry> VolatilityStateStore::entry_for(
    const std::string& asset) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto& entry = entries_[asset];
    if (!entry) {
        entry = std::make_shared<Entry>();
    }
    return entry;
}

std::shared_ptr<VolatilityStateStore::Entry> VolatilityStateStore::find_entry(
    const std::string& asset) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = entries_.find(asset);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

Result<void> VolatilityStateStore::ensure_initialized(Entry& entry, const std::string& asset) {
    if (entry.state.has_value()) {
        return Result<void>();
    }
    if (!bootstrap_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                "No state and no bootstrap available for " + asset,
                                "VolatilityStateStore");
    }

    double lambda = parameters_->get(asset).lambda;
    auto boot = bootstrap_->bootstrap(asset, clock_(), lambda);
    if (boot.is_error()) {
        return make_error<void>(boot.error()->code(), boot.error()->what(),
                                "VolatilityStateStore");
    }
    entry.state = boot.value();
    INFO("Bootstrapped " << asset << " variance=" << entry.state->variance_estimate
                         << " lambda=" << entry.state->decay_lambda);
    return Result<void>();
}

Result<VolatilityState> VolatilityStateStore::apply_return(Entry& entry, const std::string& asset,
                                                           double log_return, const Timestamp& ts,
                                                           std::optional<Price> price) {
    VolatilityState& current = *entry.state;

    if (ts < current.last_update_ts) {
        WARN("Rejected out-of-order observation for " << asset);
        return make_error<VolatilityState>(ErrorCode::INVALID_OBSERVATION,
                                           "Observation older than last update for " + asset,
                                           "VolatilityStateStore");
    }

    double lambda = parameters_->get(asset).lambda;
    if (!std::isfinite(lambda) || lambda <= 0.0 || lambda >= 1.0) {
        return make_error<VolatilityState>(ErrorCode::INVALID_ARGUMENT,
                                           "Live lambda outside (0, 1) for " + asset,
                                           "VolatilityStateStore");
    }

    double next = lambda * current.variance_estimate + (1.0 - lambda) * log_return * log_return;
    if (!std::isfinite(next) || next < 0.0) {
        WARN("Rejected observation for " << asset << ": variance would become " << next);
        return make_error<VolatilityState>(ErrorCode::INVALID_OBSERVATION,
                                           "Update would produce an invalid variance for " + asset,
                                           "VolatilityStateStore");
    }

    current.variance_estimate = next;
    current.decay_lambda = lambda;
    current.last_update_ts = ts;
    current.sample_count += 1;
    if (price.has_value()) {
        current.last_price = price;
    }
    TRACE(asset << " r=" << log_return << " variance=" << next);
    return current;
}

Result<VolatilityState> VolatilityStateStore::update(const std::string& asset, double log_return,
                                                     const Timestamp& ts) {
    if (!std::isfinite(log_return)) {
        WARN("Rejected non-finite return for " << asset);
        return make_error<VolatilityState>(ErrorCode::INVALID_OBSERVATION,
                                           "Non-finite log return for " + asset,
                                           "VolatilityStateStore");
    }

    auto entry = entry_for(asset);
    std::unique_lock<std::shared_mutex> lock(entry->mutex);

    auto init = ensure_initialized(*entry, asset);
    if (init.is_error()) {
        return forward_error<VolatilityState>(init, "VolatilityStateStore");
    }
    return apply_return(*entry, asset, log_return, ts, std::nullopt);
}

Result<VolatilityState> VolatilityStateStore::observe_price(const std::string& asset, Price price,
                                                            const Timestamp& ts) {
    if (!std::isfinite(price) || price <= 0.0) {
        WARN("Rejected price " << price << " for " << asset);
        return make_error<VolatilityState>(ErrorCode::INVALID_OBSERVATION,
                                           "Price must be finite and positive for " + asset,
                                           "VolatilityStateStore");
    }

    auto entry = entry_for(asset);
    std::unique_lock<std::shared_mutex> lock(entry->mutex);

    auto init = ensure_initialized(*entry, asset);
    if (init.is_error()) {
        return forward_error<VolatilityState>(init, "VolatilityStateStore");
    }

    VolatilityState& current = *entry->state;
    if (!current.last_price.has_value()) {
        if (ts < current.last_update_ts) {
            return make_error<VolatilityState>(ErrorCode::INVALID_OBSERVATION,
                                               "Observation older than last update for " + asset,
                                               "VolatilityStateStore");
        }
        current.last_price = price;
        current.last_update_ts = ts;
        return current;
    }

    double log_return = std::log(price / *current.last_price);
    return apply_return(*entry, asset, log_return, ts, price);
}

Result<VolatilityState> VolatilityStateStore::get(const std::string& asset) {
    auto entry = entry_for(asset);
    {
        std::shared_lock<std::shared_mutex> read_lock(entry->mutex);
        if (entry->state.has_value()) {
            return *entry->state;
        }
    }

    // Re-checked under the exclusive lock: a concurrent caller may have won
    std::unique_lock<std::shared_mutex> lock(entry->mutex);
    auto init = ensure_initialized(*entry, asset);
    if (init.is_error()) {
        return forward_error<VolatilityState>(init, "VolatilityStateStore");
    }
    return *entry->state;
}

std::optional<VolatilityState> VolatilityStateStore::peek(const std::string& asset) const {
    auto entry = find_entry(asset);
    if (!entry) {
        return std::nullopt;
    }
    std::shared_lock<std::shared_mutex> lock(entry->mutex);
    return entry->state;
}

Result<void> VolatilityStateStore::seed(const std::string& asset, double variance,
                                        std::optional<Price> price, const Timestamp& ts) {
    if (!std::isfinite(variance) || variance < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Seed variance must be finite and non-negative",
                                "VolatilityStateStore");
    }
    if (price.has_value() && (!std::isfinite(*price) || *price <= 0.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Seed price must be finite and positive", "VolatilityStateStore");
    }

    VolatilityState state;
    state.asset_id = asset;
    state.variance_estimate = variance;
    state.decay_lambda = parameters_->get(asset).lambda;
    state.last_update_ts = ts;
    state.last_price = price;

    auto entry = entry_for(asset);
    std::unique_lock<std::shared_mutex> lock(entry->mutex);
    entry->state = state;
    return Result<void>();
}

void VolatilityStateStore::reset(const std::string& asset) {
    auto entry = find_entry(asset);
    if (!entry) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(entry->mutex);
    entry->state.reset();
}

std::map<std::string, VolatilityState> VolatilityStateStore::snapshot_all() const {
    std::vector<std::pair<std::string, std::shared_ptr<Entry>>> entries;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        entries.assign(entries_.begin(), entries_.end());
    }

    std::map<std::string, VolatilityState> states;
    for (const auto& [asset, entry] : entries) {
        std::shared_lock<std::shared_mutex> lock(entry->mutex);
        if (entry->state.has_value()) {
            states.emplace(asset, *entry->state);
        }
    }
    return states;
}

void VolatilityStateStore::restore(const std::map<std::string, VolatilityState>& states) {
    for (const auto& [asset, state] : states) {
        auto entry = entry_for(asset);
        std::unique_lock<std::shared_mutex> lock(entry->mutex);
        if (!entry->state.has_value()) {
            entry->state = state;
        }
    }
}

}  // namespace forecast_ngin
