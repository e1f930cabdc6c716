// src/storage/state_persistence.cpp

#include "forecast_ngin/storage/state_persistence.hpp"
#include "forecast_ngin/core/logger.hpp"
#include "forecast_ngin/core/time_utils.hpp"

namespace forecast_ngin {

StatePersistence::StatePersistence(std::shared_ptr<StorageBackend> storage,
                                   PersistenceConfig config, Clock clock)
    : storage_(std::move(storage)), config_(std::move(config)), clock_(std::move(clock)) {}

Result<void> StatePersistence::save(const std::map<std::string, VolatilityState>& states) {
    Timestamp now = clock_();

    nlohmann::json doc;
    doc["format_version"] = FORMAT_VERSION;
    doc["saved_at"] = core::to_epoch_seconds(now);
    doc["states"] = nlohmann::json::object();
    for (const auto& [asset, state] : states) {
        doc["states"][asset] = state.to_json();
    }

    auto written = storage_->atomic_write(config_.state_key, doc.dump(2));
    if (written.is_error()) {
        ERROR("Failed to persist volatility state: " << written.error()->what());
        return written;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_saved_ = now;
    }
    DEBUG("Persisted volatility state for " << states.size() << " assets");
    return Result<void>();
}

LoadedStates StatePersistence::load() const {
    LoadedStates loaded;

    auto content = storage_->read_all(config_.state_key);
    if (content.is_error()) {
        if (content.error()->code() != ErrorCode::FILE_NOT_FOUND) {
            WARN("Volatility snapshot unreadable, bootstrapping all assets: "
                 << content.error()->what());
            loaded.snapshot_corrupt = true;
        } else {
            INFO("No volatility snapshot found, assets will bootstrap");
        }
        return loaded;
    }
    loaded.snapshot_found = true;

    nlohmann::json doc = nlohmann::json::parse(content.value(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("states") ||
        !doc.at("states").is_object() || !doc.contains("format_version") ||
        !doc.at("format_version").is_number_integer() ||
        doc.at("format_version").get<int>() != FORMAT_VERSION) {
        WARN("Volatility snapshot corrupt, bootstrapping all assets");
        loaded.snapshot_corrupt = true;
        return loaded;
    }

    for (const auto& [asset, record] : doc.at("states").items()) {
        auto state = VolatilityState::from_json(record);
        if (state.is_error() || state.value().asset_id != asset) {
            WARN("Discarding persisted state for " << asset << ": "
                                                   << (state.is_error()
                                                           ? state.error()->what()
                                                           : "asset id mismatch"));
            loaded.rejected_assets.push_back(asset);
            continue;
        }
        loaded.states.emplace(asset, state.value());
    }

    INFO("Reloaded volatility state for " << loaded.states.size() << " assets ("
                                          << loaded.rejected_assets.size() << " rejected)");
    return loaded;
}

Result<bool> StatePersistence::maybe_save(const VolatilityStateStore& store, bool dirty) {
    Timestamp now = clock_();
    bool due = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!last_saved_.has_value()) {
            due = true;
        } else {
            auto elapsed =
                std::chrono::duration_cast<std::chrono::seconds>(now - *last_saved_).count();
            due = elapsed >= config_.force_persist_interval_seconds ||
                  (dirty && elapsed >= config_.persist_interval_seconds);
        }
    }
    if (!due) {
        return false;
    }

    auto saved = save(store.snapshot_all());
    if (saved.is_error()) {
        return forward_error<bool>(saved, "StatePersistence");
    }
    return true;
}

std::optional<Timestamp> StatePersistence::last_saved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_saved_;
}

}  // namespace forecast_ngin
