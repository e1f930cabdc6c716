// src/governance/tuning_ledger.cpp

#include "forecast_ngin/governance/tuning_ledger.hpp"
#include <cmath>
#include "forecast_ngin/core/logger.hpp"
#include "forecast_ngin/core/time_utils.hpp"

namespace forecast_ngin {

nlohmann::json TuningHistoryEntry::to_json() const {
    nlohmann::json j;
    j["asset"] = asset_id;
    j["parameter"] = parameter_name;
    j["old_value"] = old_value;
    j["new_value"] = new_value;
    j["timestamp"] = core::to_iso8601(timestamp);
    j["reason"] = reason;
    return j;
}

Result<TuningHistoryEntry> TuningHistoryEntry::from_json(const nlohmann::json& j) {
    try {
        TuningHistoryEntry entry;
        entry.asset_id = j.at("asset").get<std::string>();
        entry.parameter_name = j.at("parameter").get<std::string>();
        entry.old_value = j.at("old_value").get<double>();
        entry.new_value = j.at("new_value").get<double>();
        entry.reason = j.contains("reason") ? j.at("reason").get<std::string>() : "";

        auto ts = core::from_iso8601(j.at("timestamp").get<std::string>());
        if (!ts.has_value()) {
            return make_error<TuningHistoryEntry>(ErrorCode::CORRUPT_PERSISTED_STATE,
                                                  "Unparsable tuning timestamp", "TuningLedger");
        }
        entry.timestamp = *ts;

        if (entry.asset_id.empty() || !std::isfinite(entry.old_value) ||
            !std::isfinite(entry.new_value)) {
            return make_error<TuningHistoryEntry>(ErrorCode::CORRUPT_PERSISTED_STATE,
                                                  "Invalid tuning entry", "TuningLedger");
        }
        return entry;
    } catch (const nlohmann::json::exception& e) {
        return make_error<TuningHistoryEntry>(ErrorCode::CORRUPT_PERSISTED_STATE,
                                              std::string("Malformed tuning entry: ") + e.what(),
                                              "TuningLedger");
    }
}

TuningLedger::TuningLedger(std::shared_ptr<StorageBackend> storage, std::string key, Clock clock)
    : storage_(std::move(storage)), key_(std::move(key)), clock_(std::move(clock)) {}

Result<void> TuningLedger::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto content = storage_->read_all(key_);
    if (content.is_error()) {
        if (content.error()->code() != ErrorCode::FILE_NOT_FOUND) {
            return forward_error<void>(content, "TuningLedger");
        }
        const Timestamp genesis = core::truncate_to_seconds(clock_());
        auto written = write({}, genesis);
        if (written.is_error()) {
            return written;
        }
        genesis_ = genesis;
        entries_.clear();
        loaded_ = true;
        INFO("Created tuning ledger " << key_ << " with genesis " << core::to_iso8601(genesis));
        return Result<void>();
    }

    nlohmann::json doc = nlohmann::json::parse(content.value(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("genesis") ||
        !doc.at("genesis").is_string() || !doc.contains("entries") ||
        !doc.at("entries").is_array()) {
        return make_error<void>(ErrorCode::CORRUPT_PERSISTED_STATE,
                                "Tuning ledger " + key_ + " is corrupt", "TuningLedger");
    }

    auto genesis = core::from_iso8601(doc.at("genesis").get<std::string>());
    if (!genesis.has_value()) {
        return make_error<void>(ErrorCode::CORRUPT_PERSISTED_STATE,
                                "Tuning ledger genesis is unparsable", "TuningLedger");
    }

    std::vector<TuningHistoryEntry> entries;
    for (const auto& item : doc.at("entries")) {
        auto entry = TuningHistoryEntry::from_json(item);
        if (entry.is_error()) {
            return forward_error<void>(entry, "TuningLedger");
        }
        entries.push_back(entry.value());
    }

    genesis_ = *genesis;
    entries_ = std::move(entries);
    loaded_ = true;
    INFO("Loaded tuning ledger with " << entries_.size() << " entries");
    return Result<void>();
}

Result<void> TuningLedger::write(const std::vector<TuningHistoryEntry>& entries,
                                 const Timestamp& genesis) {
    nlohmann::json doc;
    doc["format_version"] = FORMAT_VERSION;
    doc["genesis"] = core::to_iso8601(genesis);
    doc["entries"] = nlohmann::json::array();
    for (const auto& entry : entries) {
        doc["entries"].push_back(entry.to_json());
    }
    return storage_->atomic_write(key_, doc.dump(2));
}

Result<void> TuningLedger::append_if(const TuningHistoryEntry& entry, const AppendCheck& check) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loaded_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Tuning ledger not loaded",
                                "TuningLedger");
    }

    if (check) {
        auto allowed = check(entries_);
        if (allowed.is_error()) {
            return allowed;
        }
    }

    std::vector<TuningHistoryEntry> next = entries_;
    next.push_back(entry);
    auto written = write(next, genesis_);
    if (written.is_error()) {
        ERROR("Failed to write tuning ledger: " << written.error()->what());
        return written;
    }
    entries_ = std::move(next);
    return Result<void>();
}

Result<void> TuningLedger::apply_to(ParameterStore& store) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        auto applied = store.set_value(entry.asset_id, entry.parameter_name, entry.new_value);
        if (applied.is_error()) {
            return applied;
        }
    }
    return Result<void>();
}

std::vector<TuningHistoryEntry> TuningLedger::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::vector<TuningHistoryEntry> TuningLedger::entries_for(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TuningHistoryEntry> result;
    for (const auto& entry : entries_) {
        if (entry.asset_id == asset) {
            result.push_back(entry);
        }
    }
    return result;
}

Timestamp TuningLedger::genesis() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return genesis_;
}

bool TuningLedger::is_loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_;
}

}  // namespace forecast_ngin
