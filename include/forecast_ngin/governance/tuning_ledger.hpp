// include/forecast_ngin/governance/tuning_ledger.hpp
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/parameter_store.hpp"
#include "forecast_ngin/core/types.hpp"
#include "forecast_ngin/storage/storage_backend.hpp"

namespace forecast_ngin {

/**
 * @brief One applied parameter change
 */
struct TuningHistoryEntry {
    std::string asset_id;
    std::string parameter_name;
    double old_value{0.0};
    double new_value{0.0};
    Timestamp timestamp{};
    std::string reason;

    nlohmann::json to_json() const;
    static Result<TuningHistoryEntry> from_json(const nlohmann::json& j);
};

/**
 * @brief Append-only history of parameter changes
 *
 * Stored as a single document {"format_version", "genesis", "entries"} that is
 * rewritten atomically on every append. The genesis timestamp is the first
 * time the ledger was created and anchors the first-tuning waiting period.
 */
class TuningLedger {
public:
    static constexpr int FORMAT_VERSION = 1;

    /**
     * @brief Check run against the current entries before an append
     */
    using AppendCheck = std::function<Result<void>(const std::vector<TuningHistoryEntry>&)>;

    TuningLedger(std::shared_ptr<StorageBackend> storage, std::string key,
                 Clock clock = system_now);

    /**
     * @brief Read the ledger document, creating it when absent
     * @return CORRUPT_PERSISTED_STATE if the document exists but does not validate
     */
    Result<void> load();

    /**
     * @brief Append entry if check passes, atomically with respect to other appends
     *
     * Nothing is modified if the check fails or the write fails.
     */
    Result<void> append_if(const TuningHistoryEntry& entry, const AppendCheck& check);

    /**
     * @brief Replay the latest value of every (asset, parameter) pair into a store
     */
    Result<void> apply_to(ParameterStore& store) const;

    std::vector<TuningHistoryEntry> entries() const;
    std::vector<TuningHistoryEntry> entries_for(const std::string& asset) const;
    Timestamp genesis() const;
    bool is_loaded() const;

private:
    Result<void> write(const std::vector<TuningHistoryEntry>& entries, const Timestamp& genesis);

    std::shared_ptr<StorageBackend> storage_;
    std::string key_;
    Clock clock_;

    mutable std::mutex mutex_;
    bool loaded_{false};
    Timestamp genesis_{};
    std::vector<TuningHistoryEntry> entries_;
};

}  // namespace forecast_ngin
