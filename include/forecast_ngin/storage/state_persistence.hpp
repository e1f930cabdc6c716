// include/forecast_ngin/storage/state_persistence.hpp
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/forecast_config.hpp"
#include "forecast_ngin/core/types.hpp"
#include "forecast_ngin/storage/storage_backend.hpp"
#include "forecast_ngin/volatility/volatility_state.hpp"

namespace forecast_ngin {

/**
 * @brief Outcome of reloading the volatility snapshot
 */
struct LoadedStates {
    std::map<std::string, VolatilityState> states;
    std::vector<std::string> rejected_assets;  // Records that failed validation
    bool snapshot_found{false};
    bool snapshot_corrupt{false};  // Whole document unreadable, nothing loaded
};

/**
 * @brief Saves and reloads the per-asset volatility states
 *
 * Document layout: {"format_version": 1, "saved_at": <epoch s>, "states": {asset: record}}.
 * Reload fails closed: a record or document that does not validate is
 * reported and treated as absent so the asset bootstraps again.
 */
class StatePersistence {
public:
    static constexpr int FORMAT_VERSION = 1;

    StatePersistence(std::shared_ptr<StorageBackend> storage, PersistenceConfig config,
                     Clock clock = system_now);

    /**
     * @brief Write all states through an atomic replace
     */
    Result<void> save(const std::map<std::string, VolatilityState>& states);

    /**
     * @brief Read back the last snapshot, never failing on bad content
     */
    LoadedStates load() const;

    /**
     * @brief Save if the throttle allows it
     *
     * Saves when nothing was saved yet, when dirty and persist_interval has
     * elapsed, or when force_persist_interval has elapsed regardless.
     *
     * @return true if a snapshot was written
     */
    Result<bool> maybe_save(const VolatilityStateStore& store, bool dirty);

    std::optional<Timestamp> last_saved() const;

private:
    std::shared_ptr<StorageBackend> storage_;
    PersistenceConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::optional<Timestamp> last_saved_;
};

}  // namespace forecast_ngin
