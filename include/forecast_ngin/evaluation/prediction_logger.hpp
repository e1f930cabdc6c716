// include/forecast_ngin/evaluation/prediction_logger.hpp
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/forecast_config.hpp"
#include "forecast_ngin/evaluation/prediction_record.hpp"
#include "forecast_ngin/storage/storage_backend.hpp"

namespace forecast_ngin {

/**
 * @brief Retains a sampled subset of generated ensembles for later scoring
 *
 * At most one record per (asset, horizon label) per sampling interval is
 * kept. Records are appended as JSON lines to the day partition of their t0.
 */
class PredictionLogger {
public:
    static constexpr const char* PARTITION = "predictions";

    PredictionLogger(std::shared_ptr<StorageBackend> storage, PersistenceConfig config);

    /**
     * @brief Whether a record requested at request_time would be retained
     */
    bool should_log(const std::string& asset, HorizonLabel label,
                    const Timestamp& request_time) const;

    /**
     * @brief Append the record if the sampling interval allows it
     *
     * A failed write leaves the slot open, so the next request retries.
     *
     * @return true if the record was written
     */
    Result<bool> maybe_log(const PredictionRecord& record);

    /**
     * @brief Append the record unconditionally
     */
    Result<void> log(const PredictionRecord& record);

    /**
     * @brief Records whose t0 falls on a UTC day in [first_day, last_day]
     * Malformed lines are skipped with a warning.
     */
    Result<std::vector<PredictionRecord>> load(const Timestamp& first_day,
                                               const Timestamp& last_day,
                                               const std::optional<std::string>& asset =
                                                   std::nullopt) const;

private:
    using SlotKey = std::pair<std::string, HorizonLabel>;

    int64_t interval_for(HorizonLabel label) const;
    // Caller holds mutex_
    bool slot_open(const SlotKey& key, const Timestamp& request_time) const;

    std::shared_ptr<StorageBackend> storage_;
    PersistenceConfig config_;

    mutable std::mutex mutex_;
    std::map<SlotKey, Timestamp> last_logged_;
};

}  // namespace forecast_ngin
