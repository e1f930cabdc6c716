// src/evaluation/prediction_logger.cpp

#include "forecast_ngin/evaluation/prediction_logger.hpp"
#include "forecast_ngin/core/logger.hpp"
#include "forecast_ngin/core/time_utils.hpp"

namespace forecast_ngin {

PredictionLogger::PredictionLogger(std::shared_ptr<StorageBackend> storage,
                                   PersistenceConfig config)
    : storage_(std::move(storage)), config_(std::move(config)) {}

int64_t PredictionLogger::interval_for(HorizonLabel label) const {
    switch (label) {
        case HorizonLabel::HIGH:
            return config_.sample_interval_high_seconds;
        case HorizonLabel::LOW:
            return config_.sample_interval_low_seconds;
        default:
            return config_.sample_interval_custom_seconds;
    }
}

bool PredictionLogger::slot_open(const SlotKey& key, const Timestamp& request_time) const {
    auto it = last_logged_.find(key);
    if (it == last_logged_.end()) {
        return true;
    }
    auto elapsed =
        std::chrono::duration_cast<std::chrono::seconds>(request_time - it->second).count();
    return elapsed >= interval_for(key.second);
}

bool PredictionLogger::should_log(const std::string& asset, HorizonLabel label,
                                  const Timestamp& request_time) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot_open({asset, label}, request_time);
}

Result<void> PredictionLogger::log(const PredictionRecord& record) {
    std::string partition = day_partition(PARTITION, record.t0);
    auto appended = storage_->append(partition, record.to_json().dump());
    if (appended.is_error()) {
        WARN("Failed to log prediction for " << record.asset_id << ": "
                                             << appended.error()->what());
        return appended;
    }
    DEBUG("Logged prediction " << record.asset_id << " "
                               << horizon_label_to_string(record.label) << " to " << partition);
    return Result<void>();
}

Result<bool> PredictionLogger::maybe_log(const PredictionRecord& record) {
    const SlotKey key{record.asset_id, record.label};
    std::optional<Timestamp> previous;
    {
        // Reserve the slot first so concurrent requests do not both log
        std::lock_guard<std::mutex> lock(mutex_);
        if (!slot_open(key, record.request_time)) {
            return false;
        }
        auto it = last_logged_.find(key);
        if (it != last_logged_.end()) {
            previous = it->second;
        }
        last_logged_[key] = record.request_time;
    }

    auto written = log(record);
    if (written.is_error()) {
        // Release the reservation so the next request can retry
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_logged_.find(key);
        if (it != last_logged_.end() && it->second == record.request_time) {
            if (previous.has_value()) {
                it->second = *previous;
            } else {
                last_logged_.erase(it);
            }
        }
        return forward_error<bool>(written, "PredictionLogger");
    }
    return true;
}

Result<std::vector<PredictionRecord>> PredictionLogger::load(
    const Timestamp& first_day, const Timestamp& last_day,
    const std::optional<std::string>& asset) const {
    std::vector<PredictionRecord> records;

    for (Timestamp day = core::utc_day_start(first_day); day <= last_day;
         day += std::chrono::hours(24)) {
        auto lines = storage_->read(day_partition(PARTITION, day));
        if (lines.is_error()) {
            if (lines.error()->code() == ErrorCode::FILE_NOT_FOUND) {
                continue;
            }
            return forward_error<std::vector<PredictionRecord>>(lines, "PredictionLogger");
        }

        for (const auto& line : lines.value()) {
            nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
            if (j.is_discarded()) {
                WARN("Skipping unparsable prediction line in " << core::to_iso8601(day));
                continue;
            }
            auto record = PredictionRecord::from_json(j);
            if (record.is_error()) {
                WARN("Skipping malformed prediction record: " << record.error()->what());
                continue;
            }
            if (asset.has_value() && record.value().asset_id != *asset) {
                continue;
            }
            records.push_back(record.take_value());
        }
    }
    return Result<std::vector<PredictionRecord>>(std::move(records));
}

}  // namespace forecast_ngin
