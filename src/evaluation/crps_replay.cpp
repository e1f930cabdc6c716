// src/evaluation/crps_replay.cpp

#include "forecast_ngin/evaluation/crps_replay.hpp"
#include <cmath>
#include <map>
#include <set>
#include "forecast_ngin/core/logger.hpp"
#include "forecast_ngin/core/time_utils.hpp"

namespace forecast_ngin {

namespace {

using ScoredKey = std::pair<std::string, long long>;

// Millisecond key; t0 is stored as fractional epoch seconds
ScoredKey scored_key(const std::string& asset, double t0_epoch) {
    return {asset, std::llround(t0_epoch * 1000.0)};
}

}  // namespace

CrpsReplay::CrpsReplay(std::shared_ptr<PredictionLogger> predictions,
                       std::shared_ptr<PriceSource> prices,
                       std::shared_ptr<StorageBackend> storage, CrpsEvaluator evaluator)
    : predictions_(std::move(predictions)),
      prices_(std::move(prices)),
      storage_(std::move(storage)),
      evaluator_(std::move(evaluator)) {}

Result<std::vector<CRPSResult>> CrpsReplay::replay_record(const PredictionRecord& record) const {
    auto realized = prices_->get_realized(record.asset_id, record.ensemble.grid());
    if (realized.is_error()) {
        return forward_error<std::vector<CRPSResult>>(realized, "CrpsReplay");
    }
    return evaluator_.score(record, realized.value());
}

Result<ReplaySummary> CrpsReplay::replay_range(const Timestamp& first_day,
                                               const Timestamp& last_day,
                                               const std::optional<std::string>& asset) {
    Logger::register_component("CrpsReplay");

    auto records = predictions_->load(first_day, last_day, asset);
    if (records.is_error()) {
        return forward_error<ReplaySummary>(records, "CrpsReplay");
    }

    ReplaySummary summary;
    summary.predictions = records.value().size();
    INFO("Replaying " << summary.predictions << " predictions");

    // Predictions already scored in each result partition
    std::map<std::string, std::set<ScoredKey>> scored_by_partition;

    for (const auto& record : records.value()) {
        const std::string partition = day_partition(PARTITION, record.t0);
        auto known = scored_by_partition.find(partition);
        if (known == scored_by_partition.end()) {
            auto existing = scored_in(partition);
            if (existing.is_error()) {
                return forward_error<ReplaySummary>(existing, "CrpsReplay");
            }
            known = scored_by_partition.emplace(partition, existing.take_value()).first;
        }
        const ScoredKey key = scored_key(record.asset_id, core::to_epoch_seconds(record.t0));
        if (known->second.count(key) > 0) {
            DEBUG("Already scored " << record.asset_id << " t0=" << core::to_iso8601(record.t0));
            ++summary.skipped;
            continue;
        }

        auto scored = replay_record(record);
        if (scored.is_error()) {
            WARN("Replay failed for " << record.asset_id << " t0=" << core::to_iso8601(record.t0)
                                      << ": " << scored.error()->what());
            ++summary.failed;
            continue;
        }

        for (const auto& result : scored.value()) {
            auto appended = storage_->append(partition, result.to_json().dump());
            if (appended.is_error()) {
                return forward_error<ReplaySummary>(appended, "CrpsReplay");
            }
            summary.results.push_back(result);
        }
        known->second.insert(key);
        ++summary.replayed;
    }

    INFO("Replay complete: " << summary.replayed << "/" << summary.predictions << " predictions, "
                             << summary.skipped << " already scored, " << summary.results.size()
                             << " grid points");
    return Result<ReplaySummary>(std::move(summary));
}

Result<std::set<std::pair<std::string, long long>>> CrpsReplay::scored_in(
    const std::string& partition) const {
    std::set<ScoredKey> keys;
    auto lines = storage_->read(partition);
    if (lines.is_error()) {
        if (lines.error()->code() == ErrorCode::FILE_NOT_FOUND) {
            return Result<std::set<ScoredKey>>(std::move(keys));
        }
        return forward_error<std::set<ScoredKey>>(lines, "CrpsReplay");
    }
    for (const auto& line : lines.value()) {
        nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("asset") || !j.contains("t0") ||
            !j.at("asset").is_string() || !j.at("t0").is_number()) {
            continue;
        }
        keys.insert(scored_key(j.at("asset").get<std::string>(), j.at("t0").get<double>()));
    }
    return Result<std::set<ScoredKey>>(std::move(keys));
}

Result<std::vector<CRPSResult>> CrpsReplay::load_results(const Timestamp& first_day,
                                                         const Timestamp& last_day) const {
    std::vector<CRPSResult> results;
    for (Timestamp day = core::utc_day_start(first_day); day <= last_day;
         day += std::chrono::hours(24)) {
        auto lines = storage_->read(day_partition(PARTITION, day));
        if (lines.is_error()) {
            if (lines.error()->code() == ErrorCode::FILE_NOT_FOUND) {
                continue;
            }
            return forward_error<std::vector<CRPSResult>>(lines, "CrpsReplay");
        }
        for (const auto& line : lines.value()) {
            nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
            if (j.is_discarded()) {
                WARN("Skipping unparsable CRPS line");
                continue;
            }
            auto result = CRPSResult::from_json(j);
            if (result.is_error()) {
                WARN("Skipping malformed CRPS result: " << result.error()->what());
                continue;
            }
            results.push_back(result.value());
        }
    }
    return Result<std::vector<CRPSResult>>(std::move(results));
}

}  // namespace forecast_ngin
