// include/forecast_ngin/evaluation/crps_replay.hpp
#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/data/price_source.hpp"
#include "forecast_ngin/evaluation/crps_evaluator.hpp"
#include "forecast_ngin/evaluation/prediction_logger.hpp"
#include "forecast_ngin/storage/storage_backend.hpp"

namespace forecast_ngin {

struct ReplaySummary {
    size_t predictions{0};
    size_t replayed{0};
    size_t failed{0};  // Realized prices could not be fetched or record unusable
    size_t skipped{0};  // Results for (asset, t0) already stored
    std::vector<CRPSResult> results;
};

/**
 * @brief Offline scoring of logged predictions
 *
 * Consumes the stored ensembles as they were written; nothing is regenerated.
 */
class CrpsReplay {
public:
    static constexpr const char* PARTITION = "crps_results";

    CrpsReplay(std::shared_ptr<PredictionLogger> predictions, std::shared_ptr<PriceSource> prices,
               std::shared_ptr<StorageBackend> storage, CrpsEvaluator evaluator);

    /**
     * @brief Fetch realized prices for a record's grid and score it
     */
    Result<std::vector<CRPSResult>> replay_record(const PredictionRecord& record) const;

    /**
     * @brief Replay every logged prediction with t0 in [first_day, last_day]
     *
     * Results are appended to crps_results/YYYY-MM/crps_results_YYYY-MM-DD.jsonl.
     * Predictions whose (asset, t0) already has results there are skipped, so
     * re-running a range does not duplicate scores.
     */
    Result<ReplaySummary> replay_range(const Timestamp& first_day, const Timestamp& last_day,
                                       const std::optional<std::string>& asset = std::nullopt);

    /**
     * @brief Stored results with t0 in [first_day, last_day]
     */
    Result<std::vector<CRPSResult>> load_results(const Timestamp& first_day,
                                                 const Timestamp& last_day) const;

private:
    // (asset, t0 in epoch milliseconds) of results already in a partition
    Result<std::set<std::pair<std::string, long long>>> scored_in(
        const std::string& partition) const;

    std::shared_ptr<PredictionLogger> predictions_;
    std::shared_ptr<PriceSource> prices_;
    std::shared_ptr<StorageBackend> storage_;
    CrpsEvaluator evaluator_;
};

}  // namespace forecast_ngin
