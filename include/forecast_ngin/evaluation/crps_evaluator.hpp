// include/forecast_ngin/evaluation/crps_evaluator.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/forecast_config.hpp"
#include "forecast_ngin/core/types.hpp"
#include "forecast_ngin/data/price_source.hpp"
#include "forecast_ngin/evaluation/prediction_record.hpp"

namespace forecast_ngin {

enum class ScoreStatus {
    SCORED,
    MISSING_REALIZED_DATA
};

inline std::string score_status_to_string(ScoreStatus status) {
    return status == ScoreStatus::SCORED ? "SCORED" : "MISSING_REALIZED_DATA";
}

/**
 * @brief Score of one grid point of one prediction
 *
 * For MISSING_REALIZED_DATA points score, realized and path0_gap are absent;
 * the ensemble percentiles are always filled.
 */
struct CRPSResult {
    std::string asset_id;
    Timestamp t0{};
    int step_index{0};
    Timestamp grid_ts{};
    HorizonBucket bucket{HorizonBucket::SHORT};
    ScoreStatus status{ScoreStatus::MISSING_REALIZED_DATA};
    std::optional<double> score;
    std::optional<double> realized;
    std::optional<double> path0_gap;
    double p05{0.0};
    double p50{0.0};
    double p95{0.0};

    bool is_scored() const {
        return status == ScoreStatus::SCORED;
    }

    nlohmann::json to_json() const;
    static Result<CRPSResult> from_json(const nlohmann::json& j);
};

/**
 * @brief Empirical CRPS of stored ensembles against realized prices
 *
 * At each grid point t0 + k * increment, with X_1..X_999 the stochastic
 * paths (path 0 excluded) and y the realized price:
 *   CRPS = mean_i |X_i - y| - 0.5 * mean_{i,j} |X_i - X_j|
 * where the pairwise mean runs over all n^2 ordered pairs.
 */
class CrpsEvaluator {
public:
    explicit CrpsEvaluator(BucketConfig buckets);

    /**
     * @brief Score every grid point of a record
     *
     * Grid points missing from realized, or whose realized value is not
     * finite and positive, are reported as MISSING_REALIZED_DATA and do not
     * stop the rest of the evaluation.
     *
     * @return INVALID_DATA if the stored ensemble is malformed
     */
    Result<std::vector<CRPSResult>> score(const PredictionRecord& record,
                                          const RealizedSeries& realized) const;

    /**
     * @brief CRPS of one sample set against one realized value
     * Uses the sorted-sample identity sum_{i,j}|x_i - x_j| = 2 sum_k x_(k) (2k - n - 1).
     */
    static double crps(std::vector<double> samples, double realized);

    /**
     * @brief Percentile of sorted samples with linear interpolation, q in [0, 100]
     */
    static double percentile(const std::vector<double>& sorted, double q);

private:
    BucketConfig buckets_;
};

}  // namespace forecast_ngin
