// src/evaluation/crps_evaluator.cpp

#include "forecast_ngin/evaluation/crps_evaluator.hpp"
#include <algorithm>
#include <cmath>
#include "forecast_ngin/core/logger.hpp"
#include "forecast_ngin/core/time_utils.hpp"

namespace forecast_ngin {

namespace {

void put_optional(nlohmann::json& j, const char* key, const std::optional<double>& value) {
    if (value.has_value()) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

std::optional<double> get_optional(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<double>();
}

}  // namespace

nlohmann::json CRPSResult::to_json() const {
    nlohmann::json j;
    j["asset"] = asset_id;
    j["t0"] = core::to_epoch_seconds(t0);
    j["step_index"] = step_index;
    j["grid_ts"] = core::to_epoch_seconds(grid_ts);
    j["bucket"] = horizon_bucket_to_string(bucket);
    j["status"] = score_status_to_string(status);
    put_optional(j, "crps", score);
    put_optional(j, "realized", realized);
    put_optional(j, "path0_gap", path0_gap);
    j["p05"] = p05;
    j["p50"] = p50;
    j["p95"] = p95;
    return j;
}

Result<CRPSResult> CRPSResult::from_json(const nlohmann::json& j) {
    try {
        CRPSResult r;
        r.asset_id = j.at("asset").get<std::string>();
        r.t0 = core::from_epoch_seconds(j.at("t0").get<double>());
        r.step_index = j.at("step_index").get<int>();
        r.grid_ts = core::from_epoch_seconds(j.at("grid_ts").get<double>());
        r.bucket = horizon_bucket_from_string(j.at("bucket").get<std::string>());
        r.status = j.at("status").get<std::string>() == "SCORED"
                       ? ScoreStatus::SCORED
                       : ScoreStatus::MISSING_REALIZED_DATA;
        r.score = get_optional(j, "crps");
        r.realized = get_optional(j, "realized");
        r.path0_gap = get_optional(j, "path0_gap");
        r.p05 = j.at("p05").get<double>();
        r.p50 = j.at("p50").get<double>();
        r.p95 = j.at("p95").get<double>();
        if (r.is_scored() && !r.score.has_value()) {
            return make_error<CRPSResult>(ErrorCode::INVALID_DATA, "Scored result without score",
                                          "CRPSResult");
        }
        return r;
    } catch (const nlohmann::json::exception& e) {
        return make_error<CRPSResult>(ErrorCode::JSON_PARSE_ERROR,
                                      std::string("Malformed CRPS result: ") + e.what(),
                                      "CRPSResult");
    }
}

CrpsEvaluator::CrpsEvaluator(BucketConfig buckets) : buckets_(std::move(buckets)) {}

double CrpsEvaluator::percentile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) {
        return std::nan("");
    }
    const double position = (q / 100.0) * static_cast<double>(sorted.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(position));
    const size_t upper = std::min(lower + 1, sorted.size() - 1);
    const double fraction = position - static_cast<double>(lower);
    return sorted[lower] + fraction * (sorted[upper] - sorted[lower]);
}

double CrpsEvaluator::crps(std::vector<double> samples, double realized) {
    const size_t n = samples.size();
    if (n == 0) {
        return std::nan("");
    }
    std::sort(samples.begin(), samples.end());

    double abs_error = 0.0;
    double weighted = 0.0;
    const double nd = static_cast<double>(n);
    for (size_t k = 0; k < n; ++k) {
        abs_error += std::fabs(samples[k] - realized);
        // Rank is k + 1, so the weight 2(k + 1) - n - 1 simplifies to 2k - n + 1
        weighted += samples[k] * (2.0 * static_cast<double>(k) - nd + 1.0);
    }

    const double mean_abs_error = abs_error / nd;
    const double mean_pairwise = 2.0 * weighted / (nd * nd);
    return mean_abs_error - 0.5 * mean_pairwise;
}

Result<std::vector<CRPSResult>> CrpsEvaluator::score(const PredictionRecord& record,
                                                     const RealizedSeries& realized) const {
    const PathEnsemble& ensemble = record.ensemble;
    if (ensemble.paths.rows() != kEnsembleSize || ensemble.step_count < 1 ||
        ensemble.paths.cols() != ensemble.step_count) {
        return make_error<std::vector<CRPSResult>>(ErrorCode::INVALID_DATA,
                                                   "Stored ensemble for " + record.asset_id +
                                                       " has the wrong shape",
                                                   "CrpsEvaluator");
    }

    std::vector<CRPSResult> results;
    results.reserve(static_cast<size_t>(ensemble.step_count));
    size_t missing = 0;

    std::vector<double> column(kStochasticPaths);
    for (int k = 0; k < ensemble.step_count; ++k) {
        CRPSResult r;
        r.asset_id = record.asset_id;
        r.t0 = ensemble.t0;
        r.step_index = k;
        r.grid_ts = ensemble.grid_time(k);
        r.bucket = buckets_.bucket_for(ensemble.increment_seconds * k);

        for (int i = 0; i < kStochasticPaths; ++i) {
            column[static_cast<size_t>(i)] = ensemble.paths(i + 1, k);
        }
        std::vector<double> sorted = column;
        std::sort(sorted.begin(), sorted.end());
        r.p05 = percentile(sorted, 5.0);
        r.p50 = percentile(sorted, 50.0);
        r.p95 = percentile(sorted, 95.0);

        auto it = realized.find(core::to_epoch_second_key(r.grid_ts));
        if (it == realized.end() || !std::isfinite(it->second) || it->second <= 0.0) {
            r.status = ScoreStatus::MISSING_REALIZED_DATA;
            ++missing;
        } else {
            const double y = it->second;
            r.status = ScoreStatus::SCORED;
            r.realized = y;
            r.score = crps(sorted, y);
            r.path0_gap = ensemble.paths(0, k) - y;
        }
        results.push_back(std::move(r));
    }

    if (missing > 0) {
        WARN(record.asset_id << " t0=" << core::to_iso8601(ensemble.t0) << ": " << missing
                             << " of " << ensemble.step_count
                             << " grid points missing realized data");
    }
    return Result<std::vector<CRPSResult>>(std::move(results));
}

}  // namespace forecast_ngin
