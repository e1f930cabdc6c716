// include/forecast_ngin/evaluation/diagnostics.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "forecast_ngin/core/forecast_config.hpp"
#include "forecast_ngin/core/types.hpp"
#include "forecast_ngin/evaluation/crps_evaluator.hpp"

namespace forecast_ngin {

/**
 * @brief Descriptive statistics of a set of CRPS values
 */
struct SummaryStats {
    size_t count{0};
    double mean{0.0};
    double median{0.0};
    double std_dev{0.0};  // Population standard deviation
    double min{0.0};
    double max{0.0};

    nlohmann::json to_json() const;
};

/**
 * @brief Share of scored points whose realized value is at or below an ensemble percentile
 */
struct CoverageStat {
    double nominal{0.0};
    double observed{0.0};
    size_t count{0};
};

/**
 * @brief Mean CRPS of one asset over the trailing window ending on a UTC day
 */
struct RollingPoint {
    Timestamp day{};
    double mean_crps{0.0};
    size_t count{0};
};

/**
 * @brief Aggregate view over a set of CRPS results
 *
 * Maps only contain keys for which scored data exists; an empty bucket or
 * asset is absent rather than reported as zero.
 */
struct DiagnosticsReport {
    size_t total_points{0};
    size_t scored_points{0};
    size_t missing_points{0};
    int window_days{0};

    std::optional<SummaryStats> overall;
    std::map<int, CoverageStat> coverage;  // Keyed by percentile: 5, 50, 95
    std::map<HorizonBucket, SummaryStats> by_bucket;
    std::map<std::string, SummaryStats> by_asset;
    std::map<std::string, std::vector<RollingPoint>> rolling;

    std::optional<double> bucket_mean(HorizonBucket bucket) const {
        auto it = by_bucket.find(bucket);
        if (it == by_bucket.end())
            return std::nullopt;
        return it->second.mean;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Builds DiagnosticsReport from CRPS results
 *
 * Results are put in a canonical order before any arithmetic, so the same
 * multiset of inputs yields a bit-identical report in any input order.
 */
class DiagnosticsAggregator {
public:
    explicit DiagnosticsAggregator(DiagnosticsConfig config);

    DiagnosticsReport aggregate(std::vector<CRPSResult> results) const;

    /**
     * @brief Aggregate with an explicit trailing window for the rolling series
     */
    DiagnosticsReport aggregate(std::vector<CRPSResult> results, int window_days) const;

    static SummaryStats summarize(std::vector<double> values);

private:
    DiagnosticsConfig config_;
};

}  // namespace forecast_ngin
