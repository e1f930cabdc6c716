// src/evaluation/diagnostics.cpp

#include "forecast_ngin/evaluation/diagnostics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <tuple>
#include "forecast_ngin/core/time_utils.hpp"

namespace forecast_ngin {

namespace {

double opt_or_lowest(const std::optional<double>& value) {
    return value.value_or(-std::numeric_limits<double>::infinity());
}

bool canonical_less(const CRPSResult& a, const CRPSResult& b) {
    return std::make_tuple(a.asset_id, a.t0, a.step_index, a.grid_ts,
                           static_cast<int>(a.status), opt_or_lowest(a.score),
                           opt_or_lowest(a.realized), a.p05, a.p50, a.p95) <
           std::make_tuple(b.asset_id, b.t0, b.step_index, b.grid_ts,
                           static_cast<int>(b.status), opt_or_lowest(b.score),
                           opt_or_lowest(b.realized), b.p05, b.p50, b.p95);
}

}  // namespace

nlohmann::json SummaryStats::to_json() const {
    nlohmann::json j;
    j["count"] = count;
    j["mean"] = mean;
    j["median"] = median;
    j["std"] = std_dev;
    j["min"] = min;
    j["max"] = max;
    return j;
}

nlohmann::json DiagnosticsReport::to_json() const {
    nlohmann::json j;
    j["total_points"] = total_points;
    j["scored_points"] = scored_points;
    j["missing_points"] = missing_points;
    j["window_days"] = window_days;
    j["overall"] = overall.has_value() ? overall->to_json() : nlohmann::json(nullptr);

    j["coverage"] = nlohmann::json::object();
    for (const auto& [q, stat] : coverage) {
        nlohmann::json c;
        c["nominal"] = stat.nominal;
        c["observed"] = stat.observed;
        c["count"] = stat.count;
        j["coverage"][std::to_string(q)] = c;
    }

    j["by_bucket"] = nlohmann::json::object();
    for (const auto& [bucket, stats] : by_bucket) {
        j["by_bucket"][horizon_bucket_to_string(bucket)] = stats.to_json();
    }

    j["by_asset"] = nlohmann::json::object();
    for (const auto& [asset, stats] : by_asset) {
        j["by_asset"][asset] = stats.to_json();
    }

    j["rolling"] = nlohmann::json::object();
    for (const auto& [asset, series] : rolling) {
        nlohmann::json points = nlohmann::json::array();
        for (const auto& p : series) {
            points.push_back({{"day", core::format_utc(p.day, "%Y-%m-%d")},
                              {"mean_crps", p.mean_crps},
                              {"count", p.count}});
        }
        j["rolling"][asset] = points;
    }
    return j;
}

DiagnosticsAggregator::DiagnosticsAggregator(DiagnosticsConfig config)
    : config_(std::move(config)) {}

SummaryStats DiagnosticsAggregator::summarize(std::vector<double> values) {
    SummaryStats stats;
    stats.count = values.size();
    if (values.empty()) {
        return stats;
    }
    std::sort(values.begin(), values.end());

    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    stats.mean = sum / static_cast<double>(values.size());

    double sq = 0.0;
    for (double v : values) {
        sq += (v - stats.mean) * (v - stats.mean);
    }
    stats.std_dev = std::sqrt(sq / static_cast<double>(values.size()));

    const size_t mid = values.size() / 2;
    stats.median = values.size() % 2 == 1 ? values[mid] : 0.5 * (values[mid - 1] + values[mid]);
    stats.min = values.front();
    stats.max = values.back();
    return stats;
}

DiagnosticsReport DiagnosticsAggregator::aggregate(std::vector<CRPSResult> results) const {
    return aggregate(std::move(results), config_.rolling_window_days);
}

DiagnosticsReport DiagnosticsAggregator::aggregate(std::vector<CRPSResult> results,
                                                   int window_days) const {
    std::sort(results.begin(), results.end(), canonical_less);

    DiagnosticsReport report;
    report.total_points = results.size();
    report.window_days = window_days;

    std::vector<double> all_scores;
    std::map<HorizonBucket, std::vector<double>> bucket_scores;
    std::map<std::string, std::vector<double>> asset_scores;
    // asset -> UTC day -> scores of that day
    std::map<std::string, std::map<Timestamp, std::vector<double>>> daily_scores;
    size_t below_05 = 0;
    size_t below_50 = 0;
    size_t below_95 = 0;

    for (const auto& r : results) {
        if (!r.is_scored() || !r.score.has_value() || !r.realized.has_value()) {
            ++report.missing_points;
            continue;
        }
        ++report.scored_points;
        const double score = *r.score;
        all_scores.push_back(score);
        bucket_scores[r.bucket].push_back(score);
        asset_scores[r.asset_id].push_back(score);
        daily_scores[r.asset_id][core::utc_day_start(r.t0)].push_back(score);

        if (*r.realized <= r.p05)
            ++below_05;
        if (*r.realized <= r.p50)
            ++below_50;
        if (*r.realized <= r.p95)
            ++below_95;
    }

    if (report.scored_points == 0) {
        return report;
    }

    report.overall = summarize(all_scores);
    const double n = static_cast<double>(report.scored_points);
    report.coverage[5] = CoverageStat{0.05, static_cast<double>(below_05) / n,
                                      report.scored_points};
    report.coverage[50] = CoverageStat{0.50, static_cast<double>(below_50) / n,
                                       report.scored_points};
    report.coverage[95] = CoverageStat{0.95, static_cast<double>(below_95) / n,
                                       report.scored_points};

    for (auto& [bucket, scores] : bucket_scores) {
        report.by_bucket[bucket] = summarize(scores);
    }
    for (auto& [asset, scores] : asset_scores) {
        report.by_asset[asset] = summarize(scores);
    }

    const auto window = std::chrono::hours(24) * std::max(window_days, 1);
    for (const auto& [asset, days] : daily_scores) {
        std::vector<RollingPoint>& series = report.rolling[asset];
        for (const auto& entry : days) {
            const Timestamp& day = entry.first;
            double sum = 0.0;
            size_t count = 0;
            // Days in (day - window, day]
            for (auto it = days.upper_bound(day - window); it != days.end() && it->first <= day;
                 ++it) {
                for (double v : it->second) {
                    sum += v;
                    ++count;
                }
            }
            series.push_back(RollingPoint{day, sum / static_cast<double>(count), count});
        }
    }

    return report;
}

}  // namespace forecast_ngin
