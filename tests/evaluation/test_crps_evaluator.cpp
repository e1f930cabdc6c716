#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include "core/test_base.hpp"
#include "core/test_utils.hpp"
#include "forecast_ngin/evaluation/crps_evaluator.hpp"

using namespace forecast_ngin;
using namespace forecast_ngin::testing;

class CrpsEvaluatorTest : public TestBase {
protected:
    // Direct O(n^2) form of the estimator
    double brute_force_crps(const std::vector<double>& x, double y) {
        const double n = static_cast<double>(x.size());
        double abs_error = 0.0;
        double pairwise = 0.0;
        for (double xi : x) {
            abs_error += std::fabs(xi - y);
            for (double xj : x) {
                pairwise += std::fabs(xi - xj);
            }
        }
        return abs_error / n - 0.5 * pairwise / (n * n);
    }

    RealizedSeries realized_for(const PredictionRecord& record, double value,
                                std::optional<int> skip = std::nullopt) {
        RealizedSeries realized;
        for (int k = 0; k < record.step_count; ++k) {
            if (skip.has_value() && *skip == k)
                continue;
            realized[core::to_epoch_second_key(record.ensemble.grid_time(k))] = value;
        }
        return realized;
    }

    CrpsEvaluator evaluator{BucketConfig{}};
    Timestamp t0 = at("2025-01-02T12:00:00Z");
};

TEST_F(CrpsEvaluatorTest, SmallSampleByHand) {
    EXPECT_NEAR(CrpsEvaluator::crps({1.0, 2.0, 3.0}, 2.0), 2.0 / 9.0, 1e-15);
    EXPECT_NEAR(CrpsEvaluator::crps({3.0, 1.0, 2.0}, 2.0), 2.0 / 9.0, 1e-15);
    EXPECT_DOUBLE_EQ(CrpsEvaluator::crps({5.0}, 5.0), 0.0);
    EXPECT_DOUBLE_EQ(CrpsEvaluator::crps({5.0, 5.0}, 7.0), 2.0);
}

TEST_F(CrpsEvaluatorTest, SortedIdentityMatchesPairwiseForm) {
    std::mt19937_64 rng(11);
    std::normal_distribution<double> dist(100.0, 3.0);
    std::vector<double> samples(kStochasticPaths);
    for (auto& s : samples) {
        s = dist(rng);
    }
    for (double y : {90.0, 100.0, 104.5}) {
        EXPECT_NEAR(CrpsEvaluator::crps(samples, y), brute_force_crps(samples, y), 1e-9);
    }
}

TEST_F(CrpsEvaluatorTest, PercentileInterpolates) {
    std::vector<double> sorted{10.0, 20.0, 30.0, 40.0, 50.0};
    EXPECT_DOUBLE_EQ(CrpsEvaluator::percentile(sorted, 0.0), 10.0);
    EXPECT_DOUBLE_EQ(CrpsEvaluator::percentile(sorted, 50.0), 30.0);
    EXPECT_DOUBLE_EQ(CrpsEvaluator::percentile(sorted, 100.0), 50.0);
    EXPECT_DOUBLE_EQ(CrpsEvaluator::percentile(sorted, 5.0), 12.0);
}

TEST_F(CrpsEvaluatorTest, ScoresEveryGridPoint) {
    auto record = create_record("BTC", t0, 60, 10, 100.0, {99.0, 100.0, 101.0});
    auto results = evaluator.score(record, realized_for(record, 100.5));
    ASSERT_TRUE(results.is_ok());
    ASSERT_EQ(results.value().size(), 10u);

    const CRPSResult& first = results.value()[0];
    EXPECT_TRUE(first.is_scored());
    EXPECT_EQ(first.step_index, 0);
    EXPECT_EQ(first.grid_ts, t0);
    // Every stochastic path starts at spot
    EXPECT_NEAR(*first.score, 0.5, 1e-12);

    const CRPSResult& last = results.value()[9];
    EXPECT_EQ(last.grid_ts, t0 + std::chrono::seconds(540));
    EXPECT_EQ(last.bucket, HorizonBucket::MEDIUM);
    EXPECT_DOUBLE_EQ(last.p50, 100.0);
    EXPECT_DOUBLE_EQ(last.p05, 99.0);
    EXPECT_DOUBLE_EQ(last.p95, 101.0);
    EXPECT_DOUBLE_EQ(*last.path0_gap, -0.5);

    std::vector<double> column(kStochasticPaths);
    for (int i = 0; i < kStochasticPaths; ++i) {
        column[static_cast<size_t>(i)] = record.ensemble.paths(i + 1, 9);
    }
    EXPECT_NEAR(*last.score, brute_force_crps(column, 100.5), 1e-9);
}

TEST_F(CrpsEvaluatorTest, MissingRealizedPointDoesNotStopScoring) {
    auto record = create_record("ETH", t0, 60, 10, 3000.0, {2990.0, 3000.0, 3010.0});
    auto results = evaluator.score(record, realized_for(record, 3001.0, 3));
    ASSERT_TRUE(results.is_ok());
    ASSERT_EQ(results.value().size(), 10u);

    for (const auto& r : results.value()) {
        if (r.step_index == 3) {
            EXPECT_EQ(r.status, ScoreStatus::MISSING_REALIZED_DATA);
            EXPECT_FALSE(r.score.has_value());
            EXPECT_FALSE(r.realized.has_value());
            EXPECT_DOUBLE_EQ(r.p50, 3000.0);
        } else {
            EXPECT_TRUE(r.is_scored());
        }
    }
}

TEST_F(CrpsEvaluatorTest, NonPositiveRealizedCountsAsMissing) {
    auto record = create_record("SOL", t0, 60, 3, 150.0, {149.0, 151.0});
    RealizedSeries realized = realized_for(record, 150.0);
    realized[core::to_epoch_second_key(record.ensemble.grid_time(1))] = 0.0;
    realized[core::to_epoch_second_key(record.ensemble.grid_time(2))] = std::nan("");

    auto results = evaluator.score(record, realized);
    ASSERT_TRUE(results.is_ok());
    EXPECT_TRUE(results.value()[0].is_scored());
    EXPECT_FALSE(results.value()[1].is_scored());
    EXPECT_FALSE(results.value()[2].is_scored());
}

TEST_F(CrpsEvaluatorTest, TranslationInvariance) {
    auto base = create_record("BTC", t0, 300, 5, 100.0, {97.0, 99.5, 100.0, 103.0});
    auto shifted = create_record("BTC", t0, 300, 5, 1100.0, {1097.0, 1099.5, 1100.0, 1103.0});

    auto a = evaluator.score(base, realized_for(base, 101.25));
    auto b = evaluator.score(shifted, realized_for(shifted, 1101.25));
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    for (size_t k = 0; k < a.value().size(); ++k) {
        EXPECT_NEAR(*a.value()[k].score, *b.value()[k].score, 1e-9);
    }
}

TEST_F(CrpsEvaluatorTest, RescoringIsIdempotent) {
    auto record = create_record("XAU", t0, 60, 6, 2650.0, {2649.0, 2651.5, 2650.25});
    auto realized = realized_for(record, 2650.5, 4);

    auto first = evaluator.score(record, realized);
    auto second = evaluator.score(record, realized);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    nlohmann::json a = nlohmann::json::array();
    nlohmann::json b = nlohmann::json::array();
    for (const auto& r : first.value())
        a.push_back(r.to_json());
    for (const auto& r : second.value())
        b.push_back(r.to_json());
    EXPECT_EQ(a.dump(), b.dump());
}

TEST_F(CrpsEvaluatorTest, BucketsFollowElapsedTime) {
    auto record = create_record("BTC", t0, 300, 14, 100.0, {99.0, 101.0});
    auto results = evaluator.score(record, realized_for(record, 100.0));
    ASSERT_TRUE(results.is_ok());
    EXPECT_EQ(results.value()[1].bucket, HorizonBucket::SHORT);    // 300s
    EXPECT_EQ(results.value()[2].bucket, HorizonBucket::MEDIUM);   // 600s
    EXPECT_EQ(results.value()[12].bucket, HorizonBucket::MEDIUM);  // 3600s
    EXPECT_EQ(results.value()[13].bucket, HorizonBucket::LONG);    // 3900s
}

TEST_F(CrpsEvaluatorTest, RejectsMalformedEnsemble) {
    auto record = create_record("BTC", t0, 60, 5, 100.0, {100.0});
    record.ensemble.paths.conservativeResize(10, 5);
    auto results = evaluator.score(record, {});
    ASSERT_TRUE(results.is_error());
    EXPECT_EQ(results.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(CrpsEvaluatorTest, ResultJsonKeepsMissingFieldsNull) {
    auto record = create_record("BTC", t0, 60, 2, 100.0, {100.0});
    auto results = evaluator.score(record, {});
    ASSERT_TRUE(results.is_ok());

    nlohmann::json j = results.value()[1].to_json();
    EXPECT_TRUE(j.at("crps").is_null());
    EXPECT_EQ(j.at("status"), "MISSING_REALIZED_DATA");

    auto parsed = CRPSResult::from_json(j);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_FALSE(parsed.value().score.has_value());
    EXPECT_EQ(parsed.value().grid_ts, results.value()[1].grid_ts);
}
