#include <gtest/gtest.h>
#include <cmath>
#include "core/test_base.hpp"
#include "core/test_utils.hpp"
#include "forecast_ngin/simulation/path_generator.hpp"

using namespace forecast_ngin;
using namespace forecast_ngin::testing;

class PathGeneratorTest : public TestBase {
protected:
    GenerationInput make_input(int steps = 10) {
        GenerationInput input;
        input.asset_id = "BTC";
        input.t0 = at("2025-01-02T12:00:00Z");
        input.spot = 50000.0;
        input.increment_seconds = 60;
        input.step_count = steps;
        input.sigma_step = 1e-3;
        input.family = StudentT{5.0};
        input.seed = 42;
        return input;
    }

    // Sample standard deviation of log(price / spot) in one column
    double log_dispersion(const PathEnsemble& ensemble, int k) {
        Eigen::ArrayXd logs =
            (ensemble.paths.block(1, k, kStochasticPaths, 1).array() / ensemble.start_price())
                .log();
        double mean = logs.mean();
        return std::sqrt((logs - mean).square().sum() / static_cast<double>(logs.size()));
    }

    PathGenerator generator;
};

TEST_F(PathGeneratorTest, ShapeAndFlatPath) {
    auto result = generator.generate(make_input(10));
    ASSERT_TRUE(result.is_ok());
    const PathEnsemble& ensemble = result.value();

    EXPECT_EQ(ensemble.paths.rows(), kEnsembleSize);
    EXPECT_EQ(ensemble.paths.cols(), 10);
    EXPECT_FALSE(ensemble.flattened);
    for (int k = 0; k < 10; ++k) {
        EXPECT_DOUBLE_EQ(ensemble.paths(0, k), 50000.0);
    }
    for (int i = 0; i < kEnsembleSize; ++i) {
        EXPECT_DOUBLE_EQ(ensemble.paths(i, 0), 50000.0);
    }
    EXPECT_TRUE((ensemble.paths.array() > 0.0).all());
    EXPECT_TRUE(ensemble.validate().is_ok());
    EXPECT_EQ(ensemble.grid_time(9), ensemble.t0 + std::chrono::seconds(540));
}

TEST_F(PathGeneratorTest, DispersionGrowsWithHorizon) {
    auto result = generator.generate(make_input(61));
    ASSERT_TRUE(result.is_ok());

    double d1 = log_dispersion(result.value(), 1);
    double d60 = log_dispersion(result.value(), 60);
    EXPECT_NEAR(d1, 1e-3, 2e-4);
    EXPECT_NEAR(d60, 1e-3 * std::sqrt(60.0), 1.5e-3);
    EXPECT_GT(d60, d1);
}

TEST_F(PathGeneratorTest, GaussianFamily) {
    GenerationInput input = make_input(2);
    input.family = Gaussian{};
    auto result = generator.generate(input);
    ASSERT_TRUE(result.is_ok());
    EXPECT_NEAR(log_dispersion(result.value(), 1), 1e-3, 2e-4);
}

TEST_F(PathGeneratorTest, FlattenGivesIdenticalPaths) {
    GenerationInput input = make_input(10);
    input.flatten = true;
    input.sigma_step = 0.0;

    auto result = generator.generate(input);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().flattened);
    EXPECT_TRUE((result.value().paths.array() == 50000.0).all());
}

TEST_F(PathGeneratorTest, SingleGridPoint) {
    auto result = generator.generate(make_input(1));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().paths.cols(), 1);
    EXPECT_TRUE((result.value().paths.array() == 50000.0).all());
}

TEST_F(PathGeneratorTest, SameSeedSameEnsemble) {
    auto a = generator.generate(make_input(20));
    auto b = generator.generate(make_input(20));
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_TRUE(a.value().paths == b.value().paths);

    GenerationInput other = make_input(20);
    other.seed = 43;
    auto c = generator.generate(other);
    ASSERT_TRUE(c.is_ok());
    EXPECT_FALSE(a.value().paths == c.value().paths);
}

TEST_F(PathGeneratorTest, RejectsUnusableInputs) {
    GenerationInput low_df = make_input();
    low_df.family = StudentT{2.0};
    auto df_result = generator.generate(low_df);
    ASSERT_TRUE(df_result.is_error());
    EXPECT_EQ(df_result.error()->code(), ErrorCode::INVALID_SCALING);

    GenerationInput zero_sigma = make_input();
    zero_sigma.sigma_step = 0.0;
    auto sigma_result = generator.generate(zero_sigma);
    ASSERT_TRUE(sigma_result.is_error());
    EXPECT_EQ(sigma_result.error()->code(), ErrorCode::INVALID_SCALING);

    GenerationInput bad_spot = make_input();
    bad_spot.spot = -1.0;
    auto spot_result = generator.generate(bad_spot);
    ASSERT_TRUE(spot_result.is_error());
    EXPECT_EQ(spot_result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PathGeneratorTest, PricesRoundedToSignificantDigits) {
    EXPECT_DOUBLE_EQ(PathGenerator::round_significant(50123.456789, 8), 50123.457);
    EXPECT_DOUBLE_EQ(PathGenerator::round_significant(0.000123456789, 8), 0.00012345679);
    EXPECT_DOUBLE_EQ(PathGenerator::round_significant(0.0, 8), 0.0);

    auto result = generator.generate(make_input(5));
    ASSERT_TRUE(result.is_ok());
    double v = result.value().paths(7, 4);
    EXPECT_DOUBLE_EQ(PathGenerator::round_significant(v, 8), v);
}

TEST_F(PathGeneratorTest, EnsembleJsonKeepsValues) {
    auto result = generator.generate(make_input(4));
    ASSERT_TRUE(result.is_ok());

    auto parsed = PathEnsemble::from_json(result.value().to_json());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().paths == result.value().paths);
    EXPECT_EQ(parsed.value().t0, result.value().t0);
}
