#include <gtest/gtest.h>
#include <filesystem>
#include "core/test_base.hpp"
#include "forecast_ngin/core/forecast_config.hpp"

using namespace forecast_ngin;
using namespace forecast_ngin::testing;

class ForecastConfigTest : public StorageTestBase {
protected:
    bool has_error_for(const std::vector<ConfigValidationError>& errors, const std::string& field) {
        for (const auto& e : errors) {
            if (e.field == field)
                return true;
        }
        return false;
    }
};

TEST_F(ForecastConfigTest, DefaultsAreValid) {
    ForecastConfig config = ForecastConfig::defaults();
    EXPECT_TRUE(config.validate().empty());
    EXPECT_EQ(config.assets.size(), 9u);
}

TEST_F(ForecastConfigTest, ProductionAssetTable) {
    ForecastConfig config = ForecastConfig::defaults();

    const AssetProfile& btc = config.profile_for("BTC");
    EXPECT_EQ(btc.asset_class, AssetClass::CRYPTO);
    EXPECT_DOUBLE_EQ(btc.lambda, 0.94);
    EXPECT_DOUBLE_EQ(btc.df, 5.0);
    EXPECT_DOUBLE_EQ(btc.sigma_cap_daily, 0.10);
    EXPECT_DOUBLE_EQ(btc.shrink_high, 0.9);
    EXPECT_EQ(btc.bootstrap_lookback_seconds, 6 * 3600);
    EXPECT_FALSE(btc.market_hours_required);

    const AssetProfile& xau = config.profile_for("XAU");
    EXPECT_EQ(xau.asset_class, AssetClass::COMMODITY);
    EXPECT_EQ(xau.bootstrap_lookback_seconds, 12 * 3600);

    const AssetProfile& spy = config.profile_for("SPYX");
    EXPECT_EQ(spy.asset_class, AssetClass::EQUITY);
    EXPECT_TRUE(spy.market_hours_required);
    EXPECT_EQ(spy.bootstrap_lookback_seconds, 48 * 3600);
}

TEST_F(ForecastConfigTest, UnknownAssetUsesDefaultProfile) {
    ForecastConfig config = ForecastConfig::defaults();
    const AssetProfile& unknown = config.profile_for("DOGE");
    EXPECT_DOUBLE_EQ(unknown.lambda, 0.95);
    EXPECT_DOUBLE_EQ(unknown.shrink_high, 1.0);
    EXPECT_EQ(unknown.asset_class, AssetClass::CRYPTO);
}

TEST_F(ForecastConfigTest, FamilyResolution) {
    ForecastConfig config = ForecastConfig::defaults();

    auto spy = config.profile_for("SPYX").family_for(30.0, 20.0);
    EXPECT_TRUE(std::holds_alternative<Gaussian>(spy));

    auto spy_tuned_down = config.profile_for("SPYX").family_for(19.0, 20.0);
    ASSERT_TRUE(std::holds_alternative<StudentT>(spy_tuned_down));
    EXPECT_DOUBLE_EQ(std::get<StudentT>(spy_tuned_down).df, 19.0);

    // Crypto stays heavy-tailed whatever its df
    auto btc = config.profile_for("BTC").family_for(30.0, 20.0);
    EXPECT_TRUE(std::holds_alternative<StudentT>(btc));
}

TEST_F(ForecastConfigTest, ValidationReportsFields) {
    ForecastConfig config = ForecastConfig::defaults();
    config.assets["BTC"].lambda = 1.0;
    config.assets["ETH"].df = 2.0;
    config.assets["SOL"].shrink_high = 0.0;
    config.market_hours.open_minute_utc = 1300;

    auto errors = config.validate();
    EXPECT_TRUE(has_error_for(errors, "assets.BTC.lambda"));
    EXPECT_TRUE(has_error_for(errors, "assets.ETH.df"));
    EXPECT_TRUE(has_error_for(errors, "assets.SOL.shrink_high"));
    EXPECT_TRUE(has_error_for(errors, "market_hours"));
}

TEST_F(ForecastConfigTest, FileRoundTripPreservesOverrides) {
    ForecastConfig config = ForecastConfig::defaults();
    config.assets["BTC"].lambda = 0.92;
    config.generator.seed = 1234;
    config.governance.observation_days = 21;
    config.persistence.model_version = "ewma-test";

    auto path = (test_dir / "forecast_config.json").string();
    ASSERT_TRUE(config.save_to_file(path).is_ok());

    ForecastConfig loaded = ForecastConfig::defaults();
    ASSERT_TRUE(loaded.load_from_file(path).is_ok());
    EXPECT_DOUBLE_EQ(loaded.profile_for("BTC").lambda, 0.92);
    ASSERT_TRUE(loaded.generator.seed.has_value());
    EXPECT_EQ(*loaded.generator.seed, 1234u);
    EXPECT_EQ(loaded.governance.observation_days, 21);
    EXPECT_EQ(loaded.persistence.model_version, "ewma-test");
    EXPECT_EQ(loaded.to_json(), config.to_json());
}

TEST_F(ForecastConfigTest, PartialJsonKeepsDefaults) {
    ForecastConfig config = ForecastConfig::defaults();
    nlohmann::json partial;
    partial["assets"]["BTC"]["df"] = 6;
    partial["scaler"]["base_interval_seconds"] = 30;
    config.from_json(partial);

    EXPECT_DOUBLE_EQ(config.profile_for("BTC").df, 6.0);
    EXPECT_DOUBLE_EQ(config.profile_for("BTC").lambda, 0.94);
    EXPECT_EQ(config.scaler.base_interval_seconds, 30);
    EXPECT_EQ(config.scaler.seconds_per_day, 86400);
}

TEST_F(ForecastConfigTest, BucketBoundaries) {
    BucketConfig buckets;
    EXPECT_EQ(buckets.bucket_for(0), HorizonBucket::SHORT);
    EXPECT_EQ(buckets.bucket_for(300), HorizonBucket::SHORT);
    EXPECT_EQ(buckets.bucket_for(301), HorizonBucket::MEDIUM);
    EXPECT_EQ(buckets.bucket_for(3600), HorizonBucket::MEDIUM);
    EXPECT_EQ(buckets.bucket_for(3601), HorizonBucket::LONG);
}

TEST_F(ForecastConfigTest, GovernanceBounds) {
    GovernanceConfig governance;
    ASSERT_TRUE(governance.bounds_for("lambda").has_value());
    EXPECT_DOUBLE_EQ(governance.bounds_for("lambda")->max_step, 0.01);
    EXPECT_TRUE(governance.bounds_for("df")->integral);
    EXPECT_FALSE(governance.bounds_for("shrink").has_value());
}
