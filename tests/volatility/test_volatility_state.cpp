#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>
#include "core/test_base.hpp"
#include "core/test_utils.hpp"
#include "forecast_ngin/volatility/volatility_state.hpp"

using namespace forecast_ngin;
using namespace forecast_ngin::testing;

class VolatilityStateTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        config = std::make_shared<ForecastConfig>(ForecastConfig::defaults());
        parameters = std::make_shared<ParameterStore>(config);
        prices = std::make_shared<MockPriceSource>();
        bootstrap = std::make_shared<CountingBootstrap>(prices, config);
        store = std::make_unique<VolatilityStateStore>(parameters, bootstrap, clock.clock());
    }

    std::shared_ptr<ForecastConfig> config;
    std::shared_ptr<ParameterStore> parameters;
    std::shared_ptr<MockPriceSource> prices;
    std::shared_ptr<CountingBootstrap> bootstrap;
    ManualClock clock{at("2025-01-02T12:00:00Z")};
    std::unique_ptr<VolatilityStateStore> store;
};

TEST_F(VolatilityStateTest, UpdateAppliesEwmaRecursion) {
    const Timestamp t = clock.now();
    ASSERT_TRUE(store->seed("BTC", 1e-6, std::nullopt, t).is_ok());

    auto updated = store->update("BTC", 0.002, t + std::chrono::seconds(60));
    ASSERT_TRUE(updated.is_ok());
    EXPECT_DOUBLE_EQ(updated.value().variance_estimate, 0.94 * 1e-6 + 0.06 * 0.002 * 0.002);
    EXPECT_DOUBLE_EQ(updated.value().decay_lambda, 0.94);
    EXPECT_EQ(updated.value().sample_count, 1u);
}

TEST_F(VolatilityStateTest, ZeroReturnsDecayGeometrically) {
    Timestamp t = clock.now();
    ASSERT_TRUE(store->seed("BTC", 4e-6, std::nullopt, t).is_ok());

    double expected = 4e-6;
    for (int i = 1; i <= 50; ++i) {
        t += std::chrono::seconds(60);
        auto updated = store->update("BTC", 0.0, t);
        ASSERT_TRUE(updated.is_ok());
        expected *= 0.94;
        EXPECT_NEAR(updated.value().variance_estimate, expected, 1e-20);
        EXPECT_GE(updated.value().variance_estimate, 0.0);
    }
}

TEST_F(VolatilityStateTest, RejectsNonFiniteReturnsAndKeepsState) {
    const Timestamp t = clock.now();
    ASSERT_TRUE(store->seed("BTC", 2e-6, std::nullopt, t).is_ok());

    for (double bad : {std::numeric_limits<double>::quiet_NaN(),
                       std::numeric_limits<double>::infinity(),
                       -std::numeric_limits<double>::infinity()}) {
        auto result = store->update("BTC", bad, t + std::chrono::seconds(60));
        ASSERT_TRUE(result.is_error());
        EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_OBSERVATION);
    }

    auto state = store->peek("BTC");
    ASSERT_TRUE(state.has_value());
    EXPECT_DOUBLE_EQ(state->variance_estimate, 2e-6);
    EXPECT_EQ(state->sample_count, 0u);
}

TEST_F(VolatilityStateTest, RejectsOutOfOrderObservation) {
    const Timestamp t = clock.now();
    ASSERT_TRUE(store->seed("BTC", 2e-6, std::nullopt, t).is_ok());

    auto result = store->update("BTC", 0.001, t - std::chrono::seconds(1));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_OBSERVATION);
    EXPECT_DOUBLE_EQ(store->peek("BTC")->variance_estimate, 2e-6);
}

TEST_F(VolatilityStateTest, ObservePriceDerivesLogReturn) {
    const Timestamp t = clock.now();
    ASSERT_TRUE(store->seed("ETH", 1e-6, std::nullopt, t).is_ok());

    // First price only anchors
    auto anchored = store->observe_price("ETH", 3000.0, t + std::chrono::seconds(60));
    ASSERT_TRUE(anchored.is_ok());
    EXPECT_DOUBLE_EQ(anchored.value().variance_estimate, 1e-6);
    EXPECT_EQ(anchored.value().sample_count, 0u);

    auto updated = store->observe_price("ETH", 3003.0, t + std::chrono::seconds(120));
    ASSERT_TRUE(updated.is_ok());
    double r = std::log(3003.0 / 3000.0);
    EXPECT_DOUBLE_EQ(updated.value().variance_estimate, 0.93 * 1e-6 + 0.07 * r * r);
    ASSERT_TRUE(updated.value().last_price.has_value());
    EXPECT_DOUBLE_EQ(*updated.value().last_price, 3003.0);
}

TEST_F(VolatilityStateTest, ObservePriceRejectsBadPrices) {
    ASSERT_TRUE(store->seed("ETH", 1e-6, 3000.0, clock.now()).is_ok());

    for (double bad : {0.0, -5.0, std::numeric_limits<double>::quiet_NaN()}) {
        auto result = store->observe_price("ETH", bad, clock.now() + std::chrono::seconds(60));
        ASSERT_TRUE(result.is_error());
        EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_OBSERVATION);
    }
    EXPECT_DOUBLE_EQ(*store->peek("ETH")->last_price, 3000.0);
}

TEST_F(VolatilityStateTest, GetBootstrapsOnFirstUse) {
    prices->set_history("SOL", create_minute_history(clock.now(), 61, 150.0, 0.001));

    auto state = store->get("SOL");
    ASSERT_TRUE(state.is_ok());
    EXPECT_NEAR(state.value().variance_estimate, 1e-6, 1e-12);
    EXPECT_DOUBLE_EQ(state.value().decay_lambda, 0.90);
    EXPECT_EQ(bootstrap->calls.load(), 1);

    // Served from the stored state afterwards
    ASSERT_TRUE(store->get("SOL").is_ok());
    EXPECT_EQ(bootstrap->calls.load(), 1);
}

TEST_F(VolatilityStateTest, ConcurrentFirstAccessBootstrapsOnce) {
    bootstrap = std::make_shared<CountingBootstrap>(prices, config, std::chrono::milliseconds(50));
    store = std::make_unique<VolatilityStateStore>(parameters, bootstrap, clock.clock());

    std::vector<std::thread> threads;
    std::vector<double> seen(8, -1.0);
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&, i]() {
            auto state = store->get("BTC");
            if (state.is_ok()) {
                seen[i] = state.value().variance_estimate;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(bootstrap->calls.load(), 1);
    for (double v : seen) {
        EXPECT_DOUBLE_EQ(v, seen.front());
        EXPECT_GT(v, 0.0);
    }
}

TEST_F(VolatilityStateTest, ResetRearmsBootstrap) {
    ASSERT_TRUE(store->get("BTC").is_ok());
    store->reset("BTC");
    EXPECT_FALSE(store->peek("BTC").has_value());
    ASSERT_TRUE(store->get("BTC").is_ok());
    EXPECT_EQ(bootstrap->calls.load(), 2);
}

TEST_F(VolatilityStateTest, UsesLiveLambda) {
    const Timestamp t = clock.now();
    ASSERT_TRUE(store->seed("BTC", 1e-6, std::nullopt, t).is_ok());
    ASSERT_TRUE(parameters->set_value("BTC", parameters::LAMBDA, 0.95).is_ok());

    auto updated = store->update("BTC", 0.0, t + std::chrono::seconds(60));
    ASSERT_TRUE(updated.is_ok());
    EXPECT_DOUBLE_EQ(updated.value().variance_estimate, 0.95e-6);
    EXPECT_DOUBLE_EQ(updated.value().decay_lambda, 0.95);
}

TEST_F(VolatilityStateTest, SnapshotAndRestore) {
    ASSERT_TRUE(store->seed("BTC", 1e-6, 50000.0, clock.now()).is_ok());
    ASSERT_TRUE(store->seed("ETH", 2e-6, 3000.0, clock.now()).is_ok());
    auto snapshot = store->snapshot_all();
    ASSERT_EQ(snapshot.size(), 2u);

    VolatilityStateStore fresh(parameters, bootstrap, clock.clock());
    fresh.restore(snapshot);
    ASSERT_TRUE(fresh.peek("ETH").has_value());
    EXPECT_DOUBLE_EQ(fresh.peek("ETH")->variance_estimate, 2e-6);
    EXPECT_EQ(bootstrap->calls.load(), 0);
}

TEST_F(VolatilityStateTest, StateJsonValidation) {
    VolatilityState state;
    state.asset_id = "BTC";
    state.variance_estimate = 1e-6;
    state.decay_lambda = 0.94;
    state.last_update_ts = clock.now();
    state.sample_count = 12;
    state.last_price = 50000.0;

    auto parsed = VolatilityState::from_json(state.to_json());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().sample_count, 12u);

    nlohmann::json negative = state.to_json();
    negative["variance_estimate"] = -1.0;
    auto rejected = VolatilityState::from_json(negative);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error()->code(), ErrorCode::CORRUPT_PERSISTED_STATE);

    nlohmann::json bad_lambda = state.to_json();
    bad_lambda["decay_lambda"] = 1.0;
    EXPECT_TRUE(VolatilityState::from_json(bad_lambda).is_error());

    nlohmann::json missing = state.to_json();
    missing.erase("sample_count");
    EXPECT_TRUE(VolatilityState::from_json(missing).is_error());
}
