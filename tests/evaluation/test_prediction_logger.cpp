#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "core/test_utils.hpp"
#include "forecast_ngin/evaluation/prediction_logger.hpp"
#include "forecast_ngin/storage/file_storage_backend.hpp"

using namespace forecast_ngin;
using namespace forecast_ngin::testing;

class PredictionLoggerTest : public StorageTestBase {
protected:
    void SetUp() override {
        StorageTestBase::SetUp();
        storage = std::make_shared<FileStorageBackend>(test_dir);
        logger = std::make_unique<PredictionLogger>(storage, PersistenceConfig{});
    }

    PredictionRecord record_at(const std::string& asset, HorizonLabel label, Timestamp when) {
        PredictionRecord record = create_record(asset, when, 60, 4, 100.0, {99.0, 101.0});
        record.label = label;
        record.request_time = when;
        return record;
    }

    std::shared_ptr<FileStorageBackend> storage;
    std::unique_ptr<PredictionLogger> logger;
    Timestamp start = at("2025-01-02T12:00:00Z");
};

TEST_F(PredictionLoggerTest, SamplesOncePerIntervalPerLabel) {
    auto first = logger->maybe_log(record_at("BTC", HorizonLabel::HIGH, start));
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value());

    auto too_soon = logger->maybe_log(
        record_at("BTC", HorizonLabel::HIGH, start + std::chrono::seconds(899)));
    ASSERT_TRUE(too_soon.is_ok());
    EXPECT_FALSE(too_soon.value());

    // Other label and other asset have their own slots
    EXPECT_TRUE(logger->maybe_log(record_at("BTC", HorizonLabel::LOW, start)).value());
    EXPECT_TRUE(logger->maybe_log(record_at("ETH", HorizonLabel::HIGH, start)).value());

    EXPECT_TRUE(logger->should_log("BTC", HorizonLabel::HIGH, start + std::chrono::seconds(900)));
    EXPECT_FALSE(logger->should_log("BTC", HorizonLabel::LOW, start + std::chrono::seconds(900)));
    EXPECT_TRUE(logger->should_log("BTC", HorizonLabel::LOW, start + std::chrono::seconds(1800)));
}

TEST_F(PredictionLoggerTest, FailedWriteReleasesSamplingSlot) {
    auto flaky = std::make_shared<FailingStorageBackend>(storage);
    PredictionLogger flaky_logger(flaky, PersistenceConfig{});
    flaky->fail_next_appends(1);

    auto failed = flaky_logger.maybe_log(record_at("BTC", HorizonLabel::HIGH, start));
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error()->code(), ErrorCode::FILE_IO_ERROR);
    EXPECT_TRUE(flaky_logger.should_log("BTC", HorizonLabel::HIGH, start));

    auto retried = flaky_logger.maybe_log(
        record_at("BTC", HorizonLabel::HIGH, start + std::chrono::seconds(60)));
    ASSERT_TRUE(retried.is_ok());
    EXPECT_TRUE(retried.value());
    EXPECT_EQ(flaky->append_calls.load(), 2);

    auto records = flaky_logger.load(start, start);
    ASSERT_TRUE(records.is_ok());
    ASSERT_EQ(records.value().size(), 1u);
    EXPECT_EQ(records.value()[0].request_time, start + std::chrono::seconds(60));
}

TEST_F(PredictionLoggerTest, FailedWriteRestoresEarlierSlot) {
    auto flaky = std::make_shared<FailingStorageBackend>(storage);
    PredictionLogger flaky_logger(flaky, PersistenceConfig{});
    ASSERT_TRUE(flaky_logger.maybe_log(record_at("ETH", HorizonLabel::LOW, start)).value());

    flaky->fail_next_appends(1);
    const Timestamp next = start + std::chrono::seconds(1800);
    EXPECT_TRUE(flaky_logger.maybe_log(record_at("ETH", HorizonLabel::LOW, next)).is_error());

    // The slot is measured from the last successful write again
    EXPECT_FALSE(
        flaky_logger.should_log("ETH", HorizonLabel::LOW, start + std::chrono::seconds(1799)));
    EXPECT_TRUE(flaky_logger.should_log("ETH", HorizonLabel::LOW, next));
}

TEST_F(PredictionLoggerTest, WritesDayPartitionOfT0) {
    ASSERT_TRUE(logger->log(record_at("BTC", HorizonLabel::HIGH, start)).is_ok());

    auto lines = storage->read("predictions/2025-01/predictions_2025-01-02.jsonl");
    ASSERT_TRUE(lines.is_ok());
    EXPECT_EQ(lines.value().size(), 1u);
}

TEST_F(PredictionLoggerTest, LoadRestoresEnsembles) {
    PredictionRecord original = record_at("BTC", HorizonLabel::HIGH, start);
    ASSERT_TRUE(logger->log(original).is_ok());

    auto loaded = logger->load(start, start);
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_EQ(loaded.value().size(), 1u);
    const PredictionRecord& record = loaded.value()[0];
    EXPECT_EQ(record.asset_id, "BTC");
    EXPECT_EQ(record.label, HorizonLabel::HIGH);
    EXPECT_EQ(record.t0, start);
    EXPECT_EQ(record.parameters.model_version, "ewma-1.0");
    EXPECT_TRUE(record.ensemble.paths == original.ensemble.paths);
}

TEST_F(PredictionLoggerTest, LoadSpansDaysAndFiltersAsset) {
    ASSERT_TRUE(logger->log(record_at("BTC", HorizonLabel::HIGH, start)).is_ok());
    ASSERT_TRUE(
        logger->log(record_at("ETH", HorizonLabel::HIGH, start + std::chrono::hours(24))).is_ok());
    ASSERT_TRUE(
        logger->log(record_at("BTC", HorizonLabel::LOW, start + std::chrono::hours(72))).is_ok());

    auto two_days = logger->load(start, start + std::chrono::hours(24));
    ASSERT_TRUE(two_days.is_ok());
    EXPECT_EQ(two_days.value().size(), 2u);

    auto btc = logger->load(start, start + std::chrono::hours(72), std::string("BTC"));
    ASSERT_TRUE(btc.is_ok());
    EXPECT_EQ(btc.value().size(), 2u);

    auto empty = logger->load(start + std::chrono::hours(240), start + std::chrono::hours(264));
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().empty());
}

TEST_F(PredictionLoggerTest, LoadSkipsMalformedLines) {
    const std::string partition = day_partition(PredictionLogger::PARTITION, start);
    ASSERT_TRUE(storage->append(partition, "{truncated").is_ok());
    ASSERT_TRUE(logger->log(record_at("BTC", HorizonLabel::HIGH, start)).is_ok());
    ASSERT_TRUE(storage->append(partition, "{\"asset\": \"BTC\"}").is_ok());

    auto loaded = logger->load(start, start);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().size(), 1u);
}
