#include <gtest/gtest.h>
#include <fstream>
#include <thread>
#include <vector>
#include "core/test_base.hpp"
#include "core/test_utils.hpp"
#include "forecast_ngin/storage/file_storage_backend.hpp"

using namespace forecast_ngin;
using namespace forecast_ngin::testing;

class FileStorageBackendTest : public StorageTestBase {
protected:
    void SetUp() override {
        StorageTestBase::SetUp();
        storage = std::make_unique<FileStorageBackend>(test_dir);
    }

    std::unique_ptr<FileStorageBackend> storage;
};

TEST_F(FileStorageBackendTest, AppendAndReadPartition) {
    ASSERT_TRUE(storage->append("predictions/2025-01/a.jsonl", "{\"n\":1}").is_ok());
    ASSERT_TRUE(storage->append("predictions/2025-01/a.jsonl", "{\"n\":2}").is_ok());

    auto lines = storage->read("predictions/2025-01/a.jsonl");
    ASSERT_TRUE(lines.is_ok());
    ASSERT_EQ(lines.value().size(), 2u);
    EXPECT_EQ(lines.value()[0], "{\"n\":1}");
    EXPECT_EQ(lines.value()[1], "{\"n\":2}");
}

TEST_F(FileStorageBackendTest, MissingKeysReportNotFound) {
    auto lines = storage->read("nothing.jsonl");
    ASSERT_TRUE(lines.is_error());
    EXPECT_EQ(lines.error()->code(), ErrorCode::FILE_NOT_FOUND);

    auto doc = storage->read_all("state/none.json");
    ASSERT_TRUE(doc.is_error());
    EXPECT_EQ(doc.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(FileStorageBackendTest, AtomicWriteReplacesDocument) {
    ASSERT_TRUE(storage->atomic_write("state/doc.json", "first").is_ok());
    ASSERT_TRUE(storage->atomic_write("state/doc.json", "second").is_ok());

    auto content = storage->read_all("state/doc.json");
    ASSERT_TRUE(content.is_ok());
    EXPECT_EQ(content.value(), "second");
    EXPECT_FALSE(std::filesystem::exists(test_dir / "state" / "doc.json.tmp"));
}

TEST_F(FileStorageBackendTest, RejectsKeysOutsideRoot) {
    auto escaped = storage->atomic_write("../outside.json", "x");
    ASSERT_TRUE(escaped.is_error());
    EXPECT_EQ(escaped.error()->code(), ErrorCode::INVALID_ARGUMENT);

    EXPECT_TRUE(storage->append("/tmp/absolute.jsonl", "x").is_error());
    EXPECT_TRUE(storage->read_all("").is_error());
}

TEST_F(FileStorageBackendTest, ListIsSortedAndSkipsTemporaries) {
    ASSERT_TRUE(storage->append("predictions/2025-01/p_2025-01-03.jsonl", "x").is_ok());
    ASSERT_TRUE(storage->append("predictions/2025-01/p_2025-01-02.jsonl", "x").is_ok());
    ASSERT_TRUE(storage->atomic_write("state/volatility_state.json", "{}").is_ok());
    {
        std::ofstream stray(test_dir / "predictions" / "2025-01" / "p_2025-01-04.jsonl.tmp");
        stray << "partial";
    }

    auto keys = storage->list("predictions/");
    ASSERT_TRUE(keys.is_ok());
    ASSERT_EQ(keys.value().size(), 2u);
    EXPECT_EQ(keys.value()[0], "predictions/2025-01/p_2025-01-02.jsonl");
    EXPECT_EQ(keys.value()[1], "predictions/2025-01/p_2025-01-03.jsonl");
}

TEST_F(FileStorageBackendTest, ConcurrentAppendsKeepWholeLines) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 50; ++i) {
                auto appended = storage->append("log.jsonl", "thread-" + std::to_string(t) +
                                                                 "-line-" + std::to_string(i));
                EXPECT_TRUE(appended.is_ok());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto lines = storage->read("log.jsonl");
    ASSERT_TRUE(lines.is_ok());
    ASSERT_EQ(lines.value().size(), 200u);
    for (const auto& line : lines.value()) {
        EXPECT_EQ(line.rfind("thread-", 0), 0u);
    }
}

TEST_F(FileStorageBackendTest, DayPartitionLayout) {
    EXPECT_EQ(day_partition("predictions", at("2025-03-04T23:59:59Z")),
              "predictions/2025-03/predictions_2025-03-04.jsonl");
}
