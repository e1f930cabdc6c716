#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "forecast_ngin/core/error.hpp"

using namespace forecast_ngin;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result(std::string("success"));
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");

    Result<double> double_result(3.14);
    EXPECT_DOUBLE_EQ(double_result.value(), 3.14);
}

TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<int>(ErrorCode::INVALID_SCALING, "Test error message", "TestComponent");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::INVALID_SCALING);
    EXPECT_STREQ(error_result.error()->what(), "Test error message");
    EXPECT_EQ(error_result.error()->component(), "TestComponent");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<int>(ErrorCode::PATH_GENERATION_ERROR, "bad path", "Gen");
    EXPECT_THROW(error_result.value(), ForecastError);

    auto void_error = make_error<void>(ErrorCode::GOVERNANCE_REJECTED, "rejected", "Gov");
    EXPECT_THROW(void_error.value(), ForecastError);
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);

    std::unique_ptr<int> taken = result.take_value();
    EXPECT_EQ(*taken, 42);
}

TEST_F(ResultTest, MoveSemantics) {
    Result<std::vector<int>> original(std::vector<int>{1, 2, 3});
    Result<std::vector<int>> moved(std::move(original));
    ASSERT_TRUE(moved.is_ok());
    EXPECT_EQ(moved.value().size(), 3u);

    Result<std::vector<int>> assigned(std::vector<int>{});
    assigned = make_error<std::vector<int>>(ErrorCode::INVALID_DATA, "empty", "Test");
    EXPECT_TRUE(assigned.is_error());
}

TEST_F(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok.is_ok());
    EXPECT_NO_THROW(ok.value());
    EXPECT_EQ(ok.error(), nullptr);
}

TEST_F(ResultTest, ForwardErrorKeepsCodeAndMessage) {
    auto inner = make_error<double>(ErrorCode::CORRUPT_PERSISTED_STATE, "bad record", "Inner");
    auto outer = forward_error<std::string>(inner, "Outer");

    ASSERT_TRUE(outer.is_error());
    EXPECT_EQ(outer.error()->code(), ErrorCode::CORRUPT_PERSISTED_STATE);
    EXPECT_STREQ(outer.error()->what(), "bad record");
    EXPECT_EQ(outer.error()->component(), "Outer");
}

TEST_F(ResultTest, ErrorToString) {
    ForecastError error(ErrorCode::MISSING_REALIZED_DATA, "gap", "CrpsEvaluator");
    std::string text = error.to_string();
    EXPECT_NE(text.find("CrpsEvaluator"), std::string::npos);
    EXPECT_NE(text.find("gap"), std::string::npos);
    EXPECT_NE(text.find("Code: 10"), std::string::npos);
}
