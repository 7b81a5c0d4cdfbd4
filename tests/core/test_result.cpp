#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "folio_ngin/core/error.hpp"

using namespace folio_ngin;

class ResultTest : public ::testing::Test {};

// Test successful Result with different types
TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");

    Result<double> double_result(3.14);
    EXPECT_TRUE(double_result.is_ok());
    EXPECT_DOUBLE_EQ(double_result.value(), 3.14);
}

// Test error case
TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<int>(ErrorCode::INVALID_ARGUMENT, "Test error message", "TestComponent");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_STREQ(error_result.error()->what(), "Test error message");
    EXPECT_EQ(error_result.error()->component(), "TestComponent");
}

// Accessing the value of a failed result throws the carried error
TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<int>(ErrorCode::PRICE_UNAVAILABLE, "No price", "Test");
    EXPECT_THROW(error_result.value(), FolioError);

    try {
        error_result.value();
    } catch (const FolioError& e) {
        EXPECT_EQ(e.code(), ErrorCode::PRICE_UNAVAILABLE);
    }
}

// Test move-only types
TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);

    auto taken = result.take_value();
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 42);
}

// Test move semantics
TEST_F(ResultTest, MoveSemantics) {
    Result<std::string> str_result(std::string("test"));
    Result<std::string> moved_str = std::move(str_result);

    EXPECT_TRUE(moved_str.is_ok());
    EXPECT_EQ(moved_str.value(), "test");

    Result<std::vector<int>> vec_result(std::vector<int>{1, 2, 3});
    Result<std::vector<int>> moved_vec = std::move(vec_result);
    EXPECT_EQ(moved_vec.value().size(), 3u);
}

// Test void Result
TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_FALSE(success.is_error());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::INVALID_ARGUMENT, "Void error", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_FALSE(error.is_ok());
    EXPECT_THROW(error.value(), FolioError);
}

// Errors keep code, message and component when re-typed
TEST_F(ResultTest, ForwardError) {
    auto original = make_error<int>(ErrorCode::RATE_UNAVAILABLE, "No EUR/USD rate", "FxNormalizer");
    auto forwarded = forward_error<std::vector<int>>(original);

    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error()->code(), ErrorCode::RATE_UNAVAILABLE);
    EXPECT_STREQ(forwarded.error()->what(), "No EUR/USD rate");
    EXPECT_EQ(forwarded.error()->component(), "FxNormalizer");
}

TEST_F(ResultTest, ErrorCodeNames) {
    EXPECT_EQ(error_code_to_string(ErrorCode::INSUFFICIENT_POSITION), "INSUFFICIENT_POSITION");
    EXPECT_EQ(error_code_to_string(ErrorCode::MALFORMED_TRANSACTION), "MALFORMED_TRANSACTION");
    EXPECT_EQ(error_code_to_string(ErrorCode::PRICE_UNAVAILABLE), "PRICE_UNAVAILABLE");
}
