#include <gtest/gtest.h>
#include <chrono>
#include <ctime>
#include <regex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "folio_ngin/core/time_utils.hpp"

using namespace folio_ngin;
using namespace folio_ngin::core;

class TimeUtilsTest : public ::testing::Test {};

// Test safe_gmtime with epoch time
TEST_F(TimeUtilsTest, SafeGmtimeEpochTime) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, SafeLocaltimeValidInput) {
    std::time_t now = std::time(nullptr);
    std::tm result;

    ASSERT_NE(safe_localtime(&now, &result), nullptr);
    EXPECT_GE(result.tm_year, 100);
    EXPECT_GE(result.tm_mon, 0);
    EXPECT_LE(result.tm_mon, 11);
}

TEST_F(TimeUtilsTest, GetFormattedTimeBasic) {
    std::string formatted = get_formatted_time("%Y-%m-%d %H:%M:%S", false);
    std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})");
    EXPECT_TRUE(std::regex_match(formatted, pattern)) << formatted;
}

TEST_F(TimeUtilsTest, FormatTimestampUsesUtc) {
    Timestamp ts = Date::from_string("2024-03-15").to_timestamp() + std::chrono::hours(14) +
                   std::chrono::minutes(5) + std::chrono::seconds(9);
    EXPECT_EQ(format_timestamp(ts), "2024-03-15 14:05:09");
}

TEST_F(TimeUtilsTest, ParseTimestamp) {
    Timestamp ts = parse_timestamp("2024-03-15 14:05:09");
    EXPECT_EQ(format_timestamp(ts), "2024-03-15 14:05:09");
    EXPECT_EQ(parse_timestamp("2024-03-15"), Date::from_string("2024-03-15").to_timestamp());
}

TEST_F(TimeUtilsTest, ParseTimestampRejectsMalformed) {
    EXPECT_THROW(parse_timestamp("15/03/2024"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("2024-03-15 ab:cd:ef"), std::invalid_argument);
}

TEST_F(TimeUtilsTest, MicrosecondTimestampsRoundTrip) {
    Timestamp ts = parse_timestamp("2024-03-15 14:05:09.250001");
    EXPECT_EQ(format_timestamp_micros(ts), "2024-03-15 14:05:09.250001");
    EXPECT_EQ(format_timestamp(ts), "2024-03-15 14:05:09");
    EXPECT_EQ(ts - parse_timestamp("2024-03-15 14:05:09"), std::chrono::microseconds(250001));

    EXPECT_EQ(format_timestamp_micros(parse_timestamp("2024-03-15 14:05:09.5")),
              "2024-03-15 14:05:09.500000");
    EXPECT_EQ(format_timestamp_micros(parse_timestamp("2024-03-15")),
              "2024-03-15 00:00:00.000000");
}

TEST_F(TimeUtilsTest, ParseTimestampRejectsMalformedFraction) {
    EXPECT_THROW(parse_timestamp("2024-03-15 14:05:09."), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("2024-03-15 14:05:09x"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("2024-03-15 14:05:09.12a"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("2024-03-15 14:05:09.1234567890"), std::invalid_argument);
}

TEST_F(TimeUtilsTest, SafeGmtimeThreadSafety) {
    const int num_threads = 8;
    std::vector<std::thread> threads;
    std::vector<int> years(num_threads, 0);

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&years, i]() {
            std::time_t t = 86400 * 365 * (i + 1);
            std::tm result;
            if (safe_gmtime(&t, &result) != nullptr) {
                years[i] = result.tm_year;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < num_threads; ++i) {
        EXPECT_GE(years[i], 70 + i);
    }
}
