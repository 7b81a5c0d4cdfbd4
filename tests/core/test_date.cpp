#include <gtest/gtest.h>
#include <stdexcept>
#include <unordered_set>
#include "folio_ngin/core/date.hpp"
#include "folio_ngin/core/time_utils.hpp"

using namespace folio_ngin;

class DateTest : public ::testing::Test {};

TEST_F(DateTest, ParsesIsoDates) {
    Date d = Date::from_string("2024-02-29");
    EXPECT_EQ(d.year(), 2024);
    EXPECT_EQ(d.month(), 2u);
    EXPECT_EQ(d.day(), 29u);
    EXPECT_EQ(d.to_string(), "2024-02-29");
}

// Database text may carry a time component after the date
TEST_F(DateTest, AcceptsTrailingTime) {
    EXPECT_EQ(Date::from_string("2024-01-31 00:00:00"), Date::from_ymd(2024, 1, 31));
    EXPECT_EQ(Date::from_string("2024-01-31T15:30:00"), Date::from_ymd(2024, 1, 31));
}

TEST_F(DateTest, RejectsInvalidDates) {
    EXPECT_THROW(Date::from_string("2023-02-29"), std::invalid_argument);
    EXPECT_THROW(Date::from_string("2024-13-01"), std::invalid_argument);
    EXPECT_THROW(Date::from_string("2024/01/01"), std::invalid_argument);
    EXPECT_THROW(Date::from_string("24-01-01"), std::invalid_argument);
    EXPECT_THROW(Date::from_string("2024-01-01X"), std::invalid_argument);
}

TEST_F(DateTest, EpochAndArithmetic) {
    EXPECT_EQ(Date::from_string("1970-01-01").days_since_epoch(), 0);
    Date d = Date::from_string("2023-12-30");
    EXPECT_EQ((d + 3).to_string(), "2024-01-02");
    EXPECT_EQ((d - 365).to_string(), "2022-12-30");
    EXPECT_EQ(Date::from_string("2024-03-01") - Date::from_string("2024-02-01"), 29);

    Date e = d;
    ++e;
    EXPECT_EQ(e.to_string(), "2023-12-31");
    EXPECT_LT(d, e);
}

// Trade dates are the UTC calendar date of the timestamp
TEST_F(DateTest, TimestampConversion) {
    Date d = Date::from_string("2024-05-10");
    EXPECT_EQ(Date::from_timestamp(d.to_timestamp()), d);
    EXPECT_EQ(Date::from_timestamp(d.to_timestamp() + std::chrono::hours(23)), d);
    EXPECT_EQ(Date::from_timestamp(d.to_timestamp() - std::chrono::seconds(1)), d - 1);
    EXPECT_EQ(Date::from_timestamp(core::parse_timestamp("1969-12-31 12:00:00")),
              Date::from_string("1969-12-31"));
}

TEST_F(DateTest, DateRange) {
    DateRange range(Date::from_string("2024-01-01"), Date::from_string("2024-01-10"));
    EXPECT_TRUE(range.is_valid());
    EXPECT_EQ(range.size(), 10);
    EXPECT_TRUE(range.contains(Date::from_string("2024-01-10")));
    EXPECT_FALSE(range.contains(Date::from_string("2024-01-11")));

    DateRange inverted(Date::from_string("2024-01-10"), Date::from_string("2024-01-01"));
    EXPECT_FALSE(inverted.is_valid());
    EXPECT_EQ(inverted.size(), 0);

    DateRange single(Date::from_string("2024-01-01"), Date::from_string("2024-01-01"));
    EXPECT_EQ(single.size(), 1);
}

TEST_F(DateTest, Hashable) {
    std::unordered_set<Date> dates;
    dates.insert(Date::from_string("2024-01-01"));
    dates.insert(Date::from_string("2024-01-01"));
    dates.insert(Date::from_string("2024-01-02"));
    EXPECT_EQ(dates.size(), 2u);
}
