#include <gtest/gtest.h>
#include <memory>
#include "folio_ngin/portfolio/fx_normalizer.hpp"
#include "mock_market_data_feed.hpp"
#include "test_utils.hpp"

using namespace folio_ngin;
using namespace folio_ngin::testing;
using ::testing::_;
using ::testing::Invoke;

class FxNormalizerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        feed = std::make_shared<InMemoryMarketData>();
    }

    Date day(const std::string& text) const {
        return Date::from_string(text);
    }

    std::shared_ptr<InMemoryMarketData> feed;
};

TEST_F(FxNormalizerTest, SameCurrencyIsIdentity) {
    FxNormalizer fx(feed);
    auto result = fx.convert(dec("123.45"), "USD", "USD", day("2024-01-02"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), dec("123.45"));

    auto rate = fx.rate("EUR", "EUR", day("2024-01-02"));
    ASSERT_TRUE(rate.is_ok());
    EXPECT_EQ(rate.value(), Decimal(1));
}

// Identity conversion needs no feed at all
TEST_F(FxNormalizerTest, SameCurrencyWithoutFeed) {
    FxNormalizer fx(nullptr);
    EXPECT_TRUE(fx.convert(dec("5"), "GBP", "GBP", day("2024-01-02")).is_ok());

    auto missing = fx.convert(dec("5"), "GBP", "USD", day("2024-01-02"));
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::NOT_INITIALIZED);
}

// A EUR->USD rate of 1.10 stored as base USD, quote EUR
TEST_F(FxNormalizerTest, DirectRateMultiplies) {
    ASSERT_TRUE(feed->upsert_fx_rate(create_fx_rate("USD", "EUR", "2024-01-02", "1.1")).is_ok());
    FxNormalizer fx(feed);

    auto result = fx.convert(dec("100"), "EUR", "USD", day("2024-01-02"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), dec("110"));
}

TEST_F(FxNormalizerTest, UsesMostRecentRateOnOrBefore) {
    ASSERT_TRUE(feed->upsert_fx_rate(create_fx_rate("USD", "EUR", "2024-01-02", "1.1")).is_ok());
    ASSERT_TRUE(feed->upsert_fx_rate(create_fx_rate("USD", "EUR", "2024-01-05", "1.2")).is_ok());
    FxNormalizer fx(feed);

    EXPECT_EQ(fx.convert(dec("10"), "EUR", "USD", day("2024-01-04")).value(), dec("11"));
    EXPECT_EQ(fx.convert(dec("10"), "EUR", "USD", day("2024-01-05")).value(), dec("12"));
    EXPECT_EQ(fx.convert(dec("10"), "EUR", "USD", day("2024-02-01")).value(), dec("12"));

    auto early = fx.convert(dec("10"), "EUR", "USD", day("2024-01-01"));
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error()->code(), ErrorCode::RATE_UNAVAILABLE);
}

// Only the opposite pair exists: convert by dividing
TEST_F(FxNormalizerTest, InverseRateDivides) {
    ASSERT_TRUE(feed->upsert_fx_rate(create_fx_rate("USD", "EUR", "2024-01-02", "1.25")).is_ok());
    FxNormalizer fx(feed);

    auto result = fx.convert(dec("125"), "USD", "EUR", day("2024-01-03"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), dec("100"));

    auto rate = fx.rate("USD", "EUR", day("2024-01-03"));
    ASSERT_TRUE(rate.is_ok());
    EXPECT_EQ(rate.value(), dec("0.8"));
}

TEST_F(FxNormalizerTest, InverseDisabledReportsUnavailable) {
    ASSERT_TRUE(feed->upsert_fx_rate(create_fx_rate("USD", "EUR", "2024-01-02", "1.25")).is_ok());
    FxNormalizer fx(feed, false);
    EXPECT_FALSE(fx.allows_inverse_rates());

    auto result = fx.convert(dec("125"), "USD", "EUR", day("2024-01-03"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::RATE_UNAVAILABLE);
}

// The fresher of the two quotes wins
TEST_F(FxNormalizerTest, MoreRecentInverseWins) {
    ASSERT_TRUE(feed->upsert_fx_rate(create_fx_rate("USD", "EUR", "2024-01-02", "1.1")).is_ok());
    ASSERT_TRUE(feed->upsert_fx_rate(create_fx_rate("EUR", "USD", "2024-01-04", "0.8")).is_ok());
    FxNormalizer fx(feed);

    auto result = fx.convert(dec("100"), "EUR", "USD", day("2024-01-05"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), dec("125"));

    // Before the inverse quote exists the direct one is used
    EXPECT_EQ(fx.convert(dec("100"), "EUR", "USD", day("2024-01-03")).value(), dec("110"));
}

TEST_F(FxNormalizerTest, SameDayPrefersDirect) {
    ASSERT_TRUE(feed->upsert_fx_rate(create_fx_rate("USD", "EUR", "2024-01-02", "1.1")).is_ok());
    ASSERT_TRUE(feed->upsert_fx_rate(create_fx_rate("EUR", "USD", "2024-01-02", "0.8")).is_ok());
    FxNormalizer fx(feed);

    EXPECT_EQ(fx.convert(dec("100"), "EUR", "USD", day("2024-01-02")).value(), dec("110"));
}

// Feed failures other than a miss propagate unchanged
TEST_F(FxNormalizerTest, FeedFailurePropagates) {
    auto mock = std::make_shared<MockMarketDataFeed>();
    EXPECT_CALL(*mock, fx_rate_on_or_before(_, _))
        .WillOnce(Invoke([](const CurrencyPair&, const Date&) {
            return make_error<FxRate>(ErrorCode::DATABASE_ERROR, "connection lost", "Mock");
        }));
    FxNormalizer fx(mock);

    auto result = fx.convert(dec("1"), "EUR", "USD", day("2024-01-02"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATABASE_ERROR);
}

// A zero rate reaching the normalizer is rejected rather than divided by
TEST_F(FxNormalizerTest, NonPositiveRateIsInvalid) {
    auto mock = std::make_shared<MockMarketDataFeed>();
    EXPECT_CALL(*mock, fx_rate_on_or_before(_, _))
        .WillRepeatedly(Invoke([](const CurrencyPair& pair, const Date& date) {
            if (pair.base == "EUR") {
                return Result<FxRate>(FxRate("EUR", "USD", date, Decimal()));
            }
            return make_error<FxRate>(ErrorCode::DATA_NOT_FOUND, "none", "Mock");
        }));
    FxNormalizer fx(mock);

    auto result = fx.convert(dec("1"), "EUR", "USD", day("2024-01-02"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}
