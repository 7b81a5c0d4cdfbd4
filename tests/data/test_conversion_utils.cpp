#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "folio_ngin/core/time_utils.hpp"
#include "folio_ngin/data/conversion_utils.hpp"
#include "test_db_utils.hpp"

using namespace folio_ngin;
using namespace folio_ngin::testing;

class DataConversionUtilsTest : public TestBase {
protected:
    const std::vector<std::string> transaction_columns = {
        "id", "time", "type", "ticker", "currency", "shares", "price", "note"};
    const std::vector<std::string> price_columns = {"ticker", "date", "open", "high",
                                                    "low",    "close", "currency"};
};

// Numeric text keeps every digit of NUMERIC(20,8)
TEST_F(DataConversionUtilsTest, TransactionsFromTextColumns) {
    auto table = create_text_table(
        transaction_columns,
        {{"1", "2024-01-02 14:30:00", "BUY", "AAPL", "USD", "10.00000000", "185.12345678",
          std::nullopt},
         {"2", "2024-01-05 09:00:00", "DIVIDEND", "AAPL", "USD", "0", "2.4", "Q4 dividend"}});

    auto result = DataConversionUtils::arrow_table_to_transactions(table);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& txns = result.value();
    ASSERT_EQ(txns.size(), 2u);

    EXPECT_EQ(txns[0].id, 1);
    EXPECT_EQ(txns[0].type, TransactionType::BUY);
    EXPECT_EQ(txns[0].ticker, "AAPL");
    EXPECT_EQ(txns[0].quantity, Decimal(10));
    EXPECT_EQ(txns[0].price, Decimal::from_string("185.12345678"));
    EXPECT_EQ(core::format_timestamp(txns[0].timestamp), "2024-01-02 14:30:00");
    EXPECT_FALSE(txns[0].note.has_value());

    EXPECT_EQ(txns[1].type, TransactionType::DIVIDEND);
    EXPECT_EQ(txns[1].cash_amount(), Decimal::from_string("2.4"));
    ASSERT_TRUE(txns[1].note.has_value());
    EXPECT_EQ(*txns[1].note, "Q4 dividend");
}

TEST_F(DataConversionUtilsTest, TransactionsFromTypedColumns) {
    auto result =
        DataConversionUtils::arrow_table_to_transactions(create_typed_transactions_table());
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& txns = result.value();
    ASSERT_EQ(txns.size(), 2u);
    EXPECT_EQ(txns[1].type, TransactionType::SELL);
    EXPECT_EQ(txns[1].quantity, Decimal(4));
    EXPECT_EQ(txns[1].price, Decimal::from_string("190.25"));
    EXPECT_EQ(txns[1].trade_date(), Date::from_string("2024-01-03"));
}

TEST_F(DataConversionUtilsTest, UnknownTransactionType) {
    auto table = create_text_table(
        transaction_columns,
        {{"1", "2024-01-02 14:30:00", "SPLIT", "AAPL", "USD", "2", "1", std::nullopt}});
    auto result = DataConversionUtils::arrow_table_to_transactions(table);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(DataConversionUtilsTest, NullOrMalformedCellsFail) {
    auto null_price = create_text_table(
        transaction_columns,
        {{"1", "2024-01-02 14:30:00", "BUY", "AAPL", "USD", "2", std::nullopt, std::nullopt}});
    auto result = DataConversionUtils::arrow_table_to_transactions(null_price);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONVERSION_ERROR);

    auto bad_number = create_text_table(
        transaction_columns,
        {{"1", "2024-01-02 14:30:00", "BUY", "AAPL", "USD", "ten", "1", std::nullopt}});
    auto bad = DataConversionUtils::arrow_table_to_transactions(bad_number);
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(DataConversionUtilsTest, MissingColumnsAndNullTable) {
    auto table = create_text_table({"id", "time"}, {});
    auto missing = DataConversionUtils::arrow_table_to_transactions(table);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::INVALID_DATA);

    auto null_table = DataConversionUtils::arrow_table_to_prices(nullptr);
    ASSERT_TRUE(null_table.is_error());
    EXPECT_EQ(null_table.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(DataConversionUtilsTest, EmptyTableGivesNoRows) {
    auto result = DataConversionUtils::arrow_table_to_prices(create_text_table(price_columns, {}));
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(DataConversionUtilsTest, Prices) {
    auto table = create_text_table(
        price_columns, {{"SAP", "2024-01-02", "100.1", "101", "99.5", "100.75", "EUR"}});
    auto result = DataConversionUtils::arrow_table_to_prices(table);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    ASSERT_EQ(result.value().size(), 1u);

    const PriceObservation& price = result.value().front();
    EXPECT_EQ(price.ticker, "SAP");
    EXPECT_EQ(price.date, Date::from_string("2024-01-02"));
    EXPECT_EQ(price.close, Decimal::from_string("100.75"));
    EXPECT_EQ(price.low, Decimal::from_string("99.5"));
    EXPECT_EQ(price.currency, "EUR");
}

TEST_F(DataConversionUtilsTest, FxRates) {
    auto table = create_text_table({"fx_ticker", "date", "rate"},
                                   {{"EURUSD=X", "2024-01-02", "1.0945"},
                                    {"USDJPY=X", "2024-01-02", "141.8"}});
    auto result = DataConversionUtils::arrow_table_to_fx_rates(table);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    ASSERT_EQ(result.value().size(), 2u);

    // One EUR buys 1.0945 USD: converts EUR amounts into USD
    EXPECT_EQ(result.value()[0].base_currency, "USD");
    EXPECT_EQ(result.value()[0].quote_currency, "EUR");
    EXPECT_EQ(result.value()[0].rate, Decimal::from_string("1.0945"));
    EXPECT_EQ(result.value()[1].base_currency, "JPY");
    EXPECT_EQ(result.value()[1].quote_currency, "USD");
}

TEST_F(DataConversionUtilsTest, ParseFxTicker) {
    auto pair = DataConversionUtils::parse_fx_ticker("GBPUSD=X");
    ASSERT_TRUE(pair.is_ok());
    EXPECT_EQ(pair.value(), CurrencyPair("USD", "GBP"));
    EXPECT_EQ(DataConversionUtils::fx_ticker("GBP", "USD"), "GBPUSD=X");

    const std::vector<std::string> malformed = {"AAPL",     "GBPUSD",   "GBPUSD=Y",
                                                "gbpusd=X", "USDUSD=X", "GB1USD=X"};
    for (const auto& bad : malformed) {
        auto parsed = DataConversionUtils::parse_fx_ticker(bad);
        ASSERT_TRUE(parsed.is_error()) << bad;
        EXPECT_EQ(parsed.error()->code(), ErrorCode::INVALID_DATA);
    }
}

TEST_F(DataConversionUtilsTest, BadFxTickerFailsTable) {
    auto table =
        create_text_table({"fx_ticker", "date", "rate"}, {{"EURUSD", "2024-01-02", "1.09"}});
    auto result = DataConversionUtils::arrow_table_to_fx_rates(table);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}
