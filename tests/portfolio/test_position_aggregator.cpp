#include <gtest/gtest.h>
#include <memory>
#include <vector>
#include "folio_ngin/portfolio/position_aggregator.hpp"
#include "test_utils.hpp"

using namespace folio_ngin;
using namespace folio_ngin::testing;

class PositionAggregatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        feed = std::make_shared<InMemoryMarketData>();
        ASSERT_TRUE(
            feed->upsert_fx_rate(create_fx_rate("USD", "EUR", "2024-01-01", "1.1")).is_ok());
    }

    PositionAggregator make_aggregator(bool allow_short = false) const {
        EngineConfig config;
        config.allow_short_selling = allow_short;
        return PositionAggregator(config, feed);
    }

    std::vector<Transaction> basic_ledger() const {
        return {
            create_transaction(1, "AAPL", TransactionType::BUY, "10", "100", "2024-01-02"),
            create_transaction(2, "AAPL", TransactionType::BUY, "10", "120", "2024-01-03"),
            create_transaction(3, "AAPL", TransactionType::SELL, "5", "130", "2024-01-04"),
        };
    }

    std::shared_ptr<InMemoryMarketData> feed;
};

// Weighted average cost and realized P&L against it
TEST_F(PositionAggregatorTest, WeightedAverageAndRealizedPnl) {
    auto aggregator = make_aggregator();
    auto result = aggregator.aggregate("AAPL", basic_ledger());
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const Position& position = result.value();
    EXPECT_EQ(position.ticker, "AAPL");
    EXPECT_THAT(position.quantity, DecimalEq("15"));
    EXPECT_THAT(position.average_cost, DecimalEq("110"));
    EXPECT_THAT(position.realized_pnl, DecimalEq("100"));
    EXPECT_EQ(position.last_update, Date::from_string("2024-01-04"));
    EXPECT_TRUE(position.unrealized_pnl.is_zero());
}

TEST_F(PositionAggregatorTest, DeterministicForSameInput) {
    auto aggregator = make_aggregator();
    auto first = aggregator.aggregate("AAPL", basic_ledger());
    auto second = aggregator.aggregate("AAPL", basic_ledger());
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());
}

// Closing a position keeps its last average cost
TEST_F(PositionAggregatorTest, SellToZeroKeepsAverageCost) {
    auto ledger = basic_ledger();
    ledger.push_back(
        create_transaction(4, "AAPL", TransactionType::SELL, "15", "100", "2024-01-05"));

    auto result = make_aggregator().aggregate("AAPL", ledger);
    ASSERT_TRUE(result.is_ok());
    const Position& position = result.value();
    EXPECT_FALSE(position.has_position());
    EXPECT_THAT(position.average_cost, DecimalEq("110"));
    // 100 from the first sale, then 15 * (100 - 110)
    EXPECT_THAT(position.realized_pnl, DecimalEq("-50"));
}

TEST_F(PositionAggregatorTest, InsufficientPositionLeavesStateUnchanged) {
    auto aggregator = make_aggregator();
    auto folded = aggregator.fold("AAPL", basic_ledger());
    ASSERT_TRUE(folded.is_ok());
    PositionState state = folded.take_value();
    PositionState before = state;

    auto oversell =
        create_transaction(4, "AAPL", TransactionType::SELL, "16", "100", "2024-01-05");
    auto applied = aggregator.apply(state, oversell);
    ASSERT_TRUE(applied.is_error());
    EXPECT_EQ(applied.error()->code(), ErrorCode::INSUFFICIENT_POSITION);
    EXPECT_TRUE(state == before);
}

TEST_F(PositionAggregatorTest, SellWithoutHoldingRejected) {
    std::vector<Transaction> ledger = {
        create_transaction(1, "MSFT", TransactionType::SELL, "1", "300", "2024-01-02")};
    auto result = make_aggregator().aggregate("MSFT", ledger);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_POSITION);
}

TEST_F(PositionAggregatorTest, MalformedTransactionsRejected) {
    auto zero_qty = create_transaction(1, "AAPL", TransactionType::BUY, "0", "100", "2024-01-02");
    auto neg_price = create_transaction(2, "AAPL", TransactionType::BUY, "1", "-1", "2024-01-02");
    auto no_ticker = create_transaction(3, "", TransactionType::BUY, "1", "100", "2024-01-02");
    auto no_ccy = create_transaction(4, "AAPL", TransactionType::BUY, "1", "100", "2024-01-02", "");
    auto neg_div =
        create_transaction(5, "AAPL", TransactionType::DIVIDEND, "-1", "1", "2024-01-02");
    auto zero_fee = create_transaction(6, "AAPL", TransactionType::FEE, "0", "0", "2024-01-02");

    for (const auto& txn : {zero_qty, neg_price, no_ticker, no_ccy, neg_div, zero_fee}) {
        auto valid = validate_transaction(txn);
        ASSERT_TRUE(valid.is_error()) << "transaction " << txn.id;
        EXPECT_EQ(valid.error()->code(), ErrorCode::MALFORMED_TRANSACTION);
    }

    auto result = make_aggregator().aggregate("AAPL", {zero_qty});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::MALFORMED_TRANSACTION);
}

// Dividends add to and fees subtract from realized P&L without touching quantity
TEST_F(PositionAggregatorTest, DividendsAndFees) {
    auto ledger = basic_ledger();
    ledger.push_back(
        create_transaction(4, "AAPL", TransactionType::DIVIDEND, "15", "0.5", "2024-01-05"));
    ledger.push_back(
        create_transaction(5, "AAPL", TransactionType::FEE, "0", "2.5", "2024-01-05"));

    auto result = make_aggregator().aggregate("AAPL", ledger);
    ASSERT_TRUE(result.is_ok());
    EXPECT_THAT(result.value().quantity, DecimalEq("15"));
    EXPECT_THAT(result.value().average_cost, DecimalEq("110"));
    EXPECT_THAT(result.value().realized_pnl, DecimalEq("105"));
}

// Prices in another currency are converted at the trade date
TEST_F(PositionAggregatorTest, ConvertsTradeCurrency) {
    std::vector<Transaction> ledger = {
        create_transaction(1, "SAP", TransactionType::BUY, "10", "100", "2024-01-02", "EUR"),
        create_transaction(2, "SAP", TransactionType::SELL, "4", "110", "2024-01-03", "EUR")};

    auto folded = make_aggregator().fold("SAP", ledger);
    ASSERT_TRUE(folded.is_ok());
    const PositionState& state = folded.value();
    EXPECT_THAT(state.average_cost(), DecimalEq("110"));
    EXPECT_THAT(state.realized_pnl(), DecimalEq("44"));
    // 1100 invested, 484 withdrawn
    EXPECT_THAT(state.net_invested(), DecimalEq("616"));
    EXPECT_EQ(state.applied_count(), 2u);
}

TEST_F(PositionAggregatorTest, MissingRateFailsAggregation) {
    std::vector<Transaction> ledger = {
        create_transaction(1, "VOD", TransactionType::BUY, "10", "1", "2024-01-02", "GBP")};
    auto result = make_aggregator().aggregate("VOD", ledger);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::RATE_UNAVAILABLE);
}

TEST_F(PositionAggregatorTest, ShortSellingWhenAllowed) {
    std::vector<Transaction> ledger = {
        create_transaction(1, "TSLA", TransactionType::SELL, "10", "200", "2024-01-02"),
        create_transaction(2, "TSLA", TransactionType::SELL, "10", "220", "2024-01-03"),
        create_transaction(3, "TSLA", TransactionType::BUY, "5", "180", "2024-01-04")};

    auto result = make_aggregator(true).aggregate("TSLA", ledger);
    ASSERT_TRUE(result.is_ok());
    EXPECT_THAT(result.value().quantity, DecimalEq("-15"));
    EXPECT_THAT(result.value().average_cost, DecimalEq("210"));
    EXPECT_THAT(result.value().realized_pnl, DecimalEq("150"));
}

// A buy larger than the short covers it and opens a long at the trade price
TEST_F(PositionAggregatorTest, BuyFlipsShortToLong) {
    std::vector<Transaction> ledger = {
        create_transaction(1, "TSLA", TransactionType::SELL, "10", "200", "2024-01-02"),
        create_transaction(2, "TSLA", TransactionType::BUY, "15", "190", "2024-01-03")};

    auto result = make_aggregator(true).aggregate("TSLA", ledger);
    ASSERT_TRUE(result.is_ok());
    EXPECT_THAT(result.value().quantity, DecimalEq("5"));
    EXPECT_THAT(result.value().average_cost, DecimalEq("190"));
    EXPECT_THAT(result.value().realized_pnl, DecimalEq("100"));
}

TEST_F(PositionAggregatorTest, SellFlipsLongToShort) {
    std::vector<Transaction> ledger = {
        create_transaction(1, "TSLA", TransactionType::BUY, "5", "100", "2024-01-02"),
        create_transaction(2, "TSLA", TransactionType::SELL, "8", "120", "2024-01-03")};

    auto result = make_aggregator(true).aggregate("TSLA", ledger);
    ASSERT_TRUE(result.is_ok());
    EXPECT_THAT(result.value().quantity, DecimalEq("-3"));
    EXPECT_THAT(result.value().average_cost, DecimalEq("120"));
    EXPECT_THAT(result.value().realized_pnl, DecimalEq("100"));
}

TEST_F(PositionAggregatorTest, OtherTickersIgnored) {
    auto ledger = basic_ledger();
    ledger.insert(ledger.begin() + 1,
                  create_transaction(9, "MSFT", TransactionType::BUY, "1", "300", "2024-01-02"));

    auto result = make_aggregator().aggregate("AAPL", ledger);
    ASSERT_TRUE(result.is_ok());
    EXPECT_THAT(result.value().quantity, DecimalEq("15"));
}

TEST_F(PositionAggregatorTest, OutOfOrderLedgerRejected) {
    auto ledger = basic_ledger();
    std::swap(ledger[0], ledger[1]);

    auto result = make_aggregator().aggregate("AAPL", ledger);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PositionAggregatorTest, EmptyLedgerGivesFlatPosition) {
    auto result = make_aggregator().aggregate("AAPL", {});
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().has_position());
    EXPECT_TRUE(result.value().realized_pnl.is_zero());

    auto empty_ticker = make_aggregator().aggregate("", {});
    ASSERT_TRUE(empty_ticker.is_error());
    EXPECT_EQ(empty_ticker.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PositionAggregatorTest, StateRejectsForeignTickerAndBackdating) {
    PositionState state("AAPL");
    auto aggregator = make_aggregator();

    auto other = create_transaction(1, "MSFT", TransactionType::BUY, "1", "1", "2024-01-02");
    auto wrong = aggregator.apply(state, other);
    ASSERT_TRUE(wrong.is_error());
    EXPECT_EQ(wrong.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto later = create_transaction(2, "AAPL", TransactionType::BUY, "1", "1", "2024-01-05");
    ASSERT_TRUE(aggregator.apply(state, later).is_ok());

    auto earlier = create_transaction(3, "AAPL", TransactionType::BUY, "1", "1", "2024-01-03");
    auto backdated = aggregator.apply(state, earlier);
    ASSERT_TRUE(backdated.is_error());
    EXPECT_EQ(backdated.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(state.applied_count(), 1u);
}

// One bad transaction anywhere leaves every state as it was
TEST_F(PositionAggregatorTest, FoldAllIsAllOrNothing) {
    auto aggregator = make_aggregator();
    PositionStates states;
    ASSERT_TRUE(aggregator.fold_all(basic_ledger(), states).is_ok());
    ASSERT_EQ(states.size(), 1u);

    std::vector<Transaction> batch = {
        create_transaction(10, "MSFT", TransactionType::BUY, "2", "300", "2024-01-06"),
        create_transaction(11, "AAPL", TransactionType::SELL, "50", "130", "2024-01-07")};
    auto result = aggregator.fold_all(batch, states);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_POSITION);
    EXPECT_EQ(states.size(), 1u);
    EXPECT_THAT(states.at("AAPL").quantity(), DecimalEq("15"));
}

TEST_F(PositionAggregatorTest, CashFlowsReported) {
    auto aggregator = make_aggregator();
    PositionState state("AAPL");

    auto bought = aggregator.apply(
        state, create_transaction(1, "AAPL", TransactionType::BUY, "2", "50", "2024-01-02"));
    ASSERT_TRUE(bought.is_ok());
    EXPECT_THAT(bought.value().invested, DecimalEq("100"));
    EXPECT_TRUE(bought.value().withdrawn.is_zero());

    auto sold = aggregator.apply(
        state, create_transaction(2, "AAPL", TransactionType::SELL, "1", "60", "2024-01-03"));
    ASSERT_TRUE(sold.is_ok());
    EXPECT_THAT(sold.value().withdrawn, DecimalEq("60"));
    EXPECT_THAT(state.net_invested(), DecimalEq("40"));
}
