// include/folio_ngin/portfolio/position_aggregator.hpp
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "folio_ngin/core/error.hpp"
#include "folio_ngin/core/types.hpp"
#include "folio_ngin/data/market_data_feed.hpp"
#include "folio_ngin/portfolio/engine_config.hpp"
#include "folio_ngin/portfolio/fx_normalizer.hpp"

namespace folio_ngin {

/**
 * @brief Check the shape of a transaction before it reaches the fold
 * @return MALFORMED_TRANSACTION describing the first violated rule
 */
Result<void> validate_transaction(const Transaction& txn);

/**
 * @brief Base-currency cash moved by one applied transaction
 */
struct CashFlow {
    Decimal invested;   // BUY cost
    Decimal withdrawn;  // SELL proceeds
};

/**
 * @brief Running average-cost state for one ticker
 *
 * apply() is all-or-nothing: the new state is computed on a copy and only
 * committed when every conversion and rule check succeeded.
 */
class PositionState {
public:
    PositionState() = default;
    explicit PositionState(std::string ticker) : ticker_(std::move(ticker)) {}

    /**
     * @brief Fold one transaction into the state
     * @param txn Transaction for this ticker, not older than the last applied one
     * @param fx Normalizer used to convert prices into the base currency
     * @param config Base currency and short-selling policy
     * @return Cash moved by the transaction, or an error with the state untouched
     */
    Result<CashFlow> apply(const Transaction& txn, const FxNormalizer& fx,
                           const EngineConfig& config);

    /**
     * @brief Snapshot as a Position without market value
     */
    Position to_position() const;

    const std::string& ticker() const {
        return ticker_;
    }
    const Quantity& quantity() const {
        return quantity_;
    }
    const Price& average_cost() const {
        return average_cost_;
    }
    const Decimal& realized_pnl() const {
        return realized_pnl_;
    }
    const Decimal& net_invested() const {
        return net_invested_;
    }
    const Decimal& cum_invested() const {
        return cum_invested_;
    }
    const Decimal& cum_withdrawn() const {
        return cum_withdrawn_;
    }
    const Date& last_update() const {
        return last_update_;
    }
    size_t applied_count() const {
        return applied_count_;
    }
    bool has_position() const {
        return !quantity_.is_zero();
    }

    bool operator==(const PositionState& other) const {
        return ticker_ == other.ticker_ && quantity_ == other.quantity_ &&
               average_cost_ == other.average_cost_ && realized_pnl_ == other.realized_pnl_ &&
               net_invested_ == other.net_invested_ && cum_invested_ == other.cum_invested_ &&
               cum_withdrawn_ == other.cum_withdrawn_ && last_update_ == other.last_update_ &&
               applied_count_ == other.applied_count_;
    }

private:
    void apply_buy(const Quantity& qty, const Price& price_base);
    Result<void> apply_sell(const Quantity& qty, const Price& price_base, bool allow_short);

    std::string ticker_;
    Quantity quantity_;
    Price average_cost_;
    Decimal realized_pnl_;
    Decimal net_invested_;
    Decimal cum_invested_;
    Decimal cum_withdrawn_;
    Date last_update_;
    size_t applied_count_{0};
};

using PositionStates = std::map<std::string, PositionState>;

/**
 * @brief Folds transaction ledgers into positions
 */
class PositionAggregator {
public:
    /**
     * @param config Engine settings (base currency, short selling, inverse FX)
     * @param feed FX source for converting transaction prices
     */
    PositionAggregator(EngineConfig config, std::shared_ptr<const MarketDataFeed> feed);

    /**
     * @brief Aggregate one ticker's ledger into a position
     * @param ticker Ticker to aggregate, other tickers in the input are ignored
     * @param transactions Ledger in ascending (timestamp, id) order
     * @return Position with quantity, average cost and realized P&L
     */
    Result<Position> aggregate(const std::string& ticker,
                               const std::vector<Transaction>& transactions) const;

    /**
     * @brief Fold one ticker's ledger and return the accumulator itself
     */
    Result<PositionState> fold(const std::string& ticker,
                               const std::vector<Transaction>& transactions) const;

    /**
     * @brief Fold every ticker of a mixed ledger
     * @param transactions Ledger in ascending (timestamp, id) order
     * @param states Accumulators to extend, keyed by ticker
     */
    Result<void> fold_all(const std::vector<Transaction>& transactions,
                          PositionStates& states) const;

    /**
     * @brief Apply a single transaction to a state
     */
    Result<CashFlow> apply(PositionState& state, const Transaction& txn) const;

    const EngineConfig& config() const {
        return config_;
    }

    const FxNormalizer& fx() const {
        return fx_;
    }

private:
    EngineConfig config_;
    FxNormalizer fx_;
};

}  // namespace folio_ngin
