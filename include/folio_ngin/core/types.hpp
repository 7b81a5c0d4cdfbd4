// include/folio_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "folio_ngin/core/date.hpp"
#include "folio_ngin/core/decimal.hpp"

namespace folio_ngin {

/**
 * @brief Money amounts, quantities and prices share one fixed-point type
 */
using Quantity = Decimal;
using Price = Decimal;

/**
 * @brief Ledger event type
 */
enum class TransactionType {
    BUY,
    SELL,
    DIVIDEND,
    FEE
};

inline std::string transaction_type_to_string(TransactionType type) {
    switch (type) {
        case TransactionType::BUY:
            return "BUY";
        case TransactionType::SELL:
            return "SELL";
        case TransactionType::DIVIDEND:
            return "DIVIDEND";
        case TransactionType::FEE:
            return "FEE";
        default:
            return "UNKNOWN";
    }
}

inline std::optional<TransactionType> transaction_type_from_string(const std::string& s) {
    if (s == "BUY")
        return TransactionType::BUY;
    if (s == "SELL")
        return TransactionType::SELL;
    if (s == "DIVIDEND")
        return TransactionType::DIVIDEND;
    if (s == "FEE")
        return TransactionType::FEE;
    return std::nullopt;
}

/**
 * @brief Immutable ledger entry
 *
 * For BUY/SELL, price is per unit in `currency`. For DIVIDEND/FEE the cash
 * amount is `price` when quantity is zero, otherwise quantity * price.
 */
struct Transaction {
    int64_t id{0};
    std::string ticker;
    TransactionType type{TransactionType::BUY};
    Quantity quantity;
    Price price;
    std::string currency;
    Timestamp timestamp;
    std::optional<std::string> note;

    Transaction() = default;
    Transaction(int64_t id, std::string ticker, TransactionType type, Quantity qty, Price price,
                std::string currency, Timestamp ts)
        : id(id),
          ticker(std::move(ticker)),
          type(type),
          quantity(qty),
          price(price),
          currency(std::move(currency)),
          timestamp(ts) {}

    Date trade_date() const {
        return Date::from_timestamp(timestamp);
    }

    /**
     * @brief Cash value of the event in its own currency
     */
    Decimal cash_amount() const {
        if ((type == TransactionType::DIVIDEND || type == TransactionType::FEE) &&
            quantity.is_zero()) {
            return price;
        }
        return quantity * price;
    }
};

/**
 * @brief Ledger ordering: ascending timestamp, id tiebreak
 */
inline bool transaction_before(const Transaction& a, const Transaction& b) {
    if (a.timestamp != b.timestamp) {
        return a.timestamp < b.timestamp;
    }
    return a.id < b.id;
}

/**
 * @brief Daily OHLC observation for one instrument
 */
struct PriceObservation {
    std::string ticker;
    Date date;
    Price open;
    Price high;
    Price low;
    Price close;
    std::string currency;

    PriceObservation() = default;
    PriceObservation(std::string t, Date d, Price o, Price h, Price l, Price c, std::string ccy)
        : ticker(std::move(t)),
          date(d),
          open(o),
          high(h),
          low(l),
          close(c),
          currency(std::move(ccy)) {}
};

/**
 * @brief Directional currency pair; a rate on this pair converts quote into base
 */
struct CurrencyPair {
    std::string base;
    std::string quote;

    CurrencyPair() = default;
    CurrencyPair(std::string b, std::string q) : base(std::move(b)), quote(std::move(q)) {}

    CurrencyPair inverse() const {
        return CurrencyPair(quote, base);
    }

    std::string to_string() const {
        return quote + "/" + base;
    }

    bool operator==(const CurrencyPair& other) const {
        return base == other.base && quote == other.quote;
    }
    bool operator<(const CurrencyPair& other) const {
        return base != other.base ? base < other.base : quote < other.quote;
    }
};

/**
 * @brief amount_in_base = amount_in_quote * rate
 */
struct FxRate {
    std::string base_currency;
    std::string quote_currency;
    Date date;
    Decimal rate;

    FxRate() = default;
    FxRate(std::string base, std::string quote, Date d, Decimal r)
        : base_currency(std::move(base)), quote_currency(std::move(quote)), date(d), rate(r) {}

    CurrencyPair pair() const {
        return CurrencyPair(base_currency, quote_currency);
    }
};

/**
 * @brief Derived position in one instrument, monetary fields in base currency
 */
struct Position {
    std::string ticker;
    Quantity quantity;
    Price average_cost;
    Decimal realized_pnl;
    Decimal unrealized_pnl;
    Decimal market_value;
    Date last_update;

    Position() = default;
    explicit Position(std::string t) : ticker(std::move(t)) {}

    bool has_position() const {
        return !quantity.is_zero();
    }

    Decimal cost_basis() const {
        return quantity * average_cost;
    }

    Decimal total_pnl() const {
        return realized_pnl + unrealized_pnl;
    }

    bool operator==(const Position& other) const {
        return ticker == other.ticker && quantity == other.quantity &&
               average_cost == other.average_cost && realized_pnl == other.realized_pnl &&
               unrealized_pnl == other.unrealized_pnl && market_value == other.market_value &&
               last_update == other.last_update;
    }
    bool operator!=(const Position& other) const {
        return !(*this == other);
    }
};

/**
 * @brief One ticker's slot in a history point
 */
struct TickerValue {
    std::string ticker;
    Quantity quantity;
    Decimal market_value;
};

/**
 * @brief One ticker's accounting at the end of a history date
 *
 * Kept for every ticker with at least one applied transaction, including
 * closed ones, so per-ticker series stay continuous.
 */
struct TickerPoint {
    std::string ticker;
    Quantity quantity;
    Decimal market_value;
    Decimal realized_pnl;
    Decimal unrealized_pnl;
    Decimal cum_invested;     // all BUY cash to date
    Decimal cum_withdrawn;    // all SELL proceeds to date
    Decimal gross_invested;   // BUY cash on this date
    Decimal gross_withdrawn;  // SELL proceeds on this date

    Decimal total_pnl() const {
        return realized_pnl + unrealized_pnl;
    }
};

/**
 * @brief Portfolio valuation at the end of one calendar date
 */
struct PortfolioHistoryPoint {
    Date date;
    Decimal total_value;
    std::vector<TickerValue> breakdown;  // held tickers only, sorted by ticker
    std::vector<TickerPoint> tickers;    // every ticker seen so far, sorted by ticker

    Decimal realized_pnl;
    Decimal unrealized_pnl;
    Decimal net_invested;     // cumulative BUY cash minus SELL proceeds
    Decimal gross_invested;   // BUY cash on this date
    Decimal gross_withdrawn;  // SELL proceeds on this date

    Decimal total_pnl() const {
        return realized_pnl + unrealized_pnl;
    }

    Decimal cashflow() const {
        return gross_invested - gross_withdrawn;
    }

    double total_pnl_pct() const {
        if (net_invested.is_zero()) {
            return 0.0;
        }
        return total_pnl().as_double() / net_invested.as_double() * 100.0;
    }
};

}  // namespace folio_ngin
