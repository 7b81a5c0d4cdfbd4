// src/portfolio/position_aggregator.cpp

#include "folio_ngin/portfolio/position_aggregator.hpp"
#include <stdexcept>
#include "folio_ngin/core/logger.hpp"

namespace folio_ngin {

Result<void> validate_transaction(const Transaction& txn) {
    auto malformed = [&txn](const std::string& reason) {
        return make_error<void>(ErrorCode::MALFORMED_TRANSACTION,
                                "Transaction " + std::to_string(txn.id) + " (" + txn.ticker +
                                    "): " + reason,
                                "PositionAggregator");
    };

    if (txn.ticker.empty()) {
        return malformed("ticker is empty");
    }
    if (txn.currency.empty()) {
        return malformed("currency is empty");
    }

    switch (txn.type) {
        case TransactionType::BUY:
        case TransactionType::SELL:
            if (!txn.quantity.is_positive()) {
                return malformed("quantity must be positive, got " + txn.quantity.to_string());
            }
            if (!txn.price.is_positive()) {
                return malformed("price must be positive, got " + txn.price.to_string());
            }
            break;
        case TransactionType::DIVIDEND:
        case TransactionType::FEE:
            if (txn.quantity.is_negative()) {
                return malformed("quantity must not be negative, got " +
                                 txn.quantity.to_string());
            }
            if (!txn.price.is_positive()) {
                return malformed(transaction_type_to_string(txn.type) +
                                 " amount must be positive, got " + txn.price.to_string());
            }
            break;
        default:
            return malformed("unknown transaction type");
    }

    return Result<void>();
}

Result<CashFlow> PositionState::apply(const Transaction& txn, const FxNormalizer& fx,
                                      const EngineConfig& config) {
    auto valid = validate_transaction(txn);
    if (valid.is_error()) {
        return forward_error<CashFlow>(valid);
    }

    if (!ticker_.empty() && txn.ticker != ticker_) {
        return make_error<CashFlow>(ErrorCode::INVALID_ARGUMENT,
                                    "Transaction " + std::to_string(txn.id) + " is for " +
                                        txn.ticker + ", not " + ticker_,
                                    "PositionAggregator");
    }

    const Date trade_date = txn.trade_date();
    if (applied_count_ > 0 && trade_date < last_update_) {
        return make_error<CashFlow>(ErrorCode::INVALID_ARGUMENT,
                                    "Transaction " + std::to_string(txn.id) + " dated " +
                                        trade_date.to_string() + " precedes last update " +
                                        last_update_.to_string() + " for " + ticker_,
                                    "PositionAggregator");
    }

    PositionState next = *this;
    next.ticker_ = txn.ticker;
    CashFlow flow;

    try {
        switch (txn.type) {
            case TransactionType::BUY: {
                auto price = fx.convert(txn.price, txn.currency, config.base_currency, trade_date);
                if (price.is_error()) {
                    return forward_error<CashFlow>(price);
                }
                next.apply_buy(txn.quantity, price.value());
                flow.invested = txn.quantity * price.value();
                break;
            }
            case TransactionType::SELL: {
                auto price = fx.convert(txn.price, txn.currency, config.base_currency, trade_date);
                if (price.is_error()) {
                    return forward_error<CashFlow>(price);
                }
                auto sold = next.apply_sell(txn.quantity, price.value(), config.allow_short_selling);
                if (sold.is_error()) {
                    return forward_error<CashFlow>(sold);
                }
                flow.withdrawn = txn.quantity * price.value();
                break;
            }
            case TransactionType::DIVIDEND:
            case TransactionType::FEE: {
                auto amount =
                    fx.convert(txn.cash_amount(), txn.currency, config.base_currency, trade_date);
                if (amount.is_error()) {
                    return forward_error<CashFlow>(amount);
                }
                if (txn.type == TransactionType::DIVIDEND) {
                    next.realized_pnl_ += amount.value();
                } else {
                    next.realized_pnl_ -= amount.value();
                }
                break;
            }
        }
        next.net_invested_ += flow.invested - flow.withdrawn;
        next.cum_invested_ += flow.invested;
        next.cum_withdrawn_ += flow.withdrawn;
    } catch (const std::exception& e) {
        // Decimal overflow or division failure
        return make_error<CashFlow>(ErrorCode::INVALID_DATA,
                                    "Arithmetic failure applying transaction " +
                                        std::to_string(txn.id) + ": " + e.what(),
                                    "PositionAggregator");
    }

    next.last_update_ = trade_date;
    next.applied_count_++;

    *this = std::move(next);
    return Result<CashFlow>(flow);
}

void PositionState::apply_buy(const Quantity& qty, const Price& price_base) {
    if (!quantity_.is_negative()) {
        average_cost_ = (quantity_ * average_cost_ + qty * price_base) / (quantity_ + qty);
        quantity_ += qty;
        return;
    }

    // Cover the short first, remainder opens a long at the trade price
    Quantity covering = Decimal::min(qty, quantity_.abs());
    realized_pnl_ += covering * (average_cost_ - price_base);
    quantity_ += covering;

    Quantity remainder = qty - covering;
    if (remainder.is_positive()) {
        quantity_ = remainder;
        average_cost_ = price_base;
    }
}

Result<void> PositionState::apply_sell(const Quantity& qty, const Price& price_base,
                                       bool allow_short) {
    Quantity held_long = quantity_.is_positive() ? quantity_ : Decimal();
    if (qty > held_long && !allow_short) {
        return make_error<void>(ErrorCode::INSUFFICIENT_POSITION,
                                "Cannot sell " + qty.to_string() + " " + ticker_ + ", holding " +
                                    quantity_.to_string(),
                                "PositionAggregator");
    }

    Quantity closing = Decimal::min(qty, held_long);
    realized_pnl_ += closing * (price_base - average_cost_);
    quantity_ -= closing;

    Quantity opening = qty - closing;
    if (opening.is_positive()) {
        // Extend or open a short at the weighted entry price
        Quantity short_qty = quantity_.abs();
        average_cost_ = (short_qty * average_cost_ + opening * price_base) / (short_qty + opening);
        quantity_ -= opening;
    }

    return Result<void>();
}

Position PositionState::to_position() const {
    Position position(ticker_);
    position.quantity = quantity_;
    position.average_cost = average_cost_;
    position.realized_pnl = realized_pnl_;
    position.last_update = last_update_;
    return position;
}

PositionAggregator::PositionAggregator(EngineConfig config,
                                       std::shared_ptr<const MarketDataFeed> feed)
    : config_(std::move(config)), fx_(std::move(feed), config_.allow_inverse_rates) {
    Logger::register_component("PositionAggregator");
}

Result<CashFlow> PositionAggregator::apply(PositionState& state, const Transaction& txn) const {
    return state.apply(txn, fx_, config_);
}

Result<PositionState> PositionAggregator::fold(
    const std::string& ticker, const std::vector<Transaction>& transactions) const {
    if (ticker.empty()) {
        return make_error<PositionState>(ErrorCode::INVALID_ARGUMENT, "Ticker cannot be empty",
                                         "PositionAggregator");
    }

    PositionState state(ticker);
    const Transaction* previous = nullptr;

    for (const auto& txn : transactions) {
        if (txn.ticker != ticker) {
            continue;
        }
        if (previous && transaction_before(txn, *previous)) {
            return make_error<PositionState>(
                ErrorCode::INVALID_ARGUMENT,
                "Ledger for " + ticker + " is not in chronological order at transaction " +
                    std::to_string(txn.id),
                "PositionAggregator");
        }
        previous = &txn;

        auto applied = state.apply(txn, fx_, config_);
        if (applied.is_error()) {
            WARN("Aggregation of " << ticker << " stopped at transaction " << txn.id << ": "
                                   << applied.error()->what());
            return forward_error<PositionState>(applied);
        }
    }

    DEBUG("Aggregated " << state.applied_count() << " transactions for " << ticker
                        << ": qty=" << state.quantity() << " avg=" << state.average_cost()
                        << " realized=" << state.realized_pnl());

    return Result<PositionState>(std::move(state));
}

Result<Position> PositionAggregator::aggregate(
    const std::string& ticker, const std::vector<Transaction>& transactions) const {
    auto folded = fold(ticker, transactions);
    if (folded.is_error()) {
        return forward_error<Position>(folded);
    }
    return Result<Position>(folded.value().to_position());
}

Result<void> PositionAggregator::fold_all(const std::vector<Transaction>& transactions,
                                          PositionStates& states) const {
    // Work on a copy so a failure leaves the caller's states untouched
    PositionStates working = states;
    const Transaction* previous = nullptr;

    for (const auto& txn : transactions) {
        if (previous && transaction_before(txn, *previous)) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Ledger is not in chronological order at transaction " +
                                        std::to_string(txn.id),
                                    "PositionAggregator");
        }
        previous = &txn;

        auto it = working.find(txn.ticker);
        if (it == working.end()) {
            it = working.emplace(txn.ticker, PositionState(txn.ticker)).first;
        }

        auto applied = it->second.apply(txn, fx_, config_);
        if (applied.is_error()) {
            WARN("Aggregation stopped at transaction " << txn.id << " (" << txn.ticker
                                                       << "): " << applied.error()->what());
            return forward_error<void>(applied);
        }
    }

    states = std::move(working);
    return Result<void>();
}

}  // namespace folio_ngin
