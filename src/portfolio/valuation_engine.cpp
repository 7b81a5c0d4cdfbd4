// src/portfolio/valuation_engine.cpp

#include "folio_ngin/portfolio/valuation_engine.hpp"
#include <stdexcept>
#include "folio_ngin/core/logger.hpp"

namespace folio_ngin {

namespace {

Position flat(const Position& position) {
    Position valued = position;
    valued.market_value = Decimal();
    valued.unrealized_pnl = Decimal();
    return valued;
}

}  // namespace

ValuationEngine::ValuationEngine(std::shared_ptr<const MarketDataFeed> feed,
                                 bool allow_inverse_rates)
    : feed_(feed), fx_(feed, allow_inverse_rates) {}

Result<Position> ValuationEngine::value(const Position& position, const Price& latest_price,
                                        const std::string& quote_currency,
                                        const std::string& base_currency,
                                        const Date& date) const {
    if (!position.has_position()) {
        return Result<Position>(flat(position));
    }

    auto price_base = fx_.convert(latest_price, quote_currency, base_currency, date);
    if (price_base.is_error()) {
        return forward_error<Position>(price_base);
    }

    Position valued = position;
    try {
        valued.market_value = position.quantity * price_base.value();
        valued.unrealized_pnl = valued.market_value - position.cost_basis();
    } catch (const std::exception& e) {
        return make_error<Position>(ErrorCode::INVALID_DATA,
                                    "Arithmetic failure valuing " + position.ticker + ": " +
                                        e.what(),
                                    "ValuationEngine");
    }
    return Result<Position>(std::move(valued));
}

Result<Position> ValuationEngine::value_at(const Position& position,
                                           const std::string& base_currency,
                                           const Date& date) const {
    if (!position.has_position()) {
        return Result<Position>(flat(position));
    }

    if (!feed_) {
        return make_error<Position>(ErrorCode::NOT_INITIALIZED, "Price feed not configured",
                                    "ValuationEngine");
    }

    auto observation = feed_->price_on_or_before(position.ticker, date);
    if (observation.is_error()) {
        if (observation.error()->code() == ErrorCode::DATA_NOT_FOUND) {
            return make_error<Position>(ErrorCode::PRICE_UNAVAILABLE,
                                        "No price for " + position.ticker + " on or before " +
                                            date.to_string(),
                                        "ValuationEngine");
        }
        return forward_error<Position>(observation);
    }

    const PriceObservation& price = observation.value();
    return value(position, price.close, price.currency, base_currency, date);
}

}  // namespace folio_ngin
