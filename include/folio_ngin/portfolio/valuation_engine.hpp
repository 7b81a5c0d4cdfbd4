// include/folio_ngin/portfolio/valuation_engine.hpp
#pragma once

#include <memory>
#include <string>
#include "folio_ngin/core/error.hpp"
#include "folio_ngin/core/types.hpp"
#include "folio_ngin/data/market_data_feed.hpp"
#include "folio_ngin/portfolio/fx_normalizer.hpp"

namespace folio_ngin {

/**
 * @brief Marks aggregated positions to market
 */
class ValuationEngine {
public:
    /**
     * @param feed Price and FX source
     * @param allow_inverse_rates Inverse FX policy passed to the normalizer
     */
    explicit ValuationEngine(std::shared_ptr<const MarketDataFeed> feed,
                             bool allow_inverse_rates = true);

    /**
     * @brief Value a position at a known price
     * @param position Aggregated position, average cost in base currency
     * @param latest_price Unit price in quote_currency
     * @param quote_currency Currency of latest_price
     * @param base_currency Reporting currency
     * @param date Valuation date, used for the FX lookup
     * @return Position with market value and unrealized P&L filled in
     */
    Result<Position> value(const Position& position, const Price& latest_price,
                           const std::string& quote_currency, const std::string& base_currency,
                           const Date& date) const;

    /**
     * @brief Value a position at the latest close on or before date
     * @return PRICE_UNAVAILABLE when a non-zero position has no price observation
     */
    Result<Position> value_at(const Position& position, const std::string& base_currency,
                              const Date& date) const;

private:
    std::shared_ptr<const MarketDataFeed> feed_;
    FxNormalizer fx_;
};

}  // namespace folio_ngin
