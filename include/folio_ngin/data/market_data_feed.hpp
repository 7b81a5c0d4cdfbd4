// include/folio_ngin/data/market_data_feed.hpp

#pragma once

#include <string>
#include "folio_ngin/core/error.hpp"
#include "folio_ngin/core/types.hpp"

namespace folio_ngin {

/**
 * @brief Read-only source of price and FX observations
 *
 * Lookups carry the last observation forward: the newest observation dated on
 * or before the requested date is returned. Absent data is DATA_NOT_FOUND.
 */
class MarketDataFeed {
public:
    virtual ~MarketDataFeed() = default;

    /**
     * @brief Latest price observation for a ticker on or before a date
     * @param ticker Instrument symbol
     * @param date Valuation date
     * @return Result containing the observation, DATA_NOT_FOUND if none
     */
    virtual Result<PriceObservation> price_on_or_before(const std::string& ticker,
                                                        const Date& date) const = 0;

    /**
     * @brief Latest rate stored for exactly this directional pair on or before a date
     * @param pair Pair whose rate converts pair.quote into pair.base
     * @param date Conversion date
     * @return Result containing the rate, DATA_NOT_FOUND if none
     */
    virtual Result<FxRate> fx_rate_on_or_before(const CurrencyPair& pair,
                                                const Date& date) const = 0;
};

}  // namespace folio_ngin
