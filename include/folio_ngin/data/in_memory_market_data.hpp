// include/folio_ngin/data/in_memory_market_data.hpp

#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "folio_ngin/data/market_data_feed.hpp"

namespace folio_ngin {

/**
 * @brief Price and FX snapshot held in memory
 *
 * Writes upsert on (ticker, date) and (pair, date). Reads and writes are
 * guarded so one snapshot can be shared by concurrent valuations.
 */
class InMemoryMarketData : public MarketDataFeed {
public:
    InMemoryMarketData() = default;

    InMemoryMarketData(const InMemoryMarketData&) = delete;
    InMemoryMarketData& operator=(const InMemoryMarketData&) = delete;

    void upsert_price(const PriceObservation& observation);
    void upsert_prices(const std::vector<PriceObservation>& observations);

    /**
     * @brief Store a rate; non-positive rates are rejected with INVALID_DATA
     */
    Result<void> upsert_fx_rate(const FxRate& rate);
    Result<void> upsert_fx_rates(const std::vector<FxRate>& rates);

    Result<PriceObservation> price_on_or_before(const std::string& ticker,
                                                const Date& date) const override;

    Result<FxRate> fx_rate_on_or_before(const CurrencyPair& pair, const Date& date) const override;

    size_t price_count() const;
    size_t fx_rate_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<Date, PriceObservation>> prices_;
    std::map<CurrencyPair, std::map<Date, FxRate>> fx_rates_;
};

}  // namespace folio_ngin
