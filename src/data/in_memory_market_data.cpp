// src/data/in_memory_market_data.cpp

#include "folio_ngin/data/in_memory_market_data.hpp"
#include <iterator>

namespace folio_ngin {

namespace {

// Newest entry keyed on or before date, or nullptr
template <typename T>
const T* on_or_before(const std::map<Date, T>& series, const Date& date) {
    auto it = series.upper_bound(date);
    if (it == series.begin()) {
        return nullptr;
    }
    return &std::prev(it)->second;
}

}  // namespace

void InMemoryMarketData::upsert_price(const PriceObservation& observation) {
    std::lock_guard<std::mutex> lock(mutex_);
    prices_[observation.ticker][observation.date] = observation;
}

void InMemoryMarketData::upsert_prices(const std::vector<PriceObservation>& observations) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& observation : observations) {
        prices_[observation.ticker][observation.date] = observation;
    }
}

Result<void> InMemoryMarketData::upsert_fx_rate(const FxRate& rate) {
    if (!rate.rate.is_positive()) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "FX rate for " + rate.pair().to_string() + " on " +
                                    rate.date.to_string() + " must be positive",
                                "InMemoryMarketData");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    fx_rates_[rate.pair()][rate.date] = rate;
    return Result<void>();
}

Result<void> InMemoryMarketData::upsert_fx_rates(const std::vector<FxRate>& rates) {
    for (const auto& rate : rates) {
        auto stored = upsert_fx_rate(rate);
        if (stored.is_error()) {
            return stored;
        }
    }
    return Result<void>();
}

Result<PriceObservation> InMemoryMarketData::price_on_or_before(const std::string& ticker,
                                                                const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto series = prices_.find(ticker);
    if (series != prices_.end()) {
        if (const PriceObservation* found = on_or_before(series->second, date)) {
            return Result<PriceObservation>(*found);
        }
    }
    return make_error<PriceObservation>(
        ErrorCode::DATA_NOT_FOUND, "No price for " + ticker + " on or before " + date.to_string(),
        "InMemoryMarketData");
}

Result<FxRate> InMemoryMarketData::fx_rate_on_or_before(const CurrencyPair& pair,
                                                        const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto series = fx_rates_.find(pair);
    if (series != fx_rates_.end()) {
        if (const FxRate* found = on_or_before(series->second, date)) {
            return Result<FxRate>(*found);
        }
    }
    return make_error<FxRate>(
        ErrorCode::DATA_NOT_FOUND,
        "No FX rate " + pair.to_string() + " on or before " + date.to_string(),
        "InMemoryMarketData");
}

size_t InMemoryMarketData::price_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : prices_) {
        count += entry.second.size();
    }
    return count;
}

size_t InMemoryMarketData::fx_rate_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : fx_rates_) {
        count += entry.second.size();
    }
    return count;
}

}  // namespace folio_ngin
