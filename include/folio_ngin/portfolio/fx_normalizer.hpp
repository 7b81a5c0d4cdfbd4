// include/folio_ngin/portfolio/fx_normalizer.hpp
#pragma once

#include <memory>
#include <string>
#include "folio_ngin/core/error.hpp"
#include "folio_ngin/core/types.hpp"
#include "folio_ngin/data/market_data_feed.hpp"

namespace folio_ngin {

/**
 * @brief Converts amounts between currencies using the FX feed
 *
 * Rate policy: the direct pair (base = target, quote = source) is preferred.
 * When inverse rates are allowed the opposite pair is consulted as well and
 * the more recent of the two observations wins; a tie goes to the direct rate.
 * Both lookups carry the last observation forward.
 */
class FxNormalizer {
public:
    /**
     * @param feed Source of FX observations, must outlive the normalizer
     * @param allow_inverse_rates Whether 1/rate of the opposite pair may be used
     */
    explicit FxNormalizer(std::shared_ptr<const MarketDataFeed> feed,
                          bool allow_inverse_rates = true);

    /**
     * @brief Convert an amount from one currency to another
     * @param amount Amount in from_currency
     * @param from_currency Source currency
     * @param to_currency Target currency
     * @param date Conversion date
     * @return Converted amount, RATE_UNAVAILABLE when no rate exists on or before date
     */
    Result<Decimal> convert(const Decimal& amount, const std::string& from_currency,
                            const std::string& to_currency, const Date& date) const;

    /**
     * @brief Effective multiplier that converts from_currency into to_currency
     * @return 1 for identical currencies, RATE_UNAVAILABLE when no rate exists
     */
    Result<Decimal> rate(const std::string& from_currency, const std::string& to_currency,
                         const Date& date) const;

    bool allows_inverse_rates() const {
        return allow_inverse_rates_;
    }

private:
    /**
     * @brief Stored observation chosen for a conversion
     */
    struct ResolvedRate {
        Decimal stored_rate;
        bool inverse{false};
    };

    Result<ResolvedRate> resolve(const std::string& from_currency, const std::string& to_currency,
                                 const Date& date) const;

    std::shared_ptr<const MarketDataFeed> feed_;
    bool allow_inverse_rates_;
};

}  // namespace folio_ngin
