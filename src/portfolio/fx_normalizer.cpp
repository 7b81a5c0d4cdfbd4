// src/portfolio/fx_normalizer.cpp

#include "folio_ngin/portfolio/fx_normalizer.hpp"
#include <optional>
#include <stdexcept>
#include "folio_ngin/core/logger.hpp"

namespace folio_ngin {

namespace {

// DATA_NOT_FOUND is an expected miss; anything else is a real feed failure
Result<std::optional<FxRate>> lookup(const MarketDataFeed& feed, const CurrencyPair& pair,
                                     const Date& date) {
    auto result = feed.fx_rate_on_or_before(pair, date);
    if (result.is_error()) {
        if (result.error()->code() == ErrorCode::DATA_NOT_FOUND) {
            return Result<std::optional<FxRate>>(std::optional<FxRate>());
        }
        return forward_error<std::optional<FxRate>>(result);
    }
    return Result<std::optional<FxRate>>(std::optional<FxRate>(result.value()));
}

}  // namespace

FxNormalizer::FxNormalizer(std::shared_ptr<const MarketDataFeed> feed, bool allow_inverse_rates)
    : feed_(std::move(feed)), allow_inverse_rates_(allow_inverse_rates) {}

Result<FxNormalizer::ResolvedRate> FxNormalizer::resolve(const std::string& from_currency,
                                                         const std::string& to_currency,
                                                         const Date& date) const {
    if (!feed_) {
        return make_error<ResolvedRate>(ErrorCode::NOT_INITIALIZED, "FX feed not configured",
                                        "FxNormalizer");
    }

    CurrencyPair direct_pair(to_currency, from_currency);
    auto direct = lookup(*feed_, direct_pair, date);
    if (direct.is_error()) {
        return forward_error<ResolvedRate>(direct);
    }

    std::optional<FxRate> inverse;
    if (allow_inverse_rates_) {
        auto inverse_result = lookup(*feed_, direct_pair.inverse(), date);
        if (inverse_result.is_error()) {
            return forward_error<ResolvedRate>(inverse_result);
        }
        inverse = inverse_result.value();
    }

    const std::optional<FxRate>& direct_rate = direct.value();
    bool use_inverse = inverse.has_value() &&
                       (!direct_rate.has_value() || inverse->date > direct_rate->date);

    if (!direct_rate.has_value() && !use_inverse) {
        return make_error<ResolvedRate>(ErrorCode::RATE_UNAVAILABLE,
                                        "No FX rate " + from_currency + "->" + to_currency +
                                            " on or before " + date.to_string(),
                                        "FxNormalizer");
    }

    const FxRate& chosen = use_inverse ? *inverse : *direct_rate;
    if (!chosen.rate.is_positive()) {
        return make_error<ResolvedRate>(ErrorCode::INVALID_DATA,
                                        "Non-positive FX rate for " + chosen.pair().to_string() +
                                            " on " + chosen.date.to_string(),
                                        "FxNormalizer");
    }

    if (use_inverse) {
        TRACE("Using inverse rate " << chosen.pair().to_string() << " from " << chosen.date
                                    << " for " << from_currency << "->" << to_currency);
    }

    ResolvedRate resolved;
    resolved.stored_rate = chosen.rate;
    resolved.inverse = use_inverse;
    return Result<ResolvedRate>(resolved);
}

Result<Decimal> FxNormalizer::rate(const std::string& from_currency,
                                   const std::string& to_currency, const Date& date) const {
    if (from_currency == to_currency) {
        return Result<Decimal>(Decimal(1));
    }
    auto resolved = resolve(from_currency, to_currency, date);
    if (resolved.is_error()) {
        return forward_error<Decimal>(resolved);
    }
    const ResolvedRate& r = resolved.value();
    try {
        return Result<Decimal>(r.inverse ? Decimal(1) / r.stored_rate : r.stored_rate);
    } catch (const std::exception& e) {
        return make_error<Decimal>(ErrorCode::INVALID_DATA,
                                   "Cannot invert rate " + r.stored_rate.to_string() + ": " +
                                       e.what(),
                                   "FxNormalizer");
    }
}

Result<Decimal> FxNormalizer::convert(const Decimal& amount, const std::string& from_currency,
                                      const std::string& to_currency, const Date& date) const {
    if (from_currency == to_currency) {
        return Result<Decimal>(amount);
    }
    auto resolved = resolve(from_currency, to_currency, date);
    if (resolved.is_error()) {
        return forward_error<Decimal>(resolved);
    }
    // Inverse pairs divide by the stored rate rather than multiplying by a rounded 1/rate
    const ResolvedRate& r = resolved.value();
    try {
        return Result<Decimal>(r.inverse ? amount / r.stored_rate : amount * r.stored_rate);
    } catch (const std::exception& e) {
        return make_error<Decimal>(ErrorCode::INVALID_DATA,
                                   "Cannot convert " + amount.to_string() + " " + from_currency +
                                       " to " + to_currency + ": " + e.what(),
                                   "FxNormalizer");
    }
}

}  // namespace folio_ngin
