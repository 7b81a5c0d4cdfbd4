//===== test_utils.hpp =====
#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "../core/test_base.hpp"
#include "folio_ngin/core/types.hpp"
#include "folio_ngin/data/in_memory_market_data.hpp"

namespace folio_ngin {
namespace testing {

// Test helper functions
Decimal dec(const std::string& text);

Transaction create_transaction(int64_t id, const std::string& ticker, TransactionType type,
                               const std::string& quantity, const std::string& price,
                               const std::string& date, const std::string& currency = "USD");

PriceObservation create_price(const std::string& ticker, const std::string& date,
                              const std::string& close, const std::string& currency = "USD");

FxRate create_fx_rate(const std::string& base, const std::string& quote, const std::string& date,
                      const std::string& rate);

/**
 * @brief Feed with one close per ticker on every date of the range
 */
std::shared_ptr<InMemoryMarketData> create_flat_feed(const std::vector<std::string>& tickers,
                                                     const std::string& start,
                                                     const std::string& end,
                                                     const std::string& close,
                                                     const std::string& currency = "USD");

// Custom matchers
MATCHER_P(DecimalEq, text, "Decimal equals") {
    return arg == Decimal::from_string(text);
}

}  // namespace testing
}  // namespace folio_ngin
