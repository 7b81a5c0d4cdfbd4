// include/folio_ngin/service/report_json.hpp
#pragma once

#include <nlohmann/json.hpp>
#include "folio_ngin/core/types.hpp"
#include "folio_ngin/portfolio/performance_analyzer.hpp"

namespace folio_ngin {

// Monetary values are written as decimal strings, ratios as numbers.
// Found by nlohmann::json through argument-dependent lookup.

void to_json(nlohmann::json& j, const Transaction& txn);
void to_json(nlohmann::json& j, const Position& position);
void to_json(nlohmann::json& j, const TickerValue& value);
void to_json(nlohmann::json& j, const PortfolioHistoryPoint& point);
void to_json(nlohmann::json& j, const PeriodStats& stats);
void to_json(nlohmann::json& j, const TickerPerformance& ticker);
void to_json(nlohmann::json& j, const PerformanceSummary& summary);

}  // namespace folio_ngin
