// include/folio_ngin/portfolio/history_builder.hpp
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "folio_ngin/core/error.hpp"
#include "folio_ngin/core/types.hpp"
#include "folio_ngin/data/market_data_feed.hpp"
#include "folio_ngin/portfolio/engine_config.hpp"
#include "folio_ngin/portfolio/position_aggregator.hpp"
#include "folio_ngin/portfolio/valuation_engine.hpp"

namespace folio_ngin {

/**
 * @brief Cached prefix to start a history build from
 *
 * states must be the result of folding every transaction dated on or before
 * as_of; only later transactions are replayed.
 */
struct HistorySeed {
    Date as_of;
    PositionStates states;
};

/**
 * @brief Builds the daily portfolio value series
 */
class HistoryBuilder {
public:
    HistoryBuilder(EngineConfig config, std::shared_ptr<const MarketDataFeed> feed);

    /**
     * @brief Replay the ledger over a date range
     * @param all_transactions Full ledger in ascending (timestamp, id) order
     * @param range Inclusive date range
     * @param seed Optional folded prefix; as_of must precede range.start
     * @return One point per date, or the first failure for the whole range
     */
    Result<std::vector<PortfolioHistoryPoint>> build_history(
        const std::vector<Transaction>& all_transactions, const DateRange& range,
        const std::optional<HistorySeed>& seed = std::nullopt) const;

private:
    /**
     * @brief Value every held ticker on one date and fill the point's totals
     * @param day_flows Cash moved per ticker by the date's transactions
     */
    Result<void> value_date(const PositionStates& states,
                            const std::map<std::string, CashFlow>& day_flows,
                            PortfolioHistoryPoint& point) const;

    /**
     * @brief Value a contiguous slice of held positions into their slots
     */
    Result<void> value_slice(const std::vector<Position>& held, size_t begin, size_t end,
                             const Date& date, std::vector<Position>& slots) const;

    EngineConfig config_;
    PositionAggregator aggregator_;
    ValuationEngine valuation_;
};

}  // namespace folio_ngin
