// include/folio_ngin/service/portfolio_service.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "folio_ngin/core/error.hpp"
#include "folio_ngin/core/types.hpp"
#include "folio_ngin/data/market_data_feed.hpp"
#include "folio_ngin/data/results_store.hpp"
#include "folio_ngin/data/transaction_store.hpp"
#include "folio_ngin/portfolio/engine_config.hpp"
#include "folio_ngin/portfolio/history_builder.hpp"
#include "folio_ngin/portfolio/performance_analyzer.hpp"
#include "folio_ngin/portfolio/position_aggregator.hpp"
#include "folio_ngin/portfolio/valuation_engine.hpp"

namespace folio_ngin {

/**
 * @brief Portfolio operations over a ledger, a market data feed and an optional cache
 *
 * Every read recomputes from the ledger. Computed positions and history are
 * written through to the results store when one is configured; a failed
 * write is logged and does not fail the request.
 */
class PortfolioService {
public:
    /**
     * @param config Engine settings
     * @param store Transaction ledger
     * @param feed Price and FX source
     * @param results Optional write-through cache
     */
    PortfolioService(EngineConfig config, std::shared_ptr<TransactionStore> store,
                     std::shared_ptr<const MarketDataFeed> feed,
                     std::shared_ptr<ResultsStore> results = nullptr);

    /**
     * @brief Every ticker in the ledger aggregated and valued as of a date
     * Closed positions are included with zero quantity.
     */
    Result<std::vector<Position>> get_positions(const Date& as_of);

    /**
     * @brief Daily portfolio value over an inclusive range
     */
    Result<std::vector<PortfolioHistoryPoint>> get_history(const DateRange& range);

    /**
     * @brief Performance summary from a history of lookback_days ending at as_of
     */
    Result<PerformanceSummary> get_performance(const Date& as_of, int lookback_days = 365) const;

    Result<std::vector<Transaction>> get_transactions(
        const std::optional<std::string>& ticker = std::nullopt) const;

    /**
     * @brief Validate and record one transaction
     * @return The stored transaction with its id, or the first rule it breaks
     */
    Result<Transaction> submit_transaction(const Transaction& txn);

    /**
     * @brief Validate and record a batch; nothing is recorded if any entry fails
     */
    Result<std::vector<Transaction>> bulk_import(const std::vector<Transaction>& transactions);

    const EngineConfig& config() const {
        return config_;
    }

private:
    /**
     * @brief Check that a complete ledger still folds
     */
    Result<void> check_ledger(const std::vector<Transaction>& ledger) const;

    Result<std::vector<Transaction>> ledger_through(const Date& date) const;

    EngineConfig config_;
    std::shared_ptr<TransactionStore> store_;
    std::shared_ptr<const MarketDataFeed> feed_;
    std::shared_ptr<ResultsStore> results_;

    PositionAggregator aggregator_;
    ValuationEngine valuation_;
    HistoryBuilder history_builder_;
    PerformanceAnalyzer analyzer_;
};

}  // namespace folio_ngin
