// src/service/portfolio_service.cpp

#include "folio_ngin/service/portfolio_service.hpp"
#include <stdexcept>
#include "folio_ngin/core/logger.hpp"

namespace folio_ngin {

PortfolioService::PortfolioService(EngineConfig config, std::shared_ptr<TransactionStore> store,
                                   std::shared_ptr<const MarketDataFeed> feed,
                                   std::shared_ptr<ResultsStore> results)
    : config_(config),
      store_(std::move(store)),
      feed_(feed),
      results_(std::move(results)),
      aggregator_(config, feed),
      valuation_(feed, config.allow_inverse_rates),
      history_builder_(config, feed) {
    Logger::register_component("PortfolioService");
    if (!store_) {
        throw std::invalid_argument("PortfolioService requires a transaction store");
    }
}

Result<std::vector<Transaction>> PortfolioService::ledger_through(const Date& date) const {
    return store_->list_transactions(std::nullopt, (date + 1).to_timestamp());
}

Result<std::vector<Position>> PortfolioService::get_positions(const Date& as_of) {
    auto ledger = ledger_through(as_of);
    if (ledger.is_error()) {
        return forward_error<std::vector<Position>>(ledger);
    }

    PositionStates states;
    auto folded = aggregator_.fold_all(ledger.value(), states);
    if (folded.is_error()) {
        return forward_error<std::vector<Position>>(folded);
    }

    std::vector<Position> positions;
    positions.reserve(states.size());
    for (const auto& entry : states) {
        auto valued = valuation_.value_at(entry.second.to_position(), config_.base_currency, as_of);
        if (valued.is_error()) {
            ERROR("Failed to value " << entry.first << " as of " << as_of << ": "
                                     << valued.error()->what());
            return forward_error<std::vector<Position>>(valued);
        }
        positions.push_back(valued.value());
    }

    INFO("Computed " << positions.size() << " positions as of " << as_of);

    if (results_) {
        auto cached = results_->store_positions(as_of, positions);
        if (cached.is_error()) {
            WARN("Failed to cache positions for " << as_of << ": " << cached.error()->what());
        }
    }

    return Result<std::vector<Position>>(std::move(positions));
}

Result<std::vector<PortfolioHistoryPoint>> PortfolioService::get_history(const DateRange& range) {
    if (!range.is_valid()) {
        return make_error<std::vector<PortfolioHistoryPoint>>(
            ErrorCode::INVALID_ARGUMENT,
            "Invalid date range " + range.start.to_string() + " to " + range.end.to_string(),
            "PortfolioService");
    }

    auto ledger = ledger_through(range.end);
    if (ledger.is_error()) {
        return forward_error<std::vector<PortfolioHistoryPoint>>(ledger);
    }

    auto history = history_builder_.build_history(ledger.value(), range);
    if (history.is_error()) {
        return history;
    }

    if (results_) {
        auto cached = results_->store_history(history.value());
        if (cached.is_error()) {
            WARN("Failed to cache history for " << range.start << " to " << range.end << ": "
                                                << cached.error()->what());
        }
    }

    return history;
}

Result<PerformanceSummary> PortfolioService::get_performance(const Date& as_of,
                                                             int lookback_days) const {
    if (lookback_days <= 0) {
        return make_error<PerformanceSummary>(ErrorCode::INVALID_ARGUMENT,
                                              "Lookback must be a positive number of days",
                                              "PortfolioService");
    }

    auto ledger = ledger_through(as_of);
    if (ledger.is_error()) {
        return forward_error<PerformanceSummary>(ledger);
    }

    auto history =
        history_builder_.build_history(ledger.value(), DateRange(as_of - lookback_days, as_of));
    if (history.is_error()) {
        return forward_error<PerformanceSummary>(history);
    }

    return analyzer_.analyze(history.value(), as_of);
}

Result<std::vector<Transaction>> PortfolioService::get_transactions(
    const std::optional<std::string>& ticker) const {
    return store_->list_transactions(ticker);
}

Result<Transaction> PortfolioService::submit_transaction(const Transaction& txn) {
    auto stored = bulk_import({txn});
    if (stored.is_error()) {
        return forward_error<Transaction>(stored);
    }
    return Result<Transaction>(stored.value().front());
}

Result<std::vector<Transaction>> PortfolioService::bulk_import(
    const std::vector<Transaction>& transactions) {
    if (transactions.empty()) {
        return Result<std::vector<Transaction>>(std::vector<Transaction>());
    }

    for (size_t i = 0; i < transactions.size(); ++i) {
        auto valid = validate_transaction(transactions[i]);
        if (valid.is_error()) {
            WARN("Rejected entry " << i << " of import: " << valid.error()->what());
            return forward_error<std::vector<Transaction>>(valid);
        }
    }

    // The store runs the fold on the exact ledger it is about to commit
    auto stored = store_->append_transactions(
        transactions, [this](const std::vector<Transaction>& ledger) {
            return check_ledger(ledger);
        });
    if (stored.is_error()) {
        WARN("Rejected import of " << transactions.size()
                                   << " transactions: " << stored.error()->what());
        return stored;
    }

    INFO("Recorded " << stored.value().size() << " transactions");
    return stored;
}

Result<void> PortfolioService::check_ledger(const std::vector<Transaction>& ledger) const {
    PositionStates states;
    return aggregator_.fold_all(ledger, states);
}

}  // namespace folio_ngin
