// src/portfolio/history_builder.cpp

#include "folio_ngin/portfolio/history_builder.hpp"
#include <algorithm>
#include <future>
#include <map>
#include <stdexcept>
#include "folio_ngin/core/logger.hpp"

namespace folio_ngin {

HistoryBuilder::HistoryBuilder(EngineConfig config, std::shared_ptr<const MarketDataFeed> feed)
    : config_(config),
      aggregator_(config, feed),
      valuation_(feed, config.allow_inverse_rates) {
    Logger::register_component("HistoryBuilder");
}

Result<std::vector<PortfolioHistoryPoint>> HistoryBuilder::build_history(
    const std::vector<Transaction>& all_transactions, const DateRange& range,
    const std::optional<HistorySeed>& seed) const {
    using PointsResult = Result<std::vector<PortfolioHistoryPoint>>;

    if (!range.is_valid()) {
        return make_error<std::vector<PortfolioHistoryPoint>>(
            ErrorCode::INVALID_ARGUMENT,
            "Invalid date range " + range.start.to_string() + " to " + range.end.to_string(),
            "HistoryBuilder");
    }

    if (!std::is_sorted(all_transactions.begin(), all_transactions.end(), transaction_before)) {
        return make_error<std::vector<PortfolioHistoryPoint>>(
            ErrorCode::INVALID_ARGUMENT, "Transactions must be in chronological order",
            "HistoryBuilder");
    }

    PositionStates states;
    auto next = all_transactions.begin();

    if (seed) {
        if (seed->as_of >= range.start) {
            return make_error<std::vector<PortfolioHistoryPoint>>(
                ErrorCode::INVALID_ARGUMENT,
                "Seed date " + seed->as_of.to_string() + " must precede range start " +
                    range.start.to_string(),
                "HistoryBuilder");
        }
        states = seed->states;
        while (next != all_transactions.end() && next->trade_date() <= seed->as_of) {
            ++next;
        }
    }

    // Fold everything dated before the range into the starting states
    auto first_in_range = next;
    while (first_in_range != all_transactions.end() && first_in_range->trade_date() < range.start) {
        ++first_in_range;
    }
    auto seeded = aggregator_.fold_all(std::vector<Transaction>(next, first_in_range), states);
    if (seeded.is_error()) {
        return forward_error<std::vector<PortfolioHistoryPoint>>(seeded);
    }
    next = first_in_range;

    DEBUG("History seeded with " << states.size() << " tickers before " << range.start);

    std::vector<PortfolioHistoryPoint> points;
    points.reserve(static_cast<size_t>(range.size()));

    for (Date date = range.start; date <= range.end; ++date) {
        PortfolioHistoryPoint point;
        point.date = date;
        bool activity = false;
        std::map<std::string, CashFlow> day_flows;

        while (next != all_transactions.end() && next->trade_date() == date) {
            const Transaction& txn = *next;
            auto it = states.find(txn.ticker);
            if (it == states.end()) {
                it = states.emplace(txn.ticker, PositionState(txn.ticker)).first;
            }

            auto applied = aggregator_.apply(it->second, txn);
            if (applied.is_error()) {
                ERROR("History build failed on " << date << " at transaction " << txn.id << ": "
                                                 << applied.error()->what());
                return forward_error<std::vector<PortfolioHistoryPoint>>(applied);
            }
            try {
                const CashFlow& flow = applied.value();
                point.gross_invested += flow.invested;
                point.gross_withdrawn += flow.withdrawn;
                day_flows[txn.ticker].invested += flow.invested;
                day_flows[txn.ticker].withdrawn += flow.withdrawn;
            } catch (const std::exception& e) {
                return make_error<std::vector<PortfolioHistoryPoint>>(
                    ErrorCode::INVALID_DATA,
                    "Daily cash flow overflow on " + date.to_string() + ": " + e.what(),
                    "HistoryBuilder");
            }
            activity = true;
            ++next;
        }

        bool holding = std::any_of(states.begin(), states.end(),
                                   [](const auto& entry) { return entry.second.has_position(); });
        if (config_.skip_leading_empty && points.empty() && !holding && !activity) {
            continue;
        }

        auto valued = value_date(states, day_flows, point);
        if (valued.is_error()) {
            ERROR("History build failed on " << date << ": " << valued.error()->what());
            return forward_error<std::vector<PortfolioHistoryPoint>>(valued);
        }

        points.push_back(std::move(point));
    }

    INFO("Built " << points.size() << " history points from " << range.start << " to "
                  << range.end);

    return PointsResult(std::move(points));
}

Result<void> HistoryBuilder::value_date(const PositionStates& states,
                                        const std::map<std::string, CashFlow>& day_flows,
                                        PortfolioHistoryPoint& point) const {
    std::vector<Position> held;
    try {
        for (const auto& entry : states) {
            const PositionState& state = entry.second;
            point.realized_pnl += state.realized_pnl();
            point.net_invested += state.net_invested();
            if (state.has_position()) {
                held.push_back(state.to_position());
            }
        }
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Portfolio totals overflow on " + point.date.to_string() + ": " +
                                    e.what(),
                                "HistoryBuilder");
    }

    std::vector<Position> slots(held.size());
    size_t workers = std::min(config_.valuation_threads, held.size());

    if (workers > 1 && held.size() >= config_.parallel_threshold) {
        // Each task owns a disjoint range of slots; totals are summed after the join
        size_t chunk = (held.size() + workers - 1) / workers;
        std::vector<std::future<Result<void>>> tasks;
        for (size_t begin = 0; begin < held.size(); begin += chunk) {
            size_t end = std::min(begin + chunk, held.size());
            tasks.push_back(std::async(std::launch::async,
                                       [this, &held, &slots, date = point.date, begin, end]() {
                                           Logger::register_component("HistoryBuilder");
                                           return value_slice(held, begin, end, date, slots);
                                       }));
        }

        Result<void> first_failure;
        for (auto& task : tasks) {
            Result<void> outcome = task.get();
            if (outcome.is_error() && first_failure.is_ok()) {
                first_failure = std::move(outcome);
            }
        }
        if (first_failure.is_error()) {
            return first_failure;
        }
    } else {
        auto outcome = value_slice(held, 0, held.size(), point.date, slots);
        if (outcome.is_error()) {
            return outcome;
        }
    }

    try {
        for (const auto& position : slots) {
            point.total_value += position.market_value;
            point.unrealized_pnl += position.unrealized_pnl;
            point.breakdown.push_back(TickerValue{position.ticker, position.quantity,
                                                  position.market_value});
        }

        // slots follow the held subset of states in map order
        size_t slot = 0;
        point.tickers.reserve(states.size());
        for (const auto& entry : states) {
            const PositionState& state = entry.second;
            TickerPoint ticker;
            ticker.ticker = entry.first;
            ticker.quantity = state.quantity();
            ticker.realized_pnl = state.realized_pnl();
            ticker.cum_invested = state.cum_invested();
            ticker.cum_withdrawn = state.cum_withdrawn();
            if (state.has_position()) {
                ticker.market_value = slots[slot].market_value;
                ticker.unrealized_pnl = slots[slot].unrealized_pnl;
                ++slot;
            }
            auto flow = day_flows.find(entry.first);
            if (flow != day_flows.end()) {
                ticker.gross_invested = flow->second.invested;
                ticker.gross_withdrawn = flow->second.withdrawn;
            }
            point.tickers.push_back(std::move(ticker));
        }
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Portfolio value overflow on " + point.date.to_string() + ": " +
                                    e.what(),
                                "HistoryBuilder");
    }

    return Result<void>();
}

Result<void> HistoryBuilder::value_slice(const std::vector<Position>& held, size_t begin,
                                         size_t end, const Date& date,
                                         std::vector<Position>& slots) const {
    for (size_t i = begin; i < end; ++i) {
        auto valued = valuation_.value_at(held[i], config_.base_currency, date);
        if (valued.is_error()) {
            return forward_error<void>(valued);
        }
        slots[i] = valued.value();
    }
    return Result<void>();
}

}  // namespace folio_ngin
