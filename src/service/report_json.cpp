// src/service/report_json.cpp

#include "folio_ngin/service/report_json.hpp"
#include "folio_ngin/core/time_utils.hpp"

namespace folio_ngin {

namespace {

template <typename T>
nlohmann::json optional_value(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

// Unavailable periods serialize as null under their label
nlohmann::json periods_by_label(const std::vector<PeriodStats>& periods) {
    nlohmann::json by_label = nlohmann::json::object();
    for (const auto& stats : periods) {
        by_label[stats.label] = stats;
    }
    return by_label;
}

}  // namespace

void to_json(nlohmann::json& j, const Transaction& txn) {
    j = nlohmann::json{{"id", txn.id},
                       {"ticker", txn.ticker},
                       {"type", transaction_type_to_string(txn.type)},
                       {"quantity", txn.quantity.to_string()},
                       {"price", txn.price.to_string()},
                       {"currency", txn.currency},
                       {"timestamp", core::format_timestamp(txn.timestamp)},
                       {"note", optional_value(txn.note)}};
}

void to_json(nlohmann::json& j, const Position& position) {
    j = nlohmann::json{{"ticker", position.ticker},
                       {"quantity", position.quantity.to_string()},
                       {"average_cost", position.average_cost.to_string()},
                       {"realized_pnl", position.realized_pnl.to_string()},
                       {"unrealized_pnl", position.unrealized_pnl.to_string()},
                       {"market_value", position.market_value.to_string()},
                       {"last_update", position.last_update.to_string()}};
}

void to_json(nlohmann::json& j, const TickerValue& value) {
    j = nlohmann::json{{"ticker", value.ticker},
                       {"quantity", value.quantity.to_string()},
                       {"market_value", value.market_value.to_string()}};
}

void to_json(nlohmann::json& j, const PortfolioHistoryPoint& point) {
    j = nlohmann::json{{"date", point.date.to_string()},
                       {"total_value", point.total_value.to_string()},
                       {"realized_pnl", point.realized_pnl.to_string()},
                       {"unrealized_pnl", point.unrealized_pnl.to_string()},
                       {"net_invested", point.net_invested.to_string()},
                       {"gross_invested", point.gross_invested.to_string()},
                       {"gross_withdrawn", point.gross_withdrawn.to_string()},
                       {"total_pnl_pct", point.total_pnl_pct()},
                       {"breakdown", point.breakdown}};
}

void to_json(nlohmann::json& j, const PeriodStats& stats) {
    if (!stats.available) {
        j = nullptr;
        return;
    }
    j = nlohmann::json{{"start_date", stats.start_date.to_string()},
                       {"end_date", stats.end_date.to_string()},
                       {"twr_pct", optional_value(stats.twr_pct)},
                       {"pnl_abs", stats.pnl_abs.to_string()},
                       {"cash_in", stats.cash_in.to_string()},
                       {"cash_out", stats.cash_out.to_string()},
                       {"mv_start", stats.mv_start.to_string()},
                       {"mv_end", stats.mv_end.to_string()}};
}

void to_json(nlohmann::json& j, const TickerPerformance& ticker) {
    j = nlohmann::json{{"ticker", ticker.ticker},
                       {"quantity", ticker.quantity.to_string()},
                       {"market_value", ticker.market_value.to_string()},
                       {"total_pnl", ticker.total_pnl.to_string()},
                       {"cum_invested", ticker.cum_invested.to_string()},
                       {"cum_withdrawn", ticker.cum_withdrawn.to_string()},
                       {"total_pnl_pct", optional_value(ticker.total_pnl_pct)},
                       {"periods", periods_by_label(ticker.periods)}};
}

void to_json(nlohmann::json& j, const PerformanceSummary& summary) {
    j = nlohmann::json{{"as_of", summary.as_of.to_string()},
                       {"total_value", summary.total_value.to_string()},
                       {"total_pnl", summary.total_pnl.to_string()},
                       {"net_invested", summary.net_invested.to_string()},
                       {"total_pnl_pct", optional_value(summary.total_pnl_pct)},
                       {"periods", periods_by_label(summary.periods)},
                       {"tickers", summary.tickers}};
}

}  // namespace folio_ngin
