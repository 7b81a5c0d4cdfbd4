// src/portfolio/performance_analyzer.cpp

#include "folio_ngin/portfolio/performance_analyzer.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>
#include "folio_ngin/core/logger.hpp"

namespace folio_ngin {

namespace {

// One date of a value series, portfolio-wide or for a single ticker
struct SeriesPoint {
    Date date;
    Decimal value;
    Decimal total_pnl;
    Decimal gross_invested;
    Decimal gross_withdrawn;
};

std::optional<double> chain_returns(const std::vector<SeriesPoint>& series, const Date& start,
                                    const Date& end) {
    const SeriesPoint* previous = nullptr;
    size_t count = 0;
    double growth = 1.0;

    for (const auto& point : series) {
        if (point.date < start || point.date > end) {
            continue;
        }
        ++count;
        if (previous) {
            // Cash added today is treated as present at the start of the day
            double cashflow = point.gross_invested.as_double() - point.gross_withdrawn.as_double();
            double denom = previous->value.as_double() + cashflow;
            if (denom > 0.0) {
                growth *= 1.0 + (point.value.as_double() - denom) / denom;
            }
        }
        previous = &point;
    }

    if (count < 2) {
        return std::nullopt;
    }
    return growth - 1.0;
}

SeriesPoint portfolio_point(const PortfolioHistoryPoint& point) {
    return SeriesPoint{point.date, point.total_value, point.total_pnl(), point.gross_invested,
                       point.gross_withdrawn};
}

// series is ascending and ends on or before as_of
std::vector<PeriodStats> period_stats(const std::vector<SeriesPoint>& series, const Date& as_of,
                                      const std::vector<PerformancePeriod>& periods) {
    const SeriesPoint& last = series.back();
    auto last_on_or_before = [&series](const Date& date) -> const SeriesPoint* {
        const SeriesPoint* found = nullptr;
        for (const auto& point : series) {
            if (point.date > date) {
                break;
            }
            found = &point;
        }
        return found;
    };

    std::vector<PeriodStats> result;
    result.reserve(periods.size());
    for (const auto& period : periods) {
        PeriodStats stats;
        stats.label = period.label;
        stats.days = period.days;

        const SeriesPoint* start = last_on_or_before(as_of - period.days);
        if (!start) {
            result.push_back(std::move(stats));
            continue;
        }

        stats.available = true;
        stats.start_date = start->date;
        stats.end_date = as_of;
        auto twr = chain_returns(series, start->date, as_of);
        if (twr) {
            stats.twr_pct = *twr * 100.0;
        }
        stats.pnl_abs = last.total_pnl - start->total_pnl;
        stats.mv_start = start->value;
        stats.mv_end = last.value;

        for (const auto& point : series) {
            if (point.date > start->date && point.date <= as_of) {
                stats.cash_in += point.gross_invested;
                stats.cash_out += point.gross_withdrawn;
            }
        }

        result.push_back(std::move(stats));
    }
    return result;
}

}  // namespace

PerformanceAnalyzer::PerformanceAnalyzer() {
    Logger::register_component("PerformanceAnalyzer");
}

std::vector<PerformancePeriod> PerformanceAnalyzer::default_periods() {
    return {{"1W", 7}, {"1M", 30}, {"3M", 90}, {"6M", 180}, {"1Y", 365}};
}

std::optional<double> PerformanceAnalyzer::time_weighted_return(
    const std::vector<PortfolioHistoryPoint>& history, const Date& start, const Date& end) {
    std::vector<SeriesPoint> series;
    series.reserve(history.size());
    for (const auto& point : history) {
        if (point.date >= start && point.date <= end) {
            series.push_back(SeriesPoint{point.date, point.total_value, Decimal(),
                                         point.gross_invested, point.gross_withdrawn});
        }
    }
    return chain_returns(series, start, end);
}

Result<PerformanceSummary> PerformanceAnalyzer::analyze(
    const std::vector<PortfolioHistoryPoint>& history, const Date& as_of,
    const std::vector<PerformancePeriod>& periods) const {
    auto is_before = [](const PortfolioHistoryPoint& a, const PortfolioHistoryPoint& b) {
        return a.date < b.date;
    };
    if (!std::is_sorted(history.begin(), history.end(), is_before)) {
        return make_error<PerformanceSummary>(ErrorCode::INVALID_ARGUMENT,
                                              "History must be in ascending date order",
                                              "PerformanceAnalyzer");
    }

    for (const auto& period : periods) {
        if (period.days <= 0) {
            return make_error<PerformanceSummary>(
                ErrorCode::INVALID_ARGUMENT,
                "Period " + period.label + " must span a positive number of days",
                "PerformanceAnalyzer");
        }
    }

    auto end = std::find_if(history.begin(), history.end(),
                            [&as_of](const PortfolioHistoryPoint& point) {
                                return point.date > as_of;
                            });
    if (end == history.begin()) {
        return make_error<PerformanceSummary>(
            ErrorCode::DATA_NOT_FOUND, "No history on or before " + as_of.to_string(),
            "PerformanceAnalyzer");
    }
    const PortfolioHistoryPoint& last = *(end - 1);

    PerformanceSummary summary;
    summary.as_of = as_of;

    try {
        std::vector<SeriesPoint> portfolio;
        std::map<std::string, std::vector<SeriesPoint>> by_ticker;
        for (auto it = history.begin(); it != end; ++it) {
            portfolio.push_back(portfolio_point(*it));
            for (const auto& ticker : it->tickers) {
                by_ticker[ticker.ticker].push_back(SeriesPoint{it->date, ticker.market_value,
                                                               ticker.total_pnl(),
                                                               ticker.gross_invested,
                                                               ticker.gross_withdrawn});
            }
        }

        summary.total_value = last.total_value;
        summary.total_pnl = last.total_pnl();
        summary.net_invested = last.net_invested;
        if (last.net_invested.is_positive()) {
            summary.total_pnl_pct = last.total_pnl_pct();
        }
        summary.periods = period_stats(portfolio, as_of, periods);

        for (const auto& ticker : last.tickers) {
            TickerPerformance record;
            record.ticker = ticker.ticker;
            record.quantity = ticker.quantity;
            record.market_value = ticker.market_value;
            record.total_pnl = ticker.total_pnl();
            record.cum_invested = ticker.cum_invested;
            record.cum_withdrawn = ticker.cum_withdrawn;
            if (ticker.cum_invested.is_positive()) {
                record.total_pnl_pct =
                    record.total_pnl.as_double() / ticker.cum_invested.as_double() * 100.0;
            }
            record.periods = period_stats(by_ticker[ticker.ticker], as_of, periods);
            summary.tickers.push_back(std::move(record));
        }
    } catch (const std::exception& e) {
        return make_error<PerformanceSummary>(ErrorCode::INVALID_DATA,
                                              "Performance totals out of range as of " +
                                                  as_of.to_string() + ": " + e.what(),
                                              "PerformanceAnalyzer");
    }

    size_t unavailable = std::count_if(summary.periods.begin(), summary.periods.end(),
                                       [](const PeriodStats& stats) { return !stats.available; });
    DEBUG("Analyzed " << summary.tickers.size() << " tickers as of " << as_of << ", "
                      << unavailable << " portfolio periods unavailable");

    return Result<PerformanceSummary>(std::move(summary));
}

}  // namespace folio_ngin
