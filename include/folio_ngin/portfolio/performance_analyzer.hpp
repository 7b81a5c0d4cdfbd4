// include/folio_ngin/portfolio/performance_analyzer.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "folio_ngin/core/error.hpp"
#include "folio_ngin/core/types.hpp"

namespace folio_ngin {

/**
 * @brief Lookback window, e.g. {"1M", 30}
 */
struct PerformancePeriod {
    std::string label;
    int days{0};
};

/**
 * @brief Statistics for one lookback window
 *
 * available is false when the history has no point on or before the
 * window start; the other fields are then left at their defaults.
 */
struct PeriodStats {
    std::string label;
    int days{0};
    bool available{false};

    Date start_date;
    Date end_date;
    std::optional<double> twr_pct;  // unset with fewer than two points in the window
    Decimal pnl_abs;
    Decimal cash_in;
    Decimal cash_out;
    Decimal mv_start;
    Decimal mv_end;
};

/**
 * @brief One ticker's performance as of a date
 *
 * total_pnl_pct is measured against all BUY cash ever spent on the ticker,
 * so a closed position still reports a percentage.
 */
struct TickerPerformance {
    std::string ticker;
    Quantity quantity;
    Decimal market_value;
    Decimal total_pnl;
    Decimal cum_invested;
    Decimal cum_withdrawn;
    std::optional<double> total_pnl_pct;  // unset when nothing was bought
    std::vector<PeriodStats> periods;
};

/**
 * @brief Portfolio performance as of one date
 */
struct PerformanceSummary {
    Date as_of;
    Decimal total_value;
    Decimal total_pnl;
    Decimal net_invested;
    std::optional<double> total_pnl_pct;  // over net_invested, unset when nothing is invested
    std::vector<PeriodStats> periods;
    std::vector<TickerPerformance> tickers;  // sorted by ticker
};

/**
 * @brief Time-weighted return and period P&L over a history series
 */
class PerformanceAnalyzer {
public:
    PerformanceAnalyzer();

    /**
     * @brief 1W, 1M, 3M, 6M and 1Y windows
     */
    static std::vector<PerformancePeriod> default_periods();

    /**
     * @brief Summarize a history series
     * @param history Points in ascending date order
     * @param as_of Evaluation date, points after it are ignored
     * @param periods Lookback windows to report, for the portfolio and each ticker
     * @return DATA_NOT_FOUND when no point exists on or before as_of,
     *         INVALID_DATA when a total leaves the Decimal range
     */
    Result<PerformanceSummary> analyze(const std::vector<PortfolioHistoryPoint>& history,
                                       const Date& as_of,
                                       const std::vector<PerformancePeriod>& periods =
                                           default_periods()) const;

    /**
     * @brief Chain daily returns net of cash flows over [start, end]
     * @return Fractional return, unset when fewer than two points fall in the window
     */
    static std::optional<double> time_weighted_return(
        const std::vector<PortfolioHistoryPoint>& history, const Date& start, const Date& end);
};

}  // namespace folio_ngin
