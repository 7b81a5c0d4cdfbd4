// include/folio_ngin/data/results_store.hpp

#pragma once

#include <vector>
#include "folio_ngin/core/error.hpp"
#include "folio_ngin/core/types.hpp"

namespace folio_ngin {

/**
 * @brief Write-only cache for computed positions and history
 * The engine never reads these results back.
 */
class ResultsStore {
public:
    virtual ~ResultsStore() = default;

    /**
     * @brief Store a position snapshot, replacing any snapshot for the same date
     * @param as_of Valuation date of the snapshot
     * @param positions Valued positions
     * @return Result indicating success or failure
     */
    virtual Result<void> store_positions(const Date& as_of,
                                         const std::vector<Position>& positions) = 0;

    /**
     * @brief Store history points, replacing existing points on the same dates
     * @param points Ordered history points
     * @return Result indicating success or failure
     */
    virtual Result<void> store_history(const std::vector<PortfolioHistoryPoint>& points) = 0;
};

}  // namespace folio_ngin
