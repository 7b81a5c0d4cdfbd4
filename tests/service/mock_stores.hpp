#pragma once

#include <gmock/gmock.h>
#include <optional>
#include <string>
#include <vector>
#include "folio_ngin/data/results_store.hpp"
#include "folio_ngin/data/transaction_store.hpp"

namespace folio_ngin {
namespace testing {

class MockTransactionStore : public TransactionStore {
public:
    MOCK_METHOD(Result<std::vector<Transaction>>, list_transactions,
                (const std::optional<std::string>& ticker, const std::optional<Timestamp>& before),
                (const, override));
    MOCK_METHOD(Result<std::vector<Transaction>>, append_transactions,
                (const std::vector<Transaction>& transactions, const LedgerCheck& check),
                (override));
    MOCK_METHOD(Result<std::vector<std::string>>, list_tickers, (), (const, override));
};

class MockResultsStore : public ResultsStore {
public:
    MOCK_METHOD(Result<void>, store_positions,
                (const Date& as_of, const std::vector<Position>& positions), (override));
    MOCK_METHOD(Result<void>, store_history, (const std::vector<PortfolioHistoryPoint>& points),
                (override));
};

}  // namespace testing
}  // namespace folio_ngin
