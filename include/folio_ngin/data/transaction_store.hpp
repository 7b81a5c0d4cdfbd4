// include/folio_ngin/data/transaction_store.hpp

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "folio_ngin/core/error.hpp"
#include "folio_ngin/core/types.hpp"

namespace folio_ngin {

/**
 * @brief Check run against the complete ledger a write would produce
 */
using LedgerCheck = std::function<Result<void>(const std::vector<Transaction>& ledger)>;

/**
 * @brief Append-only ledger of portfolio transactions
 */
class TransactionStore {
public:
    virtual ~TransactionStore() = default;

    /**
     * @brief List transactions in ledger order (ascending timestamp, id tiebreak)
     * @param ticker Restrict to one ticker when set
     * @param before Exclusive upper bound on timestamp when set
     * @return Result containing the ordered transactions
     */
    virtual Result<std::vector<Transaction>> list_transactions(
        const std::optional<std::string>& ticker = std::nullopt,
        const std::optional<Timestamp>& before = std::nullopt) const = 0;

    /**
     * @brief Append a batch of transactions atomically
     *
     * Ids of 0 are assigned first. When a check is given it sees the whole
     * ledger in store order with the batch merged in, under the same
     * exclusion as the write, and a failed check stores nothing.
     *
     * @param transactions Validated transactions
     * @param check Optional ledger check
     * @return Result containing the transactions as stored
     */
    virtual Result<std::vector<Transaction>> append_transactions(
        const std::vector<Transaction>& transactions, const LedgerCheck& check = nullptr) = 0;

    /**
     * @brief Distinct tickers present in the ledger, sorted
     */
    virtual Result<std::vector<std::string>> list_tickers() const = 0;
};

}  // namespace folio_ngin
