// include/folio_ngin/data/in_memory_transaction_store.hpp

#pragma once

#include <mutex>
#include <vector>
#include "folio_ngin/data/transaction_store.hpp"

namespace folio_ngin {

/**
 * @brief Ledger kept in memory in (timestamp, id) order
 */
class InMemoryTransactionStore : public TransactionStore {
public:
    InMemoryTransactionStore() = default;

    /**
     * @brief Start from an existing ledger; ids of 0 are assigned
     */
    explicit InMemoryTransactionStore(const std::vector<Transaction>& transactions);

    InMemoryTransactionStore(const InMemoryTransactionStore&) = delete;
    InMemoryTransactionStore& operator=(const InMemoryTransactionStore&) = delete;

    Result<std::vector<Transaction>> list_transactions(
        const std::optional<std::string>& ticker = std::nullopt,
        const std::optional<Timestamp>& before = std::nullopt) const override;

    Result<std::vector<Transaction>> append_transactions(
        const std::vector<Transaction>& transactions, const LedgerCheck& check = nullptr) override;

    Result<std::vector<std::string>> list_tickers() const override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Transaction> ledger_;
    int64_t next_id_{1};
};

}  // namespace folio_ngin
