// src/data/in_memory_transaction_store.cpp

#include "folio_ngin/data/in_memory_transaction_store.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace folio_ngin {

InMemoryTransactionStore::InMemoryTransactionStore(const std::vector<Transaction>& transactions) {
    auto appended = append_transactions(transactions);
    if (appended.is_error()) {
        throw std::invalid_argument(appended.error()->what());
    }
}

Result<std::vector<Transaction>> InMemoryTransactionStore::list_transactions(
    const std::optional<std::string>& ticker, const std::optional<Timestamp>& before) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Transaction> selected;
    for (const auto& txn : ledger_) {
        if (ticker && txn.ticker != *ticker) {
            continue;
        }
        if (before && txn.timestamp >= *before) {
            continue;
        }
        selected.push_back(txn);
    }
    return Result<std::vector<Transaction>>(std::move(selected));
}

Result<std::vector<Transaction>> InMemoryTransactionStore::append_transactions(
    const std::vector<Transaction>& transactions, const LedgerCheck& check) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<int64_t> ids;
    for (const auto& txn : ledger_) {
        ids.insert(txn.id);
    }

    std::vector<Transaction> stored;
    stored.reserve(transactions.size());
    int64_t next_id = next_id_;
    for (const auto& txn : transactions) {
        Transaction copy = txn;
        if (copy.id == 0) {
            while (ids.count(next_id)) {
                ++next_id;
            }
            copy.id = next_id++;
        } else if (copy.id < 0 || ids.count(copy.id)) {
            return make_error<std::vector<Transaction>>(
                ErrorCode::INVALID_ARGUMENT,
                "Transaction id " + std::to_string(copy.id) + " is invalid or already recorded",
                "InMemoryTransactionStore");
        }
        ids.insert(copy.id);
        next_id = std::max(next_id, copy.id + 1);
        stored.push_back(std::move(copy));
    }

    std::vector<Transaction> merged = ledger_;
    merged.insert(merged.end(), stored.begin(), stored.end());
    std::stable_sort(merged.begin(), merged.end(), transaction_before);

    if (check) {
        auto checked = check(merged);
        if (checked.is_error()) {
            return forward_error<std::vector<Transaction>>(checked);
        }
    }

    // Commit only after the whole batch was accepted
    ledger_ = std::move(merged);
    next_id_ = next_id;

    return Result<std::vector<Transaction>>(std::move(stored));
}

Result<std::vector<std::string>> InMemoryTransactionStore::list_tickers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> tickers;
    for (const auto& txn : ledger_) {
        tickers.insert(txn.ticker);
    }
    return Result<std::vector<std::string>>(
        std::vector<std::string>(tickers.begin(), tickers.end()));
}

size_t InMemoryTransactionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.size();
}

}  // namespace folio_ngin
