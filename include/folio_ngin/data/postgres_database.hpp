// include/folio_ngin/data/postgres_database.hpp

#pragma once

#include <arrow/api.h>
#include <memory>
#include <mutex>
#include <optional>
#include <pqxx/pqxx>
#include <string>
#include <vector>
#include "folio_ngin/core/error.hpp"
#include "folio_ngin/core/logger.hpp"
#include "folio_ngin/core/types.hpp"
#include "folio_ngin/data/in_memory_market_data.hpp"
#include "folio_ngin/data/results_store.hpp"
#include "folio_ngin/data/transaction_store.hpp"

namespace folio_ngin {

/**
 * @brief Table names used by the PostgreSQL adapter
 */
struct PostgresTables {
    std::string transactions{"transactions"};
    std::string prices{"prices"};
    std::string tickers{"tickers"};
    std::string positions{"positions"};
    std::string history{"portfolio_history"};
};

/**
 * @brief PostgreSQL ledger, price source and results cache
 *
 * Numeric columns are read as text so NUMERIC(20,8) values reach Decimal
 * without passing through double.
 */
class PostgresDatabase : public TransactionStore, public ResultsStore {
public:
    /**
     * @brief Constructor
     * @param connection_string libpq connection string
     * @param tables Table names, validated on connect
     */
    explicit PostgresDatabase(std::string connection_string, PostgresTables tables = {});

    ~PostgresDatabase() override;

    PostgresDatabase(const PostgresDatabase&) = delete;
    PostgresDatabase& operator=(const PostgresDatabase&) = delete;
    PostgresDatabase(PostgresDatabase&&) = delete;
    PostgresDatabase& operator=(PostgresDatabase&&) = delete;

    /**
     * @brief Connect to the database
     * @return Result indicating success or failure
     */
    Result<void> connect();

    /**
     * @brief Disconnect from the database
     */
    void disconnect();

    /**
     * @brief Check if the database connection is active
     */
    bool is_connected() const;

    Result<std::vector<Transaction>> list_transactions(
        const std::optional<std::string>& ticker = std::nullopt,
        const std::optional<Timestamp>& before = std::nullopt) const override;

    /**
     * @brief Insert transactions in one database transaction
     * Unknown tickers are registered in the tickers table with the
     * transaction currency. With a check, the transactions table is locked
     * against other writers and the check runs on the ledger read back
     * inside the same transaction before commit.
     */
    Result<std::vector<Transaction>> append_transactions(
        const std::vector<Transaction>& transactions, const LedgerCheck& check = nullptr) override;

    Result<std::vector<std::string>> list_tickers() const override;

    /**
     * @brief Replace the positions snapshot for a date
     */
    Result<void> store_positions(const Date& as_of,
                                 const std::vector<Position>& positions) override;

    /**
     * @brief Upsert history points by date
     */
    Result<void> store_history(const std::vector<PortfolioHistoryPoint>& points) override;

    /**
     * @brief Load prices and FX rates up to a date into an in-memory snapshot
     * @param tickers Instruments to load prices for
     * @param end Last date to load
     * @return Snapshot usable as the engine's market data feed
     */
    Result<std::shared_ptr<InMemoryMarketData>> load_market_data(
        const std::vector<std::string>& tickers, const Date& end) const;

    /**
     * @brief Execute a query and return the result as an Arrow table of text columns
     */
    Result<std::shared_ptr<arrow::Table>> execute_query(const std::string& query) const;

    std::string get_connection_string() const {
        return connection_string_;
    }

    /**
     * @brief Validate table name for SQL injection prevention
     */
    Result<void> validate_table_name(const std::string& table_name) const;

    /**
     * @brief Validate a ticker or FX symbol for SQL injection prevention
     */
    Result<void> validate_symbol(const std::string& symbol) const;

private:
    std::string connection_string_;
    PostgresTables tables_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    Result<void> validate_connection() const;

    Result<void> validate_symbols(const std::vector<std::string>& symbols) const;

    /**
     * @brief Convert a pqxx result to an Arrow table, one utf8 column per result column
     */
    Result<std::shared_ptr<arrow::Table>> convert_to_arrow_table(const pqxx::result& result) const;
};

}  // namespace folio_ngin
