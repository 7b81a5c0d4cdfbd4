// src/data/postgres_database.cpp

#include "folio_ngin/data/postgres_database.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include "folio_ngin/core/time_utils.hpp"
#include "folio_ngin/data/conversion_utils.hpp"

namespace folio_ngin {

PostgresDatabase::PostgresDatabase(std::string connection_string, PostgresTables tables)
    : connection_string_(std::move(connection_string)),
      tables_(std::move(tables)),
      connection_(nullptr) {
    Logger::register_component("PostgresDatabase");
}

PostgresDatabase::~PostgresDatabase() {
    disconnect();
}

Result<void> PostgresDatabase::connect() {
    for (const auto& table : {tables_.transactions, tables_.prices, tables_.tickers,
                              tables_.positions, tables_.history}) {
        auto validation = validate_table_name(table);
        if (validation.is_error()) {
            return validation;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);

    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            connection_.reset();
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", "PostgresDatabase");
        }

        INFO("Connected to PostgreSQL database " << connection_->dbname());
        return Result<void>();

    } catch (const std::exception& e) {
        connection_.reset();
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

void PostgresDatabase::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        connection_->close();
        connection_.reset();
        INFO("Disconnected from PostgreSQL database");
    }
}

bool PostgresDatabase::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresDatabase::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                "PostgresDatabase");
    }
    return Result<void>();
}

Result<std::vector<Transaction>> PostgresDatabase::list_transactions(
    const std::optional<std::string>& ticker, const std::optional<Timestamp>& before) const {
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::vector<Transaction>>(validation);
    }
    if (ticker) {
        auto symbol_validation = validate_symbol(*ticker);
        if (symbol_validation.is_error()) {
            return forward_error<std::vector<Transaction>>(symbol_validation);
        }
    }

    std::optional<std::string> before_text;
    if (before) {
        before_text = core::format_timestamp_micros(*before);
    }

    std::string query =
        "SELECT id::text AS id, to_char(time, 'YYYY-MM-DD HH24:MI:SS.US') AS time, type, ticker, "
        "currency, shares::text AS shares, price::text AS price, note "
        "FROM " +
        tables_.transactions +
        " WHERE ($1::text IS NULL OR ticker = $1::text)"
        " AND ($2::timestamp IS NULL OR time < $2::timestamp)"
        " ORDER BY time, id";

    std::shared_ptr<arrow::Table> table;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(query, ticker, before_text);
            txn.commit();

            auto table_result = convert_to_arrow_table(result);
            if (table_result.is_error()) {
                return forward_error<std::vector<Transaction>>(table_result);
            }
            table = table_result.value();
        } catch (const std::exception& e) {
            return make_error<std::vector<Transaction>>(
                ErrorCode::DATABASE_ERROR, "Failed to list transactions: " + std::string(e.what()),
                "PostgresDatabase");
        }
    }

    auto transactions = DataConversionUtils::arrow_table_to_transactions(table);
    if (transactions.is_ok()) {
        DEBUG("Loaded " << transactions.value().size() << " transactions"
                        << (ticker ? " for " + *ticker : std::string()));
    }
    return transactions;
}

Result<std::vector<Transaction>> PostgresDatabase::append_transactions(
    const std::vector<Transaction>& transactions, const LedgerCheck& check) {
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::vector<Transaction>>(validation);
    }
    for (const auto& txn : transactions) {
        auto symbol_validation = validate_symbol(txn.ticker);
        if (symbol_validation.is_error()) {
            return forward_error<std::vector<Transaction>>(symbol_validation);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);

    try {
        pqxx::work txn(*connection_);
        std::vector<Transaction> stored;
        stored.reserve(transactions.size());

        // Writers from other connections wait until this batch commits or aborts
        if (check) {
            txn.exec("LOCK TABLE " + tables_.transactions + " IN SHARE ROW EXCLUSIVE MODE");
        }

        std::string register_ticker = "INSERT INTO " + tables_.tickers +
                                      " (ticker, currency) VALUES ($1, $2)"
                                      " ON CONFLICT (ticker) DO NOTHING";
        std::string insert_with_id =
            "INSERT INTO " + tables_.transactions +
            " (id, time, type, ticker, currency, shares, price, note)"
            " VALUES ($1, $2::timestamp, $3, $4, $5, $6::numeric, $7::numeric, $8) RETURNING id";
        std::string insert_new =
            "INSERT INTO " + tables_.transactions +
            " (time, type, ticker, currency, shares, price, note)"
            " VALUES ($1::timestamp, $2, $3, $4, $5::numeric, $6::numeric, $7) RETURNING id";

        std::set<std::string> registered;
        for (const auto& record : transactions) {
            if (registered.insert(record.ticker).second) {
                txn.exec_params(register_ticker, record.ticker, record.currency);
            }

            std::string time_text = core::format_timestamp_micros(record.timestamp);
            std::string type_text = transaction_type_to_string(record.type);
            pqxx::result inserted =
                record.id != 0
                    ? txn.exec_params(insert_with_id, record.id, time_text, type_text,
                                      record.ticker, record.currency,
                                      record.quantity.to_string(), record.price.to_string(),
                                      record.note)
                    : txn.exec_params(insert_new, time_text, type_text, record.ticker,
                                      record.currency, record.quantity.to_string(),
                                      record.price.to_string(), record.note);

            Transaction copy = record;
            copy.id = inserted[0][0].as<int64_t>();
            stored.push_back(std::move(copy));
        }

        if (check) {
            std::string ledger_query =
                "SELECT id::text AS id, to_char(time, 'YYYY-MM-DD HH24:MI:SS.US') AS time, type, "
                "ticker, currency, shares::text AS shares, price::text AS price, note FROM " +
                tables_.transactions + " ORDER BY time, id";
            auto table = convert_to_arrow_table(txn.exec(ledger_query));
            if (table.is_error()) {
                return forward_error<std::vector<Transaction>>(table);
            }
            auto ledger = DataConversionUtils::arrow_table_to_transactions(table.value());
            if (ledger.is_error()) {
                return forward_error<std::vector<Transaction>>(ledger);
            }
            auto checked = check(ledger.value());
            if (checked.is_error()) {
                // Leaving scope without commit rolls the inserts back
                return forward_error<std::vector<Transaction>>(checked);
            }
        }

        txn.commit();
        INFO("Appended " << stored.size() << " transactions");
        return Result<std::vector<Transaction>>(std::move(stored));

    } catch (const std::exception& e) {
        return make_error<std::vector<Transaction>>(
            ErrorCode::DATABASE_ERROR, "Failed to append transactions: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<std::vector<std::string>> PostgresDatabase::list_tickers() const {
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::vector<std::string>>(validation);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    try {
        pqxx::work txn(*connection_);
        auto result =
            txn.exec("SELECT DISTINCT ticker FROM " + tables_.transactions + " ORDER BY ticker");
        txn.commit();

        std::vector<std::string> tickers;
        tickers.reserve(result.size());
        for (const auto& row : result) {
            tickers.push_back(row[0].as<std::string>());
        }
        return Result<std::vector<std::string>>(std::move(tickers));

    } catch (const std::exception& e) {
        return make_error<std::vector<std::string>>(
            ErrorCode::DATABASE_ERROR, "Failed to list tickers: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::store_positions(const Date& as_of,
                                               const std::vector<Position>& positions) {
    auto validation = validate_connection();
    if (validation.is_error())
        return validation;

    for (const auto& pos : positions) {
        auto symbol_validation = validate_symbol(pos.ticker);
        if (symbol_validation.is_error()) {
            ERROR("Position validation failed for " << pos.ticker << ": "
                                                    << symbol_validation.error()->what());
            return symbol_validation;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);

    try {
        pqxx::work txn(*connection_);
        const std::string date_text = as_of.to_string();

        txn.exec_params("DELETE FROM " + tables_.positions + " WHERE date = $1::date", date_text);

        std::string insert = "INSERT INTO " + tables_.positions +
                             " (date, ticker, shares, average_cost, realized_pnl, unrealized_pnl,"
                             " market_value) VALUES ($1::date, $2, $3::numeric, $4::numeric,"
                             " $5::numeric, $6::numeric, $7::numeric)";
        for (const auto& pos : positions) {
            txn.exec_params(insert, date_text, pos.ticker, pos.quantity.to_string(),
                            pos.average_cost.to_string(), pos.realized_pnl.to_string(),
                            pos.unrealized_pnl.to_string(), pos.market_value.to_string());
        }

        txn.commit();
        INFO("Stored " << positions.size() << " positions for " << as_of);
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to store positions: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::store_history(const std::vector<PortfolioHistoryPoint>& points) {
    auto validation = validate_connection();
    if (validation.is_error())
        return validation;

    std::lock_guard<std::mutex> lock(mutex_);

    try {
        pqxx::work txn(*connection_);

        std::string upsert =
            "INSERT INTO " + tables_.history +
            " (date, total_value, invested_value, gross_invested, gross_withdrawn, realized_pnl,"
            " unrealized_pnl) VALUES ($1::date, $2::numeric, $3::numeric, $4::numeric,"
            " $5::numeric, $6::numeric, $7::numeric)"
            " ON CONFLICT (date) DO UPDATE SET total_value = EXCLUDED.total_value,"
            " invested_value = EXCLUDED.invested_value,"
            " gross_invested = EXCLUDED.gross_invested,"
            " gross_withdrawn = EXCLUDED.gross_withdrawn,"
            " realized_pnl = EXCLUDED.realized_pnl,"
            " unrealized_pnl = EXCLUDED.unrealized_pnl";

        for (const auto& point : points) {
            txn.exec_params(upsert, point.date.to_string(), point.total_value.to_string(),
                            point.net_invested.to_string(), point.gross_invested.to_string(),
                            point.gross_withdrawn.to_string(), point.realized_pnl.to_string(),
                            point.unrealized_pnl.to_string());
        }

        txn.commit();
        INFO("Stored " << points.size() << " history points");
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to store history: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<std::shared_ptr<InMemoryMarketData>> PostgresDatabase::load_market_data(
    const std::vector<std::string>& tickers, const Date& end) const {
    using SnapshotResult = Result<std::shared_ptr<InMemoryMarketData>>;

    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::shared_ptr<InMemoryMarketData>>(validation);
    }
    auto symbol_validation = validate_symbols(tickers);
    if (symbol_validation.is_error()) {
        return forward_error<std::shared_ptr<InMemoryMarketData>>(symbol_validation);
    }

    std::string price_query =
        "SELECT p.ticker, p.date::text AS date, p.open::text AS open, p.high::text AS high,"
        " p.low::text AS low, p.close::text AS close, t.currency"
        " FROM " +
        tables_.prices + " p JOIN " + tables_.tickers +
        " t ON t.ticker = p.ticker"
        " WHERE p.ticker = ANY($1) AND p.date <= $2::date ORDER BY p.ticker, p.date";

    std::string fx_query = "SELECT ticker AS fx_ticker, date::text AS date, close::text AS rate"
                           " FROM " +
                           tables_.prices +
                           " WHERE ticker LIKE '%=X' AND date <= $1::date ORDER BY ticker, date";

    std::shared_ptr<arrow::Table> price_table;
    std::shared_ptr<arrow::Table> fx_table;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            pqxx::work txn(*connection_);
            auto price_rows = txn.exec_params(price_query, tickers, end.to_string());
            auto fx_rows = txn.exec_params(fx_query, end.to_string());
            txn.commit();

            auto price_result = convert_to_arrow_table(price_rows);
            if (price_result.is_error()) {
                return forward_error<std::shared_ptr<InMemoryMarketData>>(price_result);
            }
            auto fx_result = convert_to_arrow_table(fx_rows);
            if (fx_result.is_error()) {
                return forward_error<std::shared_ptr<InMemoryMarketData>>(fx_result);
            }
            price_table = price_result.value();
            fx_table = fx_result.value();

        } catch (const std::exception& e) {
            return make_error<std::shared_ptr<InMemoryMarketData>>(
                ErrorCode::DATABASE_ERROR, "Failed to load market data: " + std::string(e.what()),
                "PostgresDatabase");
        }
    }

    auto prices = DataConversionUtils::arrow_table_to_prices(price_table);
    if (prices.is_error()) {
        return forward_error<std::shared_ptr<InMemoryMarketData>>(prices);
    }
    auto rates = DataConversionUtils::arrow_table_to_fx_rates(fx_table);
    if (rates.is_error()) {
        return forward_error<std::shared_ptr<InMemoryMarketData>>(rates);
    }

    auto snapshot = std::make_shared<InMemoryMarketData>();
    snapshot->upsert_prices(prices.value());
    auto stored = snapshot->upsert_fx_rates(rates.value());
    if (stored.is_error()) {
        return forward_error<std::shared_ptr<InMemoryMarketData>>(stored);
    }

    INFO("Loaded " << prices.value().size() << " prices and " << rates.value().size()
                   << " FX rates up to " << end);
    return SnapshotResult(std::move(snapshot));
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::execute_query(
    const std::string& query) const {
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::shared_ptr<arrow::Table>>(validation);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec(query);
        txn.commit();
        return convert_to_arrow_table(result);

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::DATABASE_ERROR, "Failed to execute query: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::convert_to_arrow_table(
    const pqxx::result& result) const {
    try {
        arrow::MemoryPool* pool = arrow::default_memory_pool();
        std::vector<std::shared_ptr<arrow::Field>> fields;
        std::vector<std::shared_ptr<arrow::Array>> arrays;

        for (pqxx::row::size_type col = 0; col < result.columns(); ++col) {
            std::string col_name = result.column_name(col);
            arrow::StringBuilder builder(pool);

            if (builder.Reserve(result.size()) != arrow::Status::OK()) {
                return make_error<std::shared_ptr<arrow::Table>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Failed to reserve memory for column: " + col_name, "PostgresDatabase");
            }

            for (const auto& row : result) {
                arrow::Status status = row[col].is_null()
                                           ? builder.AppendNull()
                                           : builder.Append(row[col].as<std::string>());
                if (status != arrow::Status::OK()) {
                    return make_error<std::shared_ptr<arrow::Table>>(
                        ErrorCode::CONVERSION_ERROR,
                        "Failed to append value for column: " + col_name, "PostgresDatabase");
                }
            }

            std::shared_ptr<arrow::Array> array;
            if (builder.Finish(&array) != arrow::Status::OK()) {
                return make_error<std::shared_ptr<arrow::Table>>(
                    ErrorCode::CONVERSION_ERROR, "Failed to finish array for column: " + col_name,
                    "PostgresDatabase");
            }

            fields.push_back(arrow::field(col_name, arrow::utf8()));
            arrays.push_back(array);
        }

        auto table = arrow::Table::Make(arrow::schema(fields), arrays);
        return Result<std::shared_ptr<arrow::Table>>(table);

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Exception during Arrow table conversion: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::validate_table_name(const std::string& table_name) const {
    if (table_name.empty() || table_name.size() > 100) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid table_name: must be 1-100 characters", "PostgresDatabase");
    }

    // Allow only alphanumeric, underscore, and dot for schema.table format
    for (char c : table_name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid table_name: contains invalid characters",
                                    "PostgresDatabase");
        }
    }

    // Prevent SQL injection patterns
    std::string lower_name = table_name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(), ::tolower);

    std::vector<std::string> forbidden = {"drop",   "delete", "insert", "update", "alter",
                                          "create", "union",  "select", "script"};

    for (const auto& forbidden_word : forbidden) {
        if (lower_name.find(forbidden_word) != std::string::npos) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid table_name: contains forbidden SQL keywords",
                                    "PostgresDatabase");
        }
    }

    return Result<void>();
}

Result<void> PostgresDatabase::validate_symbol(const std::string& symbol) const {
    if (symbol.empty() || symbol.size() > 20) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid symbol: must be 1-20 characters", "PostgresDatabase");
    }

    // Tickers such as BRK-B, RDS.A, ^GSPC and FX symbols such as EURUSD=X
    for (char c : symbol) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.' && c != '-' &&
            c != '=' && c != '^') {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid symbol: contains invalid characters",
                                    "PostgresDatabase");
        }
    }

    return Result<void>();
}

Result<void> PostgresDatabase::validate_symbols(const std::vector<std::string>& symbols) const {
    if (symbols.size() > 1000) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Too many symbols: maximum 1000 allowed", "PostgresDatabase");
    }

    for (const auto& symbol : symbols) {
        auto validation = validate_symbol(symbol);
        if (validation.is_error()) {
            return validation;
        }
    }

    return Result<void>();
}

}  // namespace folio_ngin
