// src/data/conversion_utils.cpp
#include "folio_ngin/data/conversion_utils.hpp"
#include <arrow/array/concatenate.h>
#include <cctype>
#include "folio_ngin/core/time_utils.hpp"

namespace folio_ngin {

namespace {

// Tables built from query results hold one chunk per column
std::shared_ptr<arrow::Array> column(const std::shared_ptr<arrow::Table>& table,
                                     const std::string& name) {
    auto chunked = table->GetColumnByName(name);
    if (!chunked || chunked->num_chunks() == 0) {
        return nullptr;
    }
    if (chunked->num_chunks() == 1) {
        return chunked->chunk(0);
    }
    auto combined = arrow::Concatenate(chunked->chunks());
    return combined.ok() ? *combined : nullptr;
}

bool is_currency_code(const std::string& text) {
    if (text.size() != 3) {
        return false;
    }
    for (char c : text) {
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

}  // namespace

Result<void> DataConversionUtils::require_columns(const std::shared_ptr<arrow::Table>& table,
                                                  const std::vector<std::string>& columns) {
    if (!table) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                "DataConversionUtils");
    }
    for (const auto& col : columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<void>(ErrorCode::INVALID_DATA, "Missing required column: " + col,
                                    "DataConversionUtils");
        }
    }
    return Result<void>();
}

Result<std::vector<Transaction>> DataConversionUtils::arrow_table_to_transactions(
    const std::shared_ptr<arrow::Table>& table) {
    auto columns = require_columns(
        table, {"id", "time", "type", "ticker", "currency", "shares", "price"});
    if (columns.is_error()) {
        return forward_error<std::vector<Transaction>>(columns);
    }

    try {
        auto id_array = column(table, "id");
        auto time_array = column(table, "time");
        auto type_array = column(table, "type");
        auto ticker_array = column(table, "ticker");
        auto currency_array = column(table, "currency");
        auto shares_array = column(table, "shares");
        auto price_array = column(table, "price");
        auto note_array = table->GetColumnByName("note") ? column(table, "note") : nullptr;

        std::vector<Transaction> transactions;
        transactions.reserve(table->num_rows());

        for (int64_t i = 0; i < table->num_rows(); ++i) {
            auto id = extract_int64(id_array, i);
            auto ts = extract_timestamp(time_array, i);
            auto type_text = extract_string(type_array, i);
            auto ticker = extract_string(ticker_array, i);
            auto currency = extract_string(currency_array, i);
            auto shares = extract_decimal(shares_array, i);
            auto price = extract_decimal(price_array, i);

            if (id.is_error() || ts.is_error() || type_text.is_error() || ticker.is_error() ||
                currency.is_error() || shares.is_error() || price.is_error()) {
                return make_error<std::vector<Transaction>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Error extracting transaction values at row " + std::to_string(i),
                    "DataConversionUtils");
            }

            auto type = transaction_type_from_string(type_text.value());
            if (!type) {
                return make_error<std::vector<Transaction>>(
                    ErrorCode::INVALID_DATA,
                    "Unknown transaction type '" + type_text.value() + "' at row " +
                        std::to_string(i),
                    "DataConversionUtils");
            }

            Transaction txn(id.value(), ticker.value(), *type, shares.value(), price.value(),
                            currency.value(), ts.value());
            if (note_array) {
                txn.note = extract_optional_string(note_array, i);
            }
            transactions.push_back(std::move(txn));
        }

        return Result<std::vector<Transaction>>(std::move(transactions));

    } catch (const std::exception& e) {
        return make_error<std::vector<Transaction>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to transactions: ") + e.what(),
            "DataConversionUtils");
    }
}

Result<std::vector<PriceObservation>> DataConversionUtils::arrow_table_to_prices(
    const std::shared_ptr<arrow::Table>& table) {
    auto columns =
        require_columns(table, {"ticker", "date", "open", "high", "low", "close", "currency"});
    if (columns.is_error()) {
        return forward_error<std::vector<PriceObservation>>(columns);
    }

    try {
        auto ticker_array = column(table, "ticker");
        auto date_array = column(table, "date");
        auto open_array = column(table, "open");
        auto high_array = column(table, "high");
        auto low_array = column(table, "low");
        auto close_array = column(table, "close");
        auto currency_array = column(table, "currency");

        std::vector<PriceObservation> prices;
        prices.reserve(table->num_rows());

        for (int64_t i = 0; i < table->num_rows(); ++i) {
            auto ticker = extract_string(ticker_array, i);
            auto date = extract_date(date_array, i);
            auto currency = extract_string(currency_array, i);
            auto open = extract_decimal(open_array, i);
            auto high = extract_decimal(high_array, i);
            auto low = extract_decimal(low_array, i);
            auto close = extract_decimal(close_array, i);

            if (ticker.is_error() || date.is_error() || currency.is_error() || open.is_error() ||
                high.is_error() || low.is_error() || close.is_error()) {
                return make_error<std::vector<PriceObservation>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Error extracting OHLC values at row " + std::to_string(i),
                    "DataConversionUtils");
            }

            prices.emplace_back(ticker.value(), date.value(), open.value(), high.value(),
                                low.value(), close.value(), currency.value());
        }

        return Result<std::vector<PriceObservation>>(std::move(prices));

    } catch (const std::exception& e) {
        return make_error<std::vector<PriceObservation>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to prices: ") + e.what(), "DataConversionUtils");
    }
}

Result<std::vector<FxRate>> DataConversionUtils::arrow_table_to_fx_rates(
    const std::shared_ptr<arrow::Table>& table) {
    auto columns = require_columns(table, {"fx_ticker", "date", "rate"});
    if (columns.is_error()) {
        return forward_error<std::vector<FxRate>>(columns);
    }

    try {
        auto symbol_array = column(table, "fx_ticker");
        auto date_array = column(table, "date");
        auto rate_array = column(table, "rate");

        std::vector<FxRate> rates;
        rates.reserve(table->num_rows());

        for (int64_t i = 0; i < table->num_rows(); ++i) {
            auto symbol = extract_string(symbol_array, i);
            auto date = extract_date(date_array, i);
            auto rate = extract_decimal(rate_array, i);
            if (symbol.is_error() || date.is_error() || rate.is_error()) {
                return make_error<std::vector<FxRate>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Error extracting FX values at row " + std::to_string(i),
                    "DataConversionUtils");
            }

            auto pair = parse_fx_ticker(symbol.value());
            if (pair.is_error()) {
                return forward_error<std::vector<FxRate>>(pair);
            }

            rates.emplace_back(pair.value().base, pair.value().quote, date.value(),
                               rate.value());
        }

        return Result<std::vector<FxRate>>(std::move(rates));

    } catch (const std::exception& e) {
        return make_error<std::vector<FxRate>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to FX rates: ") + e.what(),
            "DataConversionUtils");
    }
}

Result<CurrencyPair> DataConversionUtils::parse_fx_ticker(const std::string& symbol) {
    // FROMTO=X quotes how many TO one FROM buys
    if (symbol.size() != 8 || symbol.compare(6, 2, "=X") != 0) {
        return make_error<CurrencyPair>(ErrorCode::INVALID_DATA,
                                        "Not an FX ticker: " + symbol, "DataConversionUtils");
    }
    std::string from = symbol.substr(0, 3);
    std::string to = symbol.substr(3, 3);
    if (!is_currency_code(from) || !is_currency_code(to) || from == to) {
        return make_error<CurrencyPair>(ErrorCode::INVALID_DATA,
                                        "Not an FX ticker: " + symbol, "DataConversionUtils");
    }
    return Result<CurrencyPair>(CurrencyPair(to, from));
}

std::string DataConversionUtils::fx_ticker(const std::string& from_currency,
                                           const std::string& to_currency) {
    return from_currency + to_currency + "=X";
}

Result<Timestamp> DataConversionUtils::extract_timestamp(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     "DataConversionUtils");
    }
    if (array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null timestamp value at index " + std::to_string(index),
                                     "DataConversionUtils");
    }

    try {
        if (array->type_id() == arrow::Type::TIMESTAMP) {
            auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
            auto unit = std::static_pointer_cast<arrow::TimestampType>(array->type())->unit();
            int64_t raw = ts_array->Value(index);
            Timestamp::duration since_epoch;
            switch (unit) {
                case arrow::TimeUnit::SECOND:
                    since_epoch = std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::seconds(raw));
                    break;
                case arrow::TimeUnit::MILLI:
                    since_epoch = std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::milliseconds(raw));
                    break;
                case arrow::TimeUnit::MICRO:
                    since_epoch = std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::microseconds(raw));
                    break;
                default:
                    since_epoch = std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::nanoseconds(raw));
                    break;
            }
            return Result<Timestamp>(Timestamp(since_epoch));
        }
        if (array->type_id() == arrow::Type::STRING) {
            auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
            return Result<Timestamp>(core::parse_timestamp(string_array->GetString(index)));
        }
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Unsupported timestamp column type " +
                                         array->type()->ToString(),
                                     "DataConversionUtils");
    } catch (const std::exception& e) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     std::string("Error extracting timestamp: ") + e.what(),
                                     "DataConversionUtils");
    }
}

Result<Date> DataConversionUtils::extract_date(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Date>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                "DataConversionUtils");
    }
    if (array->IsNull(index)) {
        return make_error<Date>(ErrorCode::INVALID_DATA,
                                "Null date value at index " + std::to_string(index),
                                "DataConversionUtils");
    }

    try {
        if (array->type_id() == arrow::Type::DATE32) {
            auto date_array = std::static_pointer_cast<arrow::Date32Array>(array);
            return Result<Date>(Date::from_days(date_array->Value(index)));
        }
        if (array->type_id() == arrow::Type::STRING) {
            auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
            return Result<Date>(Date::from_string(string_array->GetString(index)));
        }
        return make_error<Date>(ErrorCode::CONVERSION_ERROR,
                                "Unsupported date column type " + array->type()->ToString(),
                                "DataConversionUtils");
    } catch (const std::exception& e) {
        return make_error<Date>(ErrorCode::CONVERSION_ERROR,
                                std::string("Error extracting date: ") + e.what(),
                                "DataConversionUtils");
    }
}

Result<Decimal> DataConversionUtils::extract_decimal(const std::shared_ptr<arrow::Array>& array,
                                                     int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Decimal>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                   "DataConversionUtils");
    }
    if (array->IsNull(index)) {
        return make_error<Decimal>(ErrorCode::INVALID_DATA,
                                   "Null numeric value at index " + std::to_string(index),
                                   "DataConversionUtils");
    }

    try {
        if (array->type_id() == arrow::Type::STRING) {
            auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
            return Result<Decimal>(Decimal::from_string(string_array->GetString(index)));
        }
        if (array->type_id() == arrow::Type::DOUBLE) {
            auto double_array = std::static_pointer_cast<arrow::DoubleArray>(array);
            return Result<Decimal>(Decimal(double_array->Value(index)));
        }
        if (array->type_id() == arrow::Type::INT64) {
            auto int_array = std::static_pointer_cast<arrow::Int64Array>(array);
            return Result<Decimal>(Decimal::from_string(std::to_string(int_array->Value(index))));
        }
        return make_error<Decimal>(ErrorCode::CONVERSION_ERROR,
                                   "Unsupported numeric column type " + array->type()->ToString(),
                                   "DataConversionUtils");
    } catch (const std::exception& e) {
        return make_error<Decimal>(ErrorCode::CONVERSION_ERROR,
                                   std::string("Error extracting numeric value: ") + e.what(),
                                   "DataConversionUtils");
    }
}

Result<int64_t> DataConversionUtils::extract_int64(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<int64_t>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                   "DataConversionUtils");
    }
    if (array->IsNull(index)) {
        return make_error<int64_t>(ErrorCode::INVALID_DATA,
                                   "Null integer value at index " + std::to_string(index),
                                   "DataConversionUtils");
    }

    try {
        if (array->type_id() == arrow::Type::INT64) {
            auto int_array = std::static_pointer_cast<arrow::Int64Array>(array);
            return Result<int64_t>(int_array->Value(index));
        }
        if (array->type_id() == arrow::Type::STRING) {
            auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
            return Result<int64_t>(std::stoll(string_array->GetString(index)));
        }
        return make_error<int64_t>(ErrorCode::CONVERSION_ERROR,
                                   "Unsupported integer column type " + array->type()->ToString(),
                                   "DataConversionUtils");
    } catch (const std::exception& e) {
        return make_error<int64_t>(ErrorCode::CONVERSION_ERROR,
                                   std::string("Error extracting integer: ") + e.what(),
                                   "DataConversionUtils");
    }
}

Result<std::string> DataConversionUtils::extract_string(const std::shared_ptr<arrow::Array>& array,
                                                        int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       "DataConversionUtils");
    }

    try {
        if (array->type_id() != arrow::Type::STRING) {
            return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                           "Failed to cast to string array",
                                           "DataConversionUtils");
        }
        auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
        if (string_array->IsNull(index)) {
            return make_error<std::string>(ErrorCode::INVALID_DATA,
                                           "Null string value at index " + std::to_string(index),
                                           "DataConversionUtils");
        }
        return Result<std::string>(string_array->GetString(index));

    } catch (const std::exception& e) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       std::string("Error extracting string: ") + e.what(),
                                       "DataConversionUtils");
    }
}

std::optional<std::string> DataConversionUtils::extract_optional_string(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array || index < 0 || index >= array->length() || array->IsNull(index) ||
        array->type_id() != arrow::Type::STRING) {
        return std::nullopt;
    }
    return std::static_pointer_cast<arrow::StringArray>(array)->GetString(index);
}

}  // namespace folio_ngin
