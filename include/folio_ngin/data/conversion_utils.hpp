// include/folio_ngin/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "folio_ngin/core/error.hpp"
#include "folio_ngin/core/types.hpp"

namespace folio_ngin {

/**
 * @brief Converts query result tables into engine value types
 *
 * Columns may arrive typed (int64, timestamp, date32, float64) or as utf8
 * text, which is how numeric columns are read to keep full precision.
 */
class DataConversionUtils {
public:
    /**
     * @brief Convert a transactions table
     * Columns: id, time, type, ticker, currency, shares, price, note (nullable)
     * @return Transactions in table order
     */
    static Result<std::vector<Transaction>> arrow_table_to_transactions(
        const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Convert a prices table
     * Columns: ticker, date, open, high, low, close, currency
     */
    static Result<std::vector<PriceObservation>> arrow_table_to_prices(
        const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Convert an FX table
     * Columns: fx_ticker ("EURUSD=X"), date, rate
     */
    static Result<std::vector<FxRate>> arrow_table_to_fx_rates(
        const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Parse an FX symbol such as "EURUSD=X"
     * @return Pair whose rate converts EUR into USD (base USD, quote EUR)
     */
    static Result<CurrencyPair> parse_fx_ticker(const std::string& symbol);

    /**
     * @brief FX symbol for converting from_currency into to_currency
     */
    static std::string fx_ticker(const std::string& from_currency, const std::string& to_currency);

private:
    static Result<void> require_columns(const std::shared_ptr<arrow::Table>& table,
                                        const std::vector<std::string>& columns);

    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    static Result<Date> extract_date(const std::shared_ptr<arrow::Array>& array, int64_t index);

    static Result<Decimal> extract_decimal(const std::shared_ptr<arrow::Array>& array,
                                           int64_t index);

    static Result<int64_t> extract_int64(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);

    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);

    static std::optional<std::string> extract_optional_string(
        const std::shared_ptr<arrow::Array>& array, int64_t index);
};

}  // namespace folio_ngin
