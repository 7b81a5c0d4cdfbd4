// include/folio_ngin/portfolio/engine_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "folio_ngin/core/config_base.hpp"

namespace folio_ngin {

/**
 * @brief Settings shared by the aggregation, valuation and history components
 */
struct EngineConfig : public ConfigBase {
    std::string base_currency{"USD"};  // Currency all totals are reported in
    bool allow_short_selling{false};   // SELL beyond held quantity opens a short
    bool allow_inverse_rates{true};    // Use 1/rate of the opposite pair when needed
    size_t valuation_threads{1};       // Worker tasks per history date, 1 = inline
    size_t parallel_threshold{8};      // Minimum held tickers before fanning out
    bool skip_leading_empty{false};    // Drop history dates before the first holding

    std::string version{"1.0.0"};

    EngineConfig() = default;
    explicit EngineConfig(std::string base) : base_currency(std::move(base)) {}

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["base_currency"] = base_currency;
        j["allow_short_selling"] = allow_short_selling;
        j["allow_inverse_rates"] = allow_inverse_rates;
        j["valuation_threads"] = valuation_threads;
        j["parallel_threshold"] = parallel_threshold;
        j["skip_leading_empty"] = skip_leading_empty;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("base_currency"))
            base_currency = j.at("base_currency").get<std::string>();
        if (j.contains("allow_short_selling"))
            allow_short_selling = j.at("allow_short_selling").get<bool>();
        if (j.contains("allow_inverse_rates"))
            allow_inverse_rates = j.at("allow_inverse_rates").get<bool>();
        if (j.contains("valuation_threads"))
            valuation_threads = j.at("valuation_threads").get<size_t>();
        if (j.contains("parallel_threshold"))
            parallel_threshold = j.at("parallel_threshold").get<size_t>();
        if (j.contains("skip_leading_empty"))
            skip_leading_empty = j.at("skip_leading_empty").get<bool>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

}  // namespace folio_ngin
