// include/folio_ngin/service/app_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include "folio_ngin/core/config_base.hpp"
#include "folio_ngin/core/logger.hpp"
#include "folio_ngin/data/database_config.hpp"
#include "folio_ngin/portfolio/engine_config.hpp"

namespace folio_ngin {

/**
 * @brief Top-level configuration file of the reporting application
 *
 * {"database": {...}, "engine": {...}, "logging": {...}, "lookback_days": 365}
 */
struct AppConfig : public ConfigBase {
    DatabaseConfig database;
    EngineConfig engine;
    LoggerConfig logging;
    int lookback_days{365};
    bool cache_results{true};  // Write computed positions and history back to the database

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["database"] = database.to_json();
        j["engine"] = engine.to_json();
        j["logging"] = logging.to_json();
        j["lookback_days"] = lookback_days;
        j["cache_results"] = cache_results;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("database"))
            database.from_json(j.at("database"));
        if (j.contains("engine"))
            engine.from_json(j.at("engine"));
        if (j.contains("logging"))
            logging.from_json(j.at("logging"));
        if (j.contains("lookback_days"))
            lookback_days = j.at("lookback_days").get<int>();
        if (j.contains("cache_results"))
            cache_results = j.at("cache_results").get<bool>();
    }
};

}  // namespace folio_ngin
