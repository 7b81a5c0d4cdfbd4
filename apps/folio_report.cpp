// apps/folio_report.cpp

#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "folio_ngin/core/date.hpp"
#include "folio_ngin/core/logger.hpp"
#include "folio_ngin/data/postgres_database.hpp"
#include "folio_ngin/service/app_config.hpp"
#include "folio_ngin/service/portfolio_service.hpp"
#include "folio_ngin/service/report_json.hpp"

using namespace folio_ngin;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [config.json] [start YYYY-MM-DD] [end YYYY-MM-DD]"
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc > 4) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        std::string config_path = argc > 1 ? argv[1] : "config.json";

        AppConfig config;
        auto loaded = config.load_from_file(config_path);
        if (loaded.is_error()) {
            if (loaded.error()->code() != ErrorCode::FILE_NOT_FOUND) {
                std::cerr << "Failed to load " << config_path << ": " << loaded.error()->what()
                          << std::endl;
                return 1;
            }
            std::cerr << "No config at " << config_path << ", using defaults" << std::endl;
        }
        config.database.apply_env_overrides();

        Logger::instance().initialize(config.logging);
        INFO("Reporting in " << config.engine.base_currency);

        Date end = argc > 3 ? Date::from_string(argv[3])
                            : Date::from_timestamp(std::chrono::system_clock::now());
        Date start = argc > 2 ? Date::from_string(argv[2]) : end - config.lookback_days;
        DateRange range(start, end);
        if (!range.is_valid()) {
            std::cerr << "Start date " << start << " is after end date " << end << std::endl;
            return 1;
        }

        auto db = std::make_shared<PostgresDatabase>(config.database.connection_string());
        auto connected = db->connect();
        if (connected.is_error()) {
            std::cerr << "Failed to connect to database: " << connected.error()->what()
                      << std::endl;
            return 1;
        }

        auto tickers = db->list_tickers();
        if (tickers.is_error()) {
            std::cerr << "Failed to list tickers: " << tickers.error()->what() << std::endl;
            return 1;
        }

        auto market_data = db->load_market_data(tickers.value(), end);
        if (market_data.is_error()) {
            std::cerr << "Failed to load market data: " << market_data.error()->what()
                      << std::endl;
            return 1;
        }

        PortfolioService service(config.engine, db, market_data.value(),
                                 config.cache_results ? db : nullptr);

        auto positions = service.get_positions(end);
        if (positions.is_error()) {
            std::cerr << "Failed to compute positions: " << positions.error()->what()
                      << std::endl;
            return 1;
        }

        auto history = service.get_history(range);
        if (history.is_error()) {
            std::cerr << "Failed to build history: " << history.error()->what() << std::endl;
            return 1;
        }

        auto performance = service.get_performance(end, config.lookback_days);
        if (performance.is_error()) {
            std::cerr << "Failed to compute performance: " << performance.error()->what()
                      << std::endl;
            return 1;
        }

        nlohmann::json report;
        report["base_currency"] = config.engine.base_currency;
        report["positions"] = positions.value();
        report["history"] = history.value();
        report["performance"] = performance.value();
        std::cout << report.dump(2) << std::endl;

        db->disconnect();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
