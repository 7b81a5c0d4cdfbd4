// include/folio_ngin/data/database_config.hpp
#pragma once

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <string>
#include "folio_ngin/core/config_base.hpp"

namespace folio_ngin {

/**
 * @brief PostgreSQL connection settings
 */
struct DatabaseConfig : public ConfigBase {
    std::string host{"localhost"};
    int port{5432};
    std::string name{"portfolio"};
    std::string user{"postgres"};
    std::string password;
    int connect_timeout{10};  // seconds

    std::string version{"1.0.0"};

    /**
     * @brief libpq keyword/value connection string
     */
    std::string connection_string() const {
        std::string conn = "host=" + host + " port=" + std::to_string(port) + " dbname=" + name +
                           " user=" + user;
        if (!password.empty()) {
            conn += " password=" + password;
        }
        conn += " connect_timeout=" + std::to_string(connect_timeout);
        return conn;
    }

    /**
     * @brief Override fields from FOLIO_DB_HOST, FOLIO_DB_PORT, FOLIO_DB_NAME,
     * FOLIO_DB_USER and FOLIO_DB_PASSWORD when they are set
     */
    void apply_env_overrides() {
        if (const char* v = std::getenv("FOLIO_DB_HOST"))
            host = v;
        if (const char* v = std::getenv("FOLIO_DB_PORT"))
            port = std::atoi(v);
        if (const char* v = std::getenv("FOLIO_DB_NAME"))
            name = v;
        if (const char* v = std::getenv("FOLIO_DB_USER"))
            user = v;
        if (const char* v = std::getenv("FOLIO_DB_PASSWORD"))
            password = v;
    }

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["host"] = host;
        j["port"] = port;
        j["name"] = name;
        j["user"] = user;
        j["connect_timeout"] = connect_timeout;
        j["version"] = version;
        // Password is never written back to disk
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("host"))
            host = j.at("host").get<std::string>();
        if (j.contains("port"))
            port = j.at("port").get<int>();
        if (j.contains("name"))
            name = j.at("name").get<std::string>();
        if (j.contains("user"))
            user = j.at("user").get<std::string>();
        if (j.contains("password"))
            password = j.at("password").get<std::string>();
        if (j.contains("connect_timeout"))
            connect_timeout = j.at("connect_timeout").get<int>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

}  // namespace folio_ngin
