// include/folio_ngin/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "folio_ngin/core/error.hpp"

namespace folio_ngin {

/**
 * @brief Base class for all configuration types
 * Provides common JSON file serialization and deserialization
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to the file
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Convert configuration to JSON
     */
    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON, keeping defaults for absent keys
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace folio_ngin
