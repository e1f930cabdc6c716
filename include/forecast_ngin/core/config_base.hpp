// include/forecast_ngin/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "forecast_ngin/core/error.hpp"

namespace forecast_ngin {

/**
 * @brief Base class for all configuration types
 * Provides common serialization and deserialization methods
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to a JSON file
     * The document is written to a sibling temporary file and renamed into place,
     * so readers never observe a partially written configuration.
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from a JSON file
     * @param filepath Path to the file
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace forecast_ngin
