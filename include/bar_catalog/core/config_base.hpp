//===== config_base.hpp =====
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "bar_catalog/core/error.hpp"

namespace bar_catalog {

/**
 * @brief Base class for JSON-backed configuration types
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write the configuration as indented JSON
     * The file is staged next to the target and renamed over it.
     * @param filepath Destination path
     * @return FILE_IO_ERROR if the file cannot be written or moved into place
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Overlay the keys found in a JSON file
     * Keys missing from the file keep their current values.
     * @return FILE_NOT_FOUND, or JSON_PARSE_ERROR for malformed JSON and
     *         values of the wrong type
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace bar_catalog
