/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading configuration (settings.json, defaults, standards).
 *
 * Keeps JSON parsing of user-editable files in one place instead of scattering it
 * through the engine and the CLI.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "domain/FieldValue.hpp"
#include "domain/Standard.hpp"

namespace odsmanager::infrastructure {

/**
 * @struct Settings
 * @brief Contents of settings.json. Missing keys keep these values.
 */
struct Settings {
    std::string workingInstance = "primary";
    bool verbose = false;
    nlohmann::json defaults;   ///< Inline object or a reference string (see ConfigLoader::ResolveDefaults).
    std::string standardFile;  ///< Empty for the built-in standard.
    double elevationLimitDeg = 10.0;
    double timeStepSec = 120.0;
    std::string onlineUrl = "https://www.seti.org/sites/default/files/HCRO/ods.json";
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from path.
     * @return Built-in settings when the file is missing or unreadable (the error is logged).
     */
    static Settings LoadSettings(const std::filesystem::path& path);

    /**
     * @brief Turns a defaults reference into a field map.
     *
     * Accepts an object of field values, "file.json", "file.json:key", or "$name" for
     * name.json in PathUtils::GetDefaultsDir().
     * @return std::nullopt for null or when the reference cannot be resolved.
     */
    static std::optional<domain::FieldMap> ResolveDefaults(const nlohmann::json& reference);

    /**
     * @brief Builds a Standard from a JSON description, or the built-in one when path is empty.
     * @return nullptr if the file cannot be read or describes an inconsistent schema.
     */
    static std::shared_ptr<const domain::Standard> LoadStandard(const std::string& path);
};

} // namespace odsmanager::infrastructure
