/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <fstream>
#include <iostream>

#include "infrastructure/OdsJsonCodec.hpp"
#include "infrastructure/PathUtils.hpp"

namespace odsmanager::infrastructure {

using json = nlohmann::json;

namespace {

std::optional<json> ReadJsonFile(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open " << path.string() << std::endl;
        return std::nullopt;
    }
    try {
        json j;
        f >> j;
        return j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path.string() << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace

Settings ConfigLoader::LoadSettings(const std::filesystem::path& path) {
    Settings settings;
    if (!std::filesystem::exists(path)) {
        return settings;
    }

    auto j = ReadJsonFile(path);
    if (!j || !j->is_object()) return settings;

    try {
        settings.workingInstance = j->value("working_instance", settings.workingInstance);
        settings.verbose = j->value("verbose", settings.verbose);
        if (j->contains("defaults")) settings.defaults = (*j)["defaults"];
        settings.standardFile = j->value("standard", settings.standardFile);
        settings.elevationLimitDeg = j->value("elevation_limit_deg", settings.elevationLimitDeg);
        settings.timeStepSec = j->value("time_step_sec", settings.timeStepSec);
        settings.onlineUrl = j->value("online_url", settings.onlineUrl);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return Settings{};
    }
    return settings;
}

std::optional<domain::FieldMap> ConfigLoader::ResolveDefaults(const json& reference) {
    if (reference.is_null()) return std::nullopt;
    if (reference.is_object()) return OdsJsonCodec::FieldMapFromJson(reference);
    if (!reference.is_string()) {
        std::cerr << "[ConfigLoader] Defaults must be an object or a file reference." << std::endl;
        return std::nullopt;
    }

    std::string text = reference.get<std::string>();
    std::string key;
    const auto colon = text.rfind(':');
    if (colon != std::string::npos && colon > text.rfind(".json")) {
        key = text.substr(colon + 1);
        text = text.substr(0, colon);
    }

    std::filesystem::path file = text;
    if (!text.empty() && text.front() == '$') {
        std::string name = text.substr(1);
        if (std::filesystem::path(name).extension() != ".json") name += ".json";
        file = PathUtils::GetDefaultsDir() / name;
    } else if (file.extension() != ".json") {
        std::cerr << "[ConfigLoader] Not a valid defaults reference: " << text << std::endl;
        return std::nullopt;
    }

    auto j = ReadJsonFile(file);
    if (!j) return std::nullopt;
    if (!key.empty()) {
        if (!j->is_object() || !j->contains(key)) {
            std::cerr << "[ConfigLoader] " << file.string() << " has no key '" << key << "'." << std::endl;
            return std::nullopt;
        }
        return OdsJsonCodec::FieldMapFromJson((*j)[key]);
    }
    return OdsJsonCodec::FieldMapFromJson(*j);
}

std::shared_ptr<const domain::Standard> ConfigLoader::LoadStandard(const std::string& path) {
    if (path.empty()) {
        return std::make_shared<const domain::Standard>(domain::Standard::Latest());
    }

    auto j = ReadJsonFile(path);
    if (!j) return nullptr;

    try {
        std::vector<domain::FieldSpec> fields;
        for (const auto& entry : j->at("fields")) {
            auto type = domain::FieldTypeFromString(entry.at("type").get<std::string>());
            if (!type) {
                std::cerr << "[ConfigLoader] Unknown field type in " << path << ": " << entry.at("type").dump() << std::endl;
                return nullptr;
            }
            fields.push_back({entry.at("name").get<std::string>(), *type, entry.value("required", true)});
        }

        domain::Standard::Roles roles;
        if (j->contains("roles")) {
            const json& r = (*j)["roles"];
            roles.start = r.value("start", roles.start);
            roles.stop = r.value("stop", roles.stop);
            roles.source = r.value("source", roles.source);
            roles.siteLat = r.value("site_lat", roles.siteLat);
            roles.siteLon = r.value("site_lon", roles.siteLon);
            roles.siteElevation = r.value("site_elevation", roles.siteElevation);
            roles.ra = r.value("ra", roles.ra);
            roles.dec = r.value("dec", roles.dec);
        }

        std::vector<std::string> sortOrder = j->value("sort_order_time", std::vector<std::string>{roles.start, roles.stop, roles.source});

        return std::make_shared<const domain::Standard>(j->value("version", std::string("custom")),
                                                        j->value("data_key", std::string("ods_data")),
                                                        std::move(fields),
                                                        std::move(roles),
                                                        std::move(sortOrder));
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Invalid standard " << path << ": " << e.what() << std::endl;
    }
    return nullptr;
}

} // namespace odsmanager::infrastructure
