/**
 * @file OdsFileRepository.cpp
 * @brief Implementation of OdsFileRepository.
 */

#include "infrastructure/OdsFileRepository.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "infrastructure/OdsJsonCodec.hpp"
#include "infrastructure/TabularFile.hpp"

namespace odsmanager::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string ExportSeparator(const std::string& separator) {
    if (separator.empty() || separator == "auto") return ",";
    if (separator == "whitespace") return " ";
    return separator;
}

} // namespace

OdsFileRepository::OdsFileRepository(std::string dataKey)
    : m_dataKey(std::move(dataKey)) {}

bool OdsFileRepository::IsUrl(const std::string& location) {
    return location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0;
}

std::optional<std::string> OdsFileRepository::FetchUrl(const std::string& url) {
    const auto schemeEnd = url.find("://");
    const auto pathStart = url.find('/', schemeEnd + 3);
    const std::string host = url.substr(0, pathStart);
    const std::string path = pathStart == std::string::npos ? "/" : url.substr(pathStart);

    httplib::Client cli(host);
    if (!cli.is_valid()) {
        std::cerr << "[OdsFileRepository] Unsupported URL (no TLS support?): " << url << std::endl;
        return std::nullopt;
    }
    cli.set_connection_timeout(10);
    cli.set_read_timeout(60);
    cli.set_follow_location(true);

    auto res = cli.Get(path);
    if (res && res->status == 200) {
        return res->body;
    }
    if (res) {
        std::cerr << "[OdsFileRepository] HTTP Error " << res->status << " for " << url << std::endl;
    } else {
        std::cerr << "[OdsFileRepository] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return std::nullopt;
}

std::optional<std::vector<domain::FieldMap>> OdsFileRepository::loadJsonText(const std::string& text, const std::string& origin) const {
    try {
        return OdsJsonCodec::RecordsFromJson(json::parse(text), m_dataKey);
    } catch (const std::exception& e) {
        std::cerr << "[OdsFileRepository] JSON Parse Error in " << origin << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<std::vector<domain::FieldMap>> OdsFileRepository::load(const domain::FileReference& source) {
    if (IsUrl(source.location)) {
        auto body = FetchUrl(source.location);
        if (!body) return std::nullopt;
        return loadJsonText(*body, source.location);
    }

    if (!exists(source.location)) {
        std::cerr << "[OdsFileRepository] File not found: " << source.location << std::endl;
        return std::nullopt;
    }

    if (fs::path(source.location).extension() == ".json") {
        std::ifstream f(source.location);
        if (!f.is_open()) {
            std::cerr << "[OdsFileRepository] Cannot open " << source.location << std::endl;
            return std::nullopt;
        }
        std::stringstream buffer;
        buffer << f.rdbuf();
        return loadJsonText(buffer.str(), source.location);
    }

    return TabularFile::Read(source.location, source.tabular);
}

bool OdsFileRepository::exists(const std::string& location) const {
    if (IsUrl(location)) return false;
    std::error_code ec;
    return fs::is_regular_file(location, ec);
}

bool OdsFileRepository::save(const std::string& filename, const domain::OdsInstance& instance) {
    std::string content;
    try {
        content = OdsJsonCodec::InstanceToJson(instance).dump(4);
    } catch (const std::exception& e) {
        std::cerr << "[OdsFileRepository] Serialization failed for " << filename << ": " << e.what() << std::endl;
        return false;
    }
    return m_persistence.saveText(filename, content);
}

bool OdsFileRepository::exportTabular(const std::string& filename,
                                      const domain::OdsInstance& instance,
                                      const std::vector<std::string>& columns,
                                      const std::string& separator) {
    for (const auto& column : columns) {
        if (!instance.standard().isField(column)) {
            std::cerr << "[OdsFileRepository] " << column << " is not a valid ODS field; nothing written to " << filename << std::endl;
            return false;
        }
    }
    return m_persistence.saveText(filename, TabularFile::Format(instance, columns, ExportSeparator(separator)));
}

} // namespace odsmanager::infrastructure
