/**
 * @file OdsFileRepository.hpp
 * @brief Filesystem and HTTP implementation of OdsRepository.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "domain/OdsRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace odsmanager::infrastructure {

/**
 * @class OdsFileRepository
 * @brief Reads ODS JSON files, http(s) URLs and tabular files; writes atomically.
 *
 * The source kind is picked from the location: a URL scheme, then a ".json" extension,
 * else delimited text.
 */
class OdsFileRepository : public domain::OdsRepository {
public:
    /** @param dataKey Key of the record list in JSON documents. */
    explicit OdsFileRepository(std::string dataKey);

    std::optional<std::vector<domain::FieldMap>> load(const domain::FileReference& source) override;
    bool exists(const std::string& location) const override;
    bool save(const std::string& filename, const domain::OdsInstance& instance) override;
    bool exportTabular(const std::string& filename,
                       const domain::OdsInstance& instance,
                       const std::vector<std::string>& columns,
                       const std::string& separator) override;

    static bool IsUrl(const std::string& location);

    /** @brief Body of a GET on url, or nullopt after logging the failure. */
    static std::optional<std::string> FetchUrl(const std::string& url);

private:
    std::optional<std::vector<domain::FieldMap>> loadJsonText(const std::string& text, const std::string& origin) const;

    std::string m_dataKey;
    PersistenceService m_persistence;
};

} // namespace odsmanager::infrastructure
