/**
 * @file OdsRepository.hpp
 * @brief Interface for loading and persisting ODS records.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/OdsInstance.hpp"
#include "domain/RecordInput.hpp"

namespace odsmanager::domain {

/**
 * @class OdsRepository
 * @brief Abstract I/O collaborator of the engine.
 */
class OdsRepository {
public:
    virtual ~OdsRepository() = default;

    /**
     * @brief Loads raw records from a persisted file, URL or tabular file.
     * @return Raw (not yet normalized) records, or nullopt if the source could not be read.
     */
    virtual std::optional<std::vector<FieldMap>> load(const FileReference& source) = 0;

    /** @brief True if a local file exists at location. URLs are never local. */
    virtual bool exists(const std::string& location) const = 0;

    /**
     * @brief Overwrites filename with the instance in persisted form.
     * @return True on success.
     */
    virtual bool save(const std::string& filename, const OdsInstance& instance) = 0;

    /**
     * @brief Writes the instance as delimited text with the given column order.
     * @return False if a column is not a schema field or the write fails.
     */
    virtual bool exportTabular(const std::string& filename,
                               const OdsInstance& instance,
                               const std::vector<std::string>& columns,
                               const std::string& separator) = 0;
};

} // namespace odsmanager::domain
