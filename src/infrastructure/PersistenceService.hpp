/**
 * @file PersistenceService.hpp
 * @brief Atomic whole-file writes for ODS documents and tabular logs.
 */

#pragma once
#include <string>

namespace odsmanager::infrastructure {

/**
 * @class PersistenceService
 * @brief Writes text through a temporary file that is renamed over the target.
 *
 * A reader of the target sees either the previous file or the complete new one.
 */
class PersistenceService {
public:
    /**
     * @brief Replaces filename with content.
     * @param filename Destination path; missing parent directories are created.
     * @param content The string content to write.
     * @return False (with the reason on stderr) if any step failed.
     */
    bool saveText(const std::string& filename, const std::string& content) const;
};

} // namespace odsmanager::infrastructure
