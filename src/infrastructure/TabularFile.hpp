/**
 * @file TabularFile.hpp
 * @brief Delimited text import and export of ODS records.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/OdsInstance.hpp"
#include "domain/RecordInput.hpp"

namespace odsmanager::infrastructure {

/**
 * @class TabularFile
 * @brief Header-row text tables (CSV, TSV, whitespace aligned).
 */
class TabularFile {
public:
    /**
     * @brief Parses text into raw records keyed by (remapped) header names.
     *
     * Empty, "None" and "nan" cells are absent; every other cell stays text for the
     * normalizer to coerce.
     * @return std::nullopt if there is no header row or the header map file is unreadable.
     */
    static std::optional<std::vector<domain::FieldMap>> Parse(const std::string& text, const domain::TabularOptions& options);

    /** @brief Reads and parses path. */
    static std::optional<std::vector<domain::FieldMap>> Read(const std::string& path, const domain::TabularOptions& options);

    /**
     * @brief Renders an instance with a header row of columns.
     *
     * Cells containing the separator, a quote or a newline are double-quoted.
     */
    static std::string Format(const domain::OdsInstance& instance,
                              const std::vector<std::string>& columns,
                              const std::string& separator);

    /** @brief Picks "," or "\t" when the header line contains one, else "whitespace". */
    static std::string DetectSeparator(const std::string& headerLine);

    static std::vector<std::string> SplitLine(const std::string& line, const std::string& separator);
};

} // namespace odsmanager::infrastructure
