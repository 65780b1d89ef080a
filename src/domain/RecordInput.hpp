/**
 * @file RecordInput.hpp
 * @brief Input shapes accepted when adding records, and entry update commands.
 */

#pragma once

#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "domain/FieldValue.hpp"

namespace odsmanager::domain {

/** @brief Several raw records ingested as one batch. */
struct RecordList {
    std::vector<FieldMap> records;
};

/**
 * @struct TabularOptions
 * @brief How to read a delimited text source.
 */
struct TabularOptions {
    std::string separator = "auto";               ///< "auto", "whitespace" or a literal separator.
    std::string replaceFrom;                      ///< Header substring to replace; empty for none.
    std::string replaceTo;                        ///< Replacement for replaceFrom ("" removes it).
    std::map<std::string, std::string> headerMap; ///< Data-file header -> field name.
    std::string headerMapFile;                    ///< JSON file with more headerMap entries.
};

/**
 * @struct FileReference
 * @brief A persisted ODS file, an http(s) URL, or a tabular file.
 */
struct FileReference {
    std::string location;
    TabularOptions tabular;
};

/** @brief Key/value text pairs taken from an arbitrary object (e.g. a CLI namespace). */
struct AttributeBag {
    std::vector<std::pair<std::string, std::string>> attributes;
};

/** @brief Tagged input built by the outer layers; the core never inspects types at runtime. */
using RecordInput = std::variant<FieldMap, RecordList, FileReference, AttributeBag>;

/** @brief Sentinel for removing an entry through updateAt. */
struct DeleteEntry {};

/** @brief Patch of field values, or deletion of the entry. */
using EntryUpdate = std::variant<FieldMap, DeleteEntry>;

} // namespace odsmanager::domain
