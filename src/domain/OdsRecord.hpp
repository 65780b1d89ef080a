/**
 * @file OdsRecord.hpp
 * @brief Domain entity for one ODS schedule entry.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/FieldValue.hpp"

namespace odsmanager::domain {

/**
 * @class OdsRecord
 * @brief A normalized schedule entry: when and where an instrument observes a source.
 *
 * Inside an instance, fields holds every schema field (absent values included) and
 * time fields hold instants.
 */
class OdsRecord {
public:
    FieldMap fields;                                  ///< Schema field -> value.
    std::vector<std::string> droppedKeys;             ///< Input keys that were not schema fields.
    std::map<std::string, std::string> parseFailures; ///< Time field -> text that failed to parse.

    OdsRecord() = default;

    /** @brief Value of field, or the absent marker when the key is missing. */
    const FieldValue& get(const std::string& field) const {
        static const FieldValue kAbsent;
        auto it = fields.find(field);
        return it == fields.end() ? kAbsent : it->second;
    }

    std::optional<Instant> instant(const std::string& field) const {
        return ToInstant(get(field));
    }
};

} // namespace odsmanager::domain
