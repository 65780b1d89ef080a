/**
 * @file OdsJsonCodec.hpp
 * @brief Conversion between ODS records and their JSON document form.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "domain/OdsInstance.hpp"

namespace odsmanager::infrastructure {

/**
 * @class OdsJsonCodec
 * @brief Static helpers for the persisted format `{ <dataKey>: [ {field: value}, ... ] }`.
 */
class OdsJsonCodec {
public:
    /** @brief Absent becomes null; instants become "YYYY-MM-DDTHH:MM:SS". */
    static nlohmann::json ToJson(const domain::FieldValue& value);

    /** @brief Null is absent. Arrays and objects are kept as their dumped text. */
    static domain::FieldValue FromJson(const nlohmann::json& value);

    static nlohmann::json RecordToJson(const domain::OdsRecord& record, const domain::Standard& standard);

    /** @brief Whole document for an instance, schema fields only. */
    static nlohmann::json InstanceToJson(const domain::OdsInstance& instance);

    /**
     * @brief Raw records from a parsed document.
     *
     * Accepts an object holding dataKey or a bare array. Entries that are not objects are
     * skipped with a warning.
     * @return std::nullopt if the document has neither shape.
     */
    static std::optional<std::vector<domain::FieldMap>> RecordsFromJson(const nlohmann::json& doc, const std::string& dataKey);

    /** @brief Flat object -> FieldMap, used for defaults files and settings. */
    static domain::FieldMap FieldMapFromJson(const nlohmann::json& object);
};

} // namespace odsmanager::infrastructure
