/**
 * @file RecordNormalizer.hpp
 * @brief Shapes heterogeneous input into complete, schema-shaped ODS records.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/OdsRecord.hpp"
#include "domain/RecordInput.hpp"
#include "domain/Standard.hpp"

namespace odsmanager::domain {

/**
 * @struct FieldCoercion
 * @brief A single field value after coercion to its schema type.
 */
struct FieldCoercion {
    FieldValue value;
    std::optional<std::string> failedText; ///< Set when a time value could not be interpreted.
};

/**
 * @class RecordNormalizer
 * @brief Pure functions producing records that hold every schema field.
 *
 * For each schema field the value comes from the input if the key is present, else from
 * defaults, else it is absent. Time fields are interpreted into instants; text arriving for
 * numeric or boolean fields is converted when it parses. Input keys that are not schema
 * fields are dropped and listed in OdsRecord::droppedKeys.
 */
class RecordNormalizer {
public:
    static OdsRecord Normalize(const FieldMap& input, const FieldMap& defaults, const Standard& standard);

    static OdsRecord Normalize(const AttributeBag& input, const FieldMap& defaults, const Standard& standard);

    /** @brief Re-normalizes an existing record (e.g. one copied from another instance). */
    static OdsRecord Normalize(const OdsRecord& input, const FieldMap& defaults, const Standard& standard);

    /** @brief Coerces one value to the schema type of field. */
    static FieldCoercion NormalizeField(const std::string& field, const FieldValue& value, const Standard& standard);
};

} // namespace odsmanager::domain
