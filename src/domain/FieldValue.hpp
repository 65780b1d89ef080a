/**
 * @file FieldValue.hpp
 * @brief Heterogeneous value held by one ODS field.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "domain/TimeTools.hpp"

namespace odsmanager::domain {

/**
 * @brief Value of a single record field.
 *
 * std::monostate is the explicit "absent" marker: a field without a value is still a key.
 */
using FieldValue = std::variant<std::monostate, bool, std::int64_t, double, std::string, Instant>;

/** @brief Field name -> value mapping, used for raw input and for defaults. */
using FieldMap = std::map<std::string, FieldValue>;

inline bool IsAbsent(const FieldValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

/** @brief Display and export text. Absent is "", instants are ISO-8601 with seconds. */
std::string ToString(const FieldValue& value);

/**
 * @brief Text form used for sort keys and record equality.
 *
 * Same as ToString except that instants keep their microseconds, so records a fraction
 * of a second apart stay distinct.
 */
std::string ToKeyString(const FieldValue& value);

/** @brief Numeric view of numbers and numeric text. Non-finite values are not numbers. */
std::optional<double> ToNumber(const FieldValue& value);

/** @brief The instant held by the value, if it holds one. */
std::optional<Instant> ToInstant(const FieldValue& value);

/** @brief Short type label for diagnostics ("absent", "bool", "integer", ...). */
std::string TypeName(const FieldValue& value);

} // namespace odsmanager::domain
