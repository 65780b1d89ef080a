/**
 * @file Standard.hpp
 * @brief Field schema ("standard") that ODS records are shaped and validated by.
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "domain/OdsRecord.hpp"

namespace odsmanager::domain {

/**
 * @enum FieldType
 * @brief Declared value type of a schema field.
 */
enum class FieldType {
    Text,
    Float,
    Integer,
    Boolean,
    Time ///< Normalized to an Instant on insertion.
};

inline std::string FieldTypeToString(FieldType type) {
    switch (type) {
        case FieldType::Text: return "text";
        case FieldType::Float: return "float";
        case FieldType::Integer: return "integer";
        case FieldType::Boolean: return "bool";
        case FieldType::Time: return "time";
        default: return "unknown";
    }
}

inline std::optional<FieldType> FieldTypeFromString(const std::string& name) {
    if (name == "text" || name == "str" || name == "string") return FieldType::Text;
    if (name == "float" || name == "double") return FieldType::Float;
    if (name == "integer" || name == "int") return FieldType::Integer;
    if (name == "bool" || name == "boolean") return FieldType::Boolean;
    if (name == "time") return FieldType::Time;
    return std::nullopt;
}

/**
 * @struct FieldSpec
 * @brief One schema field.
 */
struct FieldSpec {
    std::string name;
    FieldType type = FieldType::Text;
    bool required = true;
};

/**
 * @struct ValidationResult
 * @brief Outcome of the record validity predicate.
 */
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> reasons; ///< Human-readable failures, empty when valid.
};

/**
 * @class Standard
 * @brief Immutable schema: field list, time fields, field roles, sort order and validity.
 *
 * Instances share one Standard through a shared pointer to const.
 */
class Standard {
public:
    /**
     * @struct Roles
     * @brief Names of the fields that carry a specific meaning for the engine.
     */
    struct Roles {
        std::string start = "src_start_utc";
        std::string stop = "src_end_utc";
        std::string source = "src_id";
        std::string siteLat = "site_lat_deg";
        std::string siteLon = "site_lon_deg";
        std::string siteElevation = "site_el_m";
        std::string ra = "src_ra_j2000_deg";
        std::string dec = "src_dec_j2000_deg";
    };

    /**
     * @throws std::invalid_argument if start/stop are not time fields or a sort field is unknown.
     *         Site and pointing roles may name fields the schema lacks.
     */
    Standard(std::string version,
             std::string dataKey,
             std::vector<FieldSpec> fields,
             Roles roles,
             std::vector<std::string> sortOrderTime);

    /** @brief The current ODS field set. */
    static Standard Latest();

    const std::string& version() const { return m_version; }

    /** @brief Key of the record array in the persisted document. */
    const std::string& dataKey() const { return m_dataKey; }

    const std::vector<FieldSpec>& fieldSpecs() const { return m_fields; }
    const std::vector<std::string>& fieldNames() const { return m_fieldNames; }
    bool isField(const std::string& name) const { return m_types.count(name) > 0; }
    bool isTimeField(const std::string& name) const;
    std::optional<FieldType> typeOf(const std::string& name) const;

    const Roles& roles() const { return m_roles; }
    const std::string& start() const { return m_roles.start; }
    const std::string& stop() const { return m_roles.stop; }
    const std::string& source() const { return m_roles.source; }

    /** @brief Canonical sort key; also the duplicate-equivalence key. */
    const std::vector<std::string>& sortOrderTime() const { return m_sortOrderTime; }

    /** @brief The record validity predicate. */
    ValidationResult validate(const OdsRecord& record) const;

private:
    std::string m_version;
    std::string m_dataKey;
    std::vector<FieldSpec> m_fields;
    std::vector<std::string> m_fieldNames;
    std::map<std::string, FieldType> m_types;
    std::set<std::string> m_required;
    Roles m_roles;
    std::vector<std::string> m_sortOrderTime;
};

} // namespace odsmanager::domain
