/**
 * @file Standard.cpp
 * @brief Implementation of the ODS schema.
 */

#include "domain/Standard.hpp"

#include <stdexcept>

namespace odsmanager::domain {

Standard::Standard(std::string version,
                   std::string dataKey,
                   std::vector<FieldSpec> fields,
                   Roles roles,
                   std::vector<std::string> sortOrderTime)
    : m_version(std::move(version)),
      m_dataKey(std::move(dataKey)),
      m_fields(std::move(fields)),
      m_roles(std::move(roles)),
      m_sortOrderTime(std::move(sortOrderTime)) {
    for (const auto& field : m_fields) {
        if (!m_types.emplace(field.name, field.type).second) {
            throw std::invalid_argument("Duplicate field in standard: " + field.name);
        }
        m_fieldNames.push_back(field.name);
        if (field.required) m_required.insert(field.name);
    }
    if (!isTimeField(m_roles.start) || !isTimeField(m_roles.stop)) {
        throw std::invalid_argument("Standard start/stop roles must name time fields.");
    }
    if (!isField(m_roles.source)) {
        throw std::invalid_argument("Standard source role names unknown field: " + m_roles.source);
    }
    for (const auto& key : m_sortOrderTime) {
        if (!isField(key)) {
            throw std::invalid_argument("Sort field is not in the standard: " + key);
        }
    }
}

Standard Standard::Latest() {
    std::vector<FieldSpec> fields = {
        {"site_id", FieldType::Text},
        {"site_lat_deg", FieldType::Float},
        {"site_lon_deg", FieldType::Float},
        {"site_el_m", FieldType::Float},
        {"src_id", FieldType::Text},
        {"src_is_pulsar_bool", FieldType::Boolean},
        {"corr_integ_time_sec", FieldType::Float},
        {"src_ra_j2000_deg", FieldType::Float},
        {"src_dec_j2000_deg", FieldType::Float},
        {"src_radius", FieldType::Float},
        {"src_start_utc", FieldType::Time},
        {"src_end_utc", FieldType::Time},
        {"slew_sec", FieldType::Float},
        {"trk_rate_dec_deg_per_sec", FieldType::Float},
        {"trk_rate_ra_deg_per_sec", FieldType::Float},
        {"freq_lower_hz", FieldType::Float},
        {"freq_upper_hz", FieldType::Float},
        {"notes", FieldType::Text, false}
    };
    std::vector<std::string> sortOrder = {
        "src_start_utc", "src_end_utc", "src_id", "src_ra_j2000_deg", "src_dec_j2000_deg",
        "freq_lower_hz", "freq_upper_hz", "site_id"
    };
    return Standard("latest", "ods_data", std::move(fields), Roles{}, std::move(sortOrder));
}

bool Standard::isTimeField(const std::string& name) const {
    auto it = m_types.find(name);
    return it != m_types.end() && it->second == FieldType::Time;
}

std::optional<FieldType> Standard::typeOf(const std::string& name) const {
    auto it = m_types.find(name);
    if (it == m_types.end()) return std::nullopt;
    return it->second;
}

ValidationResult Standard::validate(const OdsRecord& record) const {
    ValidationResult result;
    auto fail = [&result](std::string reason) {
        result.valid = false;
        result.reasons.push_back(std::move(reason));
    };

    for (const auto& field : m_fields) {
        auto failure = record.parseFailures.find(field.name);
        if (failure != record.parseFailures.end()) {
            fail(field.name + ": cannot interpret '" + failure->second + "' as a time");
            continue;
        }
        if (!record.fields.count(field.name)) {
            fail(field.name + " is not a key");
            continue;
        }
        const FieldValue& value = record.get(field.name);
        if (IsAbsent(value)) {
            if (m_required.count(field.name)) fail(field.name + " is missing");
            continue;
        }

        bool typeOk = false;
        switch (field.type) {
            case FieldType::Text: typeOk = std::holds_alternative<std::string>(value); break;
            case FieldType::Float:
                typeOk = std::holds_alternative<double>(value) || std::holds_alternative<std::int64_t>(value);
                break;
            case FieldType::Integer: typeOk = std::holds_alternative<std::int64_t>(value); break;
            case FieldType::Boolean: typeOk = std::holds_alternative<bool>(value); break;
            case FieldType::Time: typeOk = std::holds_alternative<Instant>(value); break;
        }
        if (!typeOk) {
            fail(field.name + " should be " + FieldTypeToString(field.type) + ", got " + TypeName(value)
                 + " '" + ToString(value) + "'");
        }
    }

    auto start = record.instant(m_roles.start);
    auto stop = record.instant(m_roles.stop);
    if (start && stop && !(*start < *stop)) {
        fail(m_roles.stop + " is not after " + m_roles.start);
    }
    return result;
}

} // namespace odsmanager::domain
