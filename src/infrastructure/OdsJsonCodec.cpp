/**
 * @file OdsJsonCodec.cpp
 * @brief Implementation of OdsJsonCodec.
 */

#include "infrastructure/OdsJsonCodec.hpp"
#include <cstdint>
#include <iostream>
#include <type_traits>
#include <variant>

namespace odsmanager::infrastructure {

using json = nlohmann::json;

json OdsJsonCodec::ToJson(const domain::FieldValue& value) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, domain::Instant>) {
            return domain::TimeTools::FormatIso(v);
        } else {
            return v;
        }
    }, value);
}

domain::FieldValue OdsJsonCodec::FromJson(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return std::monostate{};
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
            return value.get<std::int64_t>();
        case json::value_t::number_unsigned:
            return static_cast<std::int64_t>(value.get<std::uint64_t>());
        case json::value_t::number_float:
            return value.get<double>();
        case json::value_t::string:
            return value.get<std::string>();
        default:
            return value.dump();
    }
}

json OdsJsonCodec::RecordToJson(const domain::OdsRecord& record, const domain::Standard& standard) {
    json entry = json::object();
    for (const auto& field : standard.fieldNames()) {
        entry[field] = ToJson(record.get(field));
    }
    return entry;
}

json OdsJsonCodec::InstanceToJson(const domain::OdsInstance& instance) {
    const auto& standard = instance.standard();
    json records = json::array();
    for (const auto& record : instance.records()) {
        records.push_back(RecordToJson(record, standard));
    }
    json doc;
    doc[standard.dataKey()] = std::move(records);
    return doc;
}

std::optional<std::vector<domain::FieldMap>> OdsJsonCodec::RecordsFromJson(const json& doc, const std::string& dataKey) {
    const json* entries = nullptr;
    if (doc.is_array()) {
        entries = &doc;
    } else if (doc.is_object() && doc.contains(dataKey) && doc[dataKey].is_array()) {
        entries = &doc[dataKey];
    } else {
        std::cerr << "[OdsJsonCodec] Document has no '" << dataKey << "' record list." << std::endl;
        return std::nullopt;
    }

    std::vector<domain::FieldMap> records;
    records.reserve(entries->size());
    std::size_t position = 0;
    for (const auto& entry : *entries) {
        if (!entry.is_object()) {
            std::cerr << "[OdsJsonCodec] Skipping entry " << position << ": not an object." << std::endl;
        } else {
            records.push_back(FieldMapFromJson(entry));
        }
        ++position;
    }
    return records;
}

domain::FieldMap OdsJsonCodec::FieldMapFromJson(const json& object) {
    domain::FieldMap fields;
    if (!object.is_object()) return fields;
    for (auto it = object.begin(); it != object.end(); ++it) {
        fields[it.key()] = FromJson(it.value());
    }
    return fields;
}

} // namespace odsmanager::infrastructure
