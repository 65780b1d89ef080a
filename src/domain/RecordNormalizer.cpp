/**
 * @file RecordNormalizer.cpp
 * @brief Implementation of RecordNormalizer.
 */

#include "domain/RecordNormalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace odsmanager::domain {

namespace {

std::string Lowered(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c){ return std::tolower(c); });
    return text;
}

std::optional<std::int64_t> ParseInteger(const std::string& text) {
    try {
        std::size_t used = 0;
        const long long value = std::stoll(text, &used);
        if (used == text.size()) return static_cast<std::int64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<bool> ParseBoolean(const std::string& text) {
    const std::string lowered = Lowered(text);
    if (lowered == "true" || lowered == "t" || lowered == "yes" || lowered == "1") return true;
    if (lowered == "false" || lowered == "f" || lowered == "no" || lowered == "0") return false;
    return std::nullopt;
}

FieldValue CoerceTyped(FieldType type, const FieldValue& value) {
    // Non-finite numbers have no total order; keep them as text so validation rejects them
    if (const auto* d = std::get_if<double>(&value)) {
        if (!std::isfinite(*d)) return ToString(value);
    }
    switch (type) {
        case FieldType::Float:
            if (const auto* i = std::get_if<std::int64_t>(&value)) return static_cast<double>(*i);
            if (const auto* s = std::get_if<std::string>(&value)) {
                if (auto number = ToNumber(*s)) return *number;
            }
            break;
        case FieldType::Integer:
            if (const auto* d = std::get_if<double>(&value)) {
                if (std::floor(*d) == *d) return static_cast<std::int64_t>(*d);
            }
            if (const auto* s = std::get_if<std::string>(&value)) {
                if (auto number = ParseInteger(*s)) return *number;
            }
            break;
        case FieldType::Boolean:
            if (const auto* i = std::get_if<std::int64_t>(&value)) {
                if (*i == 0 || *i == 1) return *i == 1;
            }
            if (const auto* s = std::get_if<std::string>(&value)) {
                if (auto flag = ParseBoolean(*s)) return *flag;
            }
            break;
        case FieldType::Text:
        case FieldType::Time:
            break;
    }
    return value;
}

template <typename Lookup>
OdsRecord Build(const Lookup& lookup, const FieldMap& defaults, const Standard& standard) {
    OdsRecord record;
    for (const auto& field : standard.fieldNames()) {
        FieldValue chosen;
        if (const FieldValue* fromInput = lookup(field)) {
            chosen = *fromInput;
        } else {
            auto def = defaults.find(field);
            if (def != defaults.end()) chosen = def->second;
        }
        FieldCoercion coerced = RecordNormalizer::NormalizeField(field, chosen, standard);
        if (coerced.failedText) {
            record.parseFailures[field] = *coerced.failedText;
        }
        record.fields[field] = std::move(coerced.value);
    }
    return record;
}

} // namespace

FieldCoercion RecordNormalizer::NormalizeField(const std::string& field, const FieldValue& value, const Standard& standard) {
    FieldCoercion result;
    auto type = standard.typeOf(field);
    if (!type || IsAbsent(value)) {
        result.value = value;
        return result;
    }

    if (*type != FieldType::Time) {
        result.value = CoerceTyped(*type, value);
        return result;
    }

    if (std::holds_alternative<Instant>(value)) {
        result.value = value;
    } else if (const auto* text = std::get_if<std::string>(&value)) {
        if (auto instant = TimeTools::InterpretDate(*text)) {
            result.value = *instant;
        } else {
            result.failedText = *text;
        }
    } else {
        result.failedText = ToString(value);
    }
    return result;
}

OdsRecord RecordNormalizer::Normalize(const FieldMap& input, const FieldMap& defaults, const Standard& standard) {
    OdsRecord record = Build([&input](const std::string& field) -> const FieldValue* {
        auto it = input.find(field);
        return it == input.end() ? nullptr : &it->second;
    }, defaults, standard);

    for (const auto& entry : input) {
        if (!standard.isField(entry.first)) record.droppedKeys.push_back(entry.first);
    }
    return record;
}

OdsRecord RecordNormalizer::Normalize(const AttributeBag& input, const FieldMap& defaults, const Standard& standard) {
    FieldMap asMap;
    for (const auto& [key, text] : input.attributes) {
        asMap[key] = text;
    }
    return Normalize(asMap, defaults, standard);
}

OdsRecord RecordNormalizer::Normalize(const OdsRecord& input, const FieldMap& defaults, const Standard& standard) {
    OdsRecord record = Normalize(input.fields, defaults, standard);
    for (const auto& key : input.droppedKeys) {
        if (std::find(record.droppedKeys.begin(), record.droppedKeys.end(), key) == record.droppedKeys.end()) {
            record.droppedKeys.push_back(key);
        }
    }
    for (const auto& [field, raw] : input.parseFailures) {
        if (standard.isField(field) && IsAbsent(record.get(field))) {
            record.parseFailures.emplace(field, raw);
        }
    }
    return record;
}

} // namespace odsmanager::domain
