/**
 * @file FieldValue.cpp
 * @brief Conversions for FieldValue.
 */

#include "domain/FieldValue.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace odsmanager::domain {

std::string ToString(const FieldValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return {};
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream ss;
            ss << std::setprecision(15) << v;
            return ss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return TimeTools::FormatIso(v);
        }
    }, value);
}

std::string ToKeyString(const FieldValue& value) {
    if (const auto* t = std::get_if<Instant>(&value)) return TimeTools::FormatIsoMicros(*t);
    return ToString(value);
}

std::optional<double> ToNumber(const FieldValue& value) {
    if (const auto* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d)) return *d;
        return std::nullopt;
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) return static_cast<double>(*i);
    if (const auto* s = std::get_if<std::string>(&value)) {
        try {
            std::size_t used = 0;
            const double parsed = std::stod(*s, &used);
            // stod accepts "nan" and "inf"
            if (used == s->size() && std::isfinite(parsed)) return parsed;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<Instant> ToInstant(const FieldValue& value) {
    if (const auto* t = std::get_if<Instant>(&value)) return *t;
    return std::nullopt;
}

std::string TypeName(const FieldValue& value) {
    switch (value.index()) {
        case 0: return "absent";
        case 1: return "bool";
        case 2: return "integer";
        case 3: return "float";
        case 4: return "text";
        case 5: return "time";
        default: return "unknown";
    }
}

} // namespace odsmanager::domain
