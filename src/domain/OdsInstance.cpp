/**
 * @file OdsInstance.cpp
 * @brief Implementation of OdsInstance.
 */

#include "domain/OdsInstance.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "domain/RecordNormalizer.hpp"

namespace odsmanager::domain {

namespace {

std::vector<std::string> SortKey(const OdsRecord& record, const std::vector<std::string>& fields) {
    std::vector<std::string> key;
    key.reserve(fields.size());
    for (const auto& field : fields) {
        key.push_back(ToKeyString(record.get(field)));
    }
    return key;
}

} // namespace

OdsInstance::OdsInstance(std::string name, std::shared_ptr<const Standard> standard)
    : m_name(std::move(name)), m_standard(std::move(standard)) {
    recomputeMetadata();
}

void OdsInstance::append(OdsRecord record) {
    m_records.push_back(std::move(record));
}

void OdsInstance::replaceRecords(std::vector<OdsRecord> records) {
    m_records = std::move(records);
    recomputeMetadata();
}

void OdsInstance::recomputeMetadata() {
    m_earliest = TimeTools::FarFuture();
    m_latest = TimeTools::FarPast();
    m_validIndices.clear();
    m_invalidReasons.clear();
    m_distinctValues.clear();
    m_distinctValues[kInvalidKey];

    const Standard& standard = *m_standard;
    for (std::size_t i = 0; i < m_records.size(); ++i) {
        const OdsRecord& record = m_records[i];
        for (const auto& [key, value] : record.fields) {
            if (!standard.isField(key)) {
                m_distinctValues[kInvalidKey].insert(FieldValue{key});
                continue;
            }
            m_distinctValues[key].insert(value);
            auto instant = ToInstant(value);
            if (!instant) continue;
            if (key == standard.start() && *instant < m_earliest) {
                m_earliest = *instant;
            } else if (key == standard.stop() && *instant > m_latest) {
                m_latest = *instant;
            }
        }
        for (const auto& key : record.droppedKeys) {
            m_distinctValues[kInvalidKey].insert(FieldValue{key});
        }

        ValidationResult result = standard.validate(record);
        if (result.valid) {
            m_validIndices.push_back(i);
        } else {
            m_invalidReasons[i] = std::move(result.reasons);
        }
    }
}

std::size_t OdsInstance::updateAt(std::size_t index, const EntryUpdate& update) {
    if (index >= m_records.size()) {
        std::cerr << "[OdsInstance] " << m_name << ": entry " << index << " out of range ("
                  << m_records.size() << " records)." << std::endl;
        return 0;
    }

    std::size_t changed = 0;
    if (std::holds_alternative<DeleteEntry>(update)) {
        changed = m_records[index].fields.size();
        m_records.erase(m_records.begin() + static_cast<std::ptrdiff_t>(index));
    } else {
        OdsRecord& record = m_records[index];
        for (const auto& [key, value] : std::get<FieldMap>(update)) {
            if (!m_standard->isField(key)) continue;
            FieldCoercion coerced = RecordNormalizer::NormalizeField(key, value, *m_standard);
            if (coerced.failedText) {
                record.parseFailures[key] = *coerced.failedText;
            } else {
                record.parseFailures.erase(key);
            }
            record.fields[key] = std::move(coerced.value);
            ++changed;
        }
    }

    if (changed) recomputeMetadata();
    return changed;
}

void OdsInstance::sortAndDedup(const std::vector<std::string>& sortKeyFields, bool collapse, bool reverse) {
    m_records = SortRecords(m_records, sortKeyFields, collapse, reverse);
    recomputeMetadata();
}

FieldMap OdsInstance::singleValuedFields() const {
    FieldMap single;
    for (const auto& [key, values] : m_distinctValues) {
        if (key == kInvalidKey || values.size() != 1) continue;
        const FieldValue& only = *values.begin();
        if (!IsAbsent(only)) single[key] = only;
    }
    return single;
}

std::vector<OdsRecord> OdsInstance::SortRecords(const std::vector<OdsRecord>& records,
                                                const std::vector<std::string>& sortKeyFields,
                                                bool collapse,
                                                bool reverse) {
    std::vector<std::pair<std::vector<std::string>, std::size_t>> keyed;
    keyed.reserve(records.size());

    if (collapse) {
        std::map<std::vector<std::string>, std::size_t> survivors;
        for (std::size_t i = 0; i < records.size(); ++i) {
            survivors.emplace(SortKey(records[i], sortKeyFields), i);
        }
        for (auto& [key, position] : survivors) {
            keyed.emplace_back(key, position);
        }
    } else {
        for (std::size_t i = 0; i < records.size(); ++i) {
            keyed.emplace_back(SortKey(records[i], sortKeyFields), i);
        }
        std::sort(keyed.begin(), keyed.end());
    }

    if (reverse) std::reverse(keyed.begin(), keyed.end());

    std::vector<OdsRecord> sorted;
    sorted.reserve(keyed.size());
    for (const auto& entry : keyed) {
        sorted.push_back(records[entry.second]);
    }
    return sorted;
}

} // namespace odsmanager::domain
