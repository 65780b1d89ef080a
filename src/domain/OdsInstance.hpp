/**
 * @file OdsInstance.hpp
 * @brief A named collection of ODS records plus metadata derived from them.
 */

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "domain/OdsRecord.hpp"
#include "domain/RecordInput.hpp"
#include "domain/Standard.hpp"

namespace odsmanager::domain {

/**
 * @class OdsInstance
 * @brief Owns one ordered record sequence.
 *
 * Records keep insertion order until sortAndDedup reorders them. Derived metadata
 * (validity partition, distinct values, earliest/latest) is rebuilt by a full scan in
 * recomputeMetadata(); append() leaves it stale so batches pay for one scan.
 */
class OdsInstance {
public:
    /** @brief Key in distinctValues() collecting input keys that were not schema fields. */
    static constexpr const char* kInvalidKey = "invalid";

    OdsInstance(std::string name, std::shared_ptr<const Standard> standard);

    const std::string& name() const { return m_name; }
    const Standard& standard() const { return *m_standard; }
    std::shared_ptr<const Standard> sharedStandard() const { return m_standard; }

    const std::vector<OdsRecord>& records() const { return m_records; }
    std::size_t size() const { return m_records.size(); }
    bool empty() const { return m_records.empty(); }

    /** @brief Adds a normalized record at the end. Metadata is not recomputed. */
    void append(OdsRecord record);

    /** @brief Replaces the whole record sequence and recomputes metadata. */
    void replaceRecords(std::vector<OdsRecord> records);

    /** @brief Full O(records x fields) rescan of the derived metadata. */
    void recomputeMetadata();

    /**
     * @brief Patches or deletes the record at index.
     *
     * A patch applies only schema fields (time fields are interpreted like on insertion).
     * @return Number of fields applied, the prior field count for a delete, or 0 when index
     *         is out of range.
     */
    std::size_t updateAt(std::size_t index, const EntryUpdate& update);

    /**
     * @brief Sorts by the stringified sortKeyFields.
     * @param collapse When true, records sharing a key collapse to the first one seen.
     * @param reverse Inverts the order.
     */
    void sortAndDedup(const std::vector<std::string>& sortKeyFields, bool collapse = true, bool reverse = false);

    const std::vector<std::size_t>& validIndices() const { return m_validIndices; }
    const std::map<std::size_t, std::vector<std::string>>& invalidReasons() const { return m_invalidReasons; }
    const std::map<std::string, std::set<FieldValue>>& distinctValues() const { return m_distinctValues; }

    /** @brief Earliest start instant; FarFuture() when no record has one. */
    Instant earliest() const { return m_earliest; }

    /** @brief Latest stop instant; FarPast() when no record has one. */
    Instant latest() const { return m_latest; }

    bool hasTimeSpan() const { return !(m_latest < m_earliest); }

    /** @brief Fields (other than kInvalidKey) holding exactly one non-absent value across records. */
    FieldMap singleValuedFields() const;

    /**
     * @brief Sorted copy of records.
     *
     * The key is the tuple of ToString() values of sortKeyFields, compared lexicographically.
     * Without collapse the original position breaks ties so every record is kept; with
     * collapse the first record seen at each key survives.
     */
    static std::vector<OdsRecord> SortRecords(const std::vector<OdsRecord>& records,
                                              const std::vector<std::string>& sortKeyFields,
                                              bool collapse,
                                              bool reverse);

private:
    std::string m_name;
    std::shared_ptr<const Standard> m_standard;
    std::vector<OdsRecord> m_records;

    std::vector<std::size_t> m_validIndices;
    std::map<std::size_t, std::vector<std::string>> m_invalidReasons;
    std::map<std::string, std::set<FieldValue>> m_distinctValues;
    Instant m_earliest;
    Instant m_latest;
};

} // namespace odsmanager::domain
