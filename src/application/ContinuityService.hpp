/**
 * @file ContinuityService.hpp
 * @brief Read-only temporal analyses over an ODS instance: coverage, overlap adjustment, sameness.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/OdsInstance.hpp"

namespace odsmanager::application {

/**
 * @struct CoverageReport
 * @brief Union of record spans relative to the overall span they cover.
 */
struct CoverageReport {
    double coveredSeconds = 0.0;           ///< Sum of merged span durations.
    double spanSeconds = 0.0;              ///< First merged start to last merged end.
    double fraction = 0.0;                 ///< coveredSeconds / spanSeconds, in [0, 1].
    std::vector<domain::TimeWindow> merged; ///< Non-overlapping spans in start order.
};

/**
 * @enum AdjustSide
 * @brief Which side of an overlapping pair gets shifted.
 */
enum class AdjustSide {
    Start, ///< Move the later record's start after the earlier stop.
    Stop   ///< Move the earlier record's stop before the later start.
};

inline std::optional<AdjustSide> AdjustSideFromString(const std::string& side) {
    if (side == "start") return AdjustSide::Start;
    if (side == "stop") return AdjustSide::Stop;
    return std::nullopt;
}

/**
 * @class ContinuityService
 * @brief Coverage and continuity checks built on interval merging.
 */
class ContinuityService {
public:
    /**
     * @brief Fraction of the instance's overall span covered by its records.
     *
     * Records without both start and stop instants are ignored.
     * @return std::nullopt (and a logged error) when there is nothing to measure or the
     *         merged span has zero length.
     */
    std::optional<CoverageReport> coverage(const domain::OdsInstance& instance) const;

    /**
     * @brief Removes overlaps between neighbours in (start, stop) order with a single pass.
     *
     * For each adjacent pair where the next start precedes the current stop, the chosen side
     * is shifted so the two are offsetSeconds apart. Cascading overlaps are not re-resolved;
     * a remaining overlap is only logged.
     * @return The adjusted, sorted records. The instance is not modified.
     */
    std::vector<domain::OdsRecord> continuity(const domain::OdsInstance& instance,
                                              double offsetSeconds,
                                              AdjustSide side) const;

    /**
     * @brief Compares records field by field using their canonical text.
     * @param fields Fields to compare; all schema fields when empty.
     */
    bool isSame(const domain::OdsRecord& a,
                const domain::OdsRecord& b,
                const domain::Standard& standard,
                const std::vector<std::string>& fields = {}) const;

    /** @brief True if any record of the instance isSame() as record. */
    bool isDuplicate(const domain::OdsInstance& instance,
                     const domain::OdsRecord& record,
                     const std::vector<std::string>& fields = {}) const;
};

} // namespace odsmanager::application
