/**
 * @file ContinuityService.cpp
 * @brief Implementation of ContinuityService.
 */

#include "application/ContinuityService.hpp"

#include <iostream>
#include <utility>

#include "domain/IntervalMerger.hpp"

namespace odsmanager::application {

using domain::Instant;
using domain::OdsRecord;
using domain::TimeTools;

std::optional<CoverageReport> ContinuityService::coverage(const domain::OdsInstance& instance) const {
    const auto& standard = instance.standard();
    auto sorted = domain::OdsInstance::SortRecords(instance.records(), {standard.stop(), standard.start()}, false, false);

    std::vector<std::pair<Instant, Instant>> spans;
    spans.reserve(sorted.size());
    for (const auto& record : sorted) {
        auto start = record.instant(standard.start());
        auto stop = record.instant(standard.stop());
        if (!start || !stop || *stop < *start) continue;
        spans.emplace_back(*start, *stop);
    }

    auto merged = domain::MergeIntervals(std::move(spans));
    if (merged.empty()) {
        std::cerr << "[ContinuityService] " << instance.name() << ": no records with a usable time span." << std::endl;
        return std::nullopt;
    }

    CoverageReport report;
    for (const auto& [start, stop] : merged) {
        report.coveredSeconds += TimeTools::SecondsBetween(start, stop);
        report.merged.push_back({start, stop});
    }
    report.spanSeconds = TimeTools::SecondsBetween(merged.front().first, merged.back().second);
    if (report.spanSeconds <= 0.0) {
        std::cerr << "[ContinuityService] " << instance.name() << ": total span is zero, coverage undefined." << std::endl;
        return std::nullopt;
    }
    report.fraction = report.coveredSeconds / report.spanSeconds;
    return report;
}

std::vector<OdsRecord> ContinuityService::continuity(const domain::OdsInstance& instance,
                                                     double offsetSeconds,
                                                     AdjustSide side) const {
    const auto& standard = instance.standard();
    auto adjusted = domain::OdsInstance::SortRecords(instance.records(), {standard.start(), standard.stop()}, false, false);

    for (std::size_t i = 0; i + 1 < adjusted.size(); ++i) {
        auto thisStop = adjusted[i].instant(standard.stop());
        auto nextStart = adjusted[i + 1].instant(standard.start());
        if (!thisStop || !nextStart || !(*nextStart < *thisStop)) continue;

        if (side == AdjustSide::Start) {
            nextStart = TimeTools::AddSeconds(*thisStop, offsetSeconds);
        } else {
            thisStop = TimeTools::AddSeconds(*nextStart, -offsetSeconds);
        }
        adjusted[i].fields[standard.stop()] = *thisStop;
        adjusted[i + 1].fields[standard.start()] = *nextStart;

        if (*nextStart < *thisStop) {
            std::cerr << "[ContinuityService] Entry " << i + 1 << ": new start is still before the previous stop." << std::endl;
        }
        auto nextStop = adjusted[i + 1].instant(standard.stop());
        if (nextStop && !(*nextStart < *nextStop)) {
            std::cerr << "[ContinuityService] Entry " << i + 1 << ": adjusted start is not before its stop." << std::endl;
        }
    }
    return adjusted;
}

bool ContinuityService::isSame(const OdsRecord& a,
                               const OdsRecord& b,
                               const domain::Standard& standard,
                               const std::vector<std::string>& fields) const {
    const auto& toCheck = fields.empty() ? standard.fieldNames() : fields;
    for (const auto& key : toCheck) {
        auto ia = a.fields.find(key);
        auto ib = b.fields.find(key);
        if (ia == a.fields.end() || ib == b.fields.end()) return false;
        if (domain::ToKeyString(ia->second) != domain::ToKeyString(ib->second)) return false;
    }
    return true;
}

bool ContinuityService::isDuplicate(const domain::OdsInstance& instance,
                                    const OdsRecord& record,
                                    const std::vector<std::string>& fields) const {
    for (const auto& entry : instance.records()) {
        if (isSame(entry, record, instance.standard(), fields)) return true;
    }
    return false;
}

} // namespace odsmanager::application
