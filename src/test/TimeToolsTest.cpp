#include <cassert>
#include <iostream>

#include "domain/FieldValue.hpp"
#include "domain/TimeTools.hpp"

using odsmanager::domain::FieldValue;
using odsmanager::domain::Instant;
using odsmanager::domain::ToKeyString;
using odsmanager::domain::TimeTools;

namespace {

std::string Iso(const std::string& text) {
    auto instant = TimeTools::InterpretDate(text);
    assert(instant && "date should parse");
    return TimeTools::FormatIso(*instant);
}

} // namespace

int main() {
    std::cout << "[Test] Starting TimeTools Test..." << std::endl;

    assert(Iso("2024-01-01T01:02:03") == "2024-01-01T01:02:03");
    assert(Iso("2024-01-01 01:02:03") == "2024-01-01T01:02:03");
    assert(Iso("2024-01-01T01:02:03.500Z") == "2024-01-01T01:02:03");
    assert(Iso("2024-01-01T01:02:03+01:00") == "2024-01-01T00:02:03");
    assert(Iso("2024-01-01T01:02") == "2024-01-01T01:02:00");
    assert(Iso("2024") == "2024-01-01T00:00:00");
    assert(Iso("2024-03") == "2024-03-01T00:00:00");
    assert(Iso("2024-02-29") == "2024-02-29T00:00:00");

    assert(!TimeTools::InterpretDate("garbage"));
    assert(!TimeTools::InterpretDate(""));
    assert(!TimeTools::InterpretDate("2023-02-30"));
    assert(!TimeTools::InterpretDate("2024-01-01T25:00:00"));

    // Relative forms use the supplied reference instant.
    const Instant ref = *TimeTools::InterpretDate("2024-06-15T12:00:00");
    assert(*TimeTools::InterpretDate("now", ref) == ref);
    assert(TimeTools::FormatIso(*TimeTools::InterpretDate("yesterday", ref)) == "2024-06-14T12:00:00");
    assert(TimeTools::FormatIso(*TimeTools::InterpretDate("tomorrow", ref)) == "2024-06-16T12:00:00");
    assert(TimeTools::FormatIso(*TimeTools::InterpretDate("now/2h", ref)) == "2024-06-15T14:00:00");
    assert(Iso("2024-01-01T00:00:00/30") == "2024-01-01T00:30:00");
    assert(Iso("2024-01-01T00:00:00/-1d") == "2023-12-31T00:00:00");
    assert(!TimeTools::InterpretDate("2024-01-01/soon"));

    const Instant start = *TimeTools::InterpretDate("2024-01-01T00:00:00");
    assert(TimeTools::SecondsBetween(start, TimeTools::AddSeconds(start, 90.0)) == 90.0);
    assert(TimeTools::SecondsBetween(TimeTools::AddSeconds(start, 90.0), start) == -90.0);

    auto windows = TimeTools::GenerateObservationTimes(start, {60.0, 120.0});
    assert(windows.size() == 2);
    assert(TimeTools::FormatIso(windows[0].start) == "2024-01-01T00:00:00");
    assert(TimeTools::FormatIso(windows[0].stop) == "2024-01-01T00:01:00");
    assert(TimeTools::FormatIso(windows[1].start) == "2024-01-01T00:01:01");
    assert(TimeTools::FormatIso(windows[1].stop) == "2024-01-01T00:03:01");

    const Instant fractional = *TimeTools::InterpretDate("2024-01-01T00:00:00.25");
    assert(TimeTools::FormatIso(fractional) == "2024-01-01T00:00:00");
    assert(TimeTools::FormatIsoMicros(fractional) == "2024-01-01T00:00:00.250000");
    assert(TimeTools::FormatIsoMicros(start) == "2024-01-01T00:00:00.000000");
    assert(ToKeyString(FieldValue{fractional}) != ToKeyString(FieldValue{TimeTools::AddSeconds(fractional, 0.5)}));

    assert(TimeTools::FarPast() < start && start < TimeTools::FarFuture());

    std::cout << "[PASS] TimeTools Test." << std::endl;
    return 0;
}
