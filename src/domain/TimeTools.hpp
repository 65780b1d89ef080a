/**
 * @file TimeTools.hpp
 * @brief UTC instants, time windows and date interpretation for ODS records.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace odsmanager::domain {

/** @brief Absolute UTC instant used for every time-valued ODS field. */
using Instant = std::chrono::system_clock::time_point;

/**
 * @struct TimeWindow
 * @brief Closed [start, stop] span.
 */
struct TimeWindow {
    Instant start;
    Instant stop;
};

/**
 * @class TimeTools
 * @brief Static helpers converting between text and instants.
 */
class TimeTools {
public:
    /**
     * @brief Interprets a date expression relative to the current clock.
     *
     * Accepts "now", "today", "current", "yesterday", "tomorrow", "YYYY", "YYYY-MM",
     * ISO-8601 dates and date-times (optional fraction, "Z" or "+HH:MM" suffix) and a
     * "<date>/<offset>" form where offset carries a d/h/m/s unit (minutes when unitless).
     * @return std::nullopt when the text cannot be interpreted.
     */
    static std::optional<Instant> InterpretDate(const std::string& input);

    /** @brief Same as InterpretDate(input) with an explicit reference for relative words. */
    static std::optional<Instant> InterpretDate(const std::string& input, Instant now);

    /** @brief Formats as "YYYY-MM-DDTHH:MM:SS" (UTC, truncated to seconds). */
    static std::string FormatIso(Instant t);

    /** @brief Formats as "YYYY-MM-DDTHH:MM:SS.ffffff" (UTC, microseconds, fixed width). */
    static std::string FormatIsoMicros(Instant t);

    static Instant AddSeconds(Instant t, double seconds);

    /** @brief Signed seconds from a to b. */
    static double SecondsBetween(Instant a, Instant b);

    /**
     * @brief Back-to-back observation windows starting at start.
     *
     * Each window lasts durationsSec[i]; the next one begins one second after the
     * previous window's stop.
     */
    static std::vector<TimeWindow> GenerateObservationTimes(Instant start, const std::vector<double>& durationsSec);

    /** @brief Sentinel below any real instant. */
    static Instant FarPast() { return Instant::min(); }

    /** @brief Sentinel above any real instant. */
    static Instant FarFuture() { return Instant::max(); }
};

} // namespace odsmanager::domain
