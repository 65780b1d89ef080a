/**
 * @file EphemerisHorizonService.cpp
 * @brief Implementation of EphemerisHorizonService.
 */

#include "infrastructure/EphemerisHorizonService.hpp"
#include <chrono>
#include <cmath>
#include <iostream>

namespace odsmanager::infrastructure {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kDegToRad = kPi / 180.0;
constexpr double kUnixEpochJulianDate = 2440587.5;
constexpr double kJ2000JulianDate = 2451545.0;

double JulianDate(domain::Instant t) {
    const double seconds = std::chrono::duration<double>(t.time_since_epoch()).count();
    return seconds / 86400.0 + kUnixEpochJulianDate;
}

double Wrap360(double degrees) {
    double wrapped = std::fmod(degrees, 360.0);
    return wrapped < 0.0 ? wrapped + 360.0 : wrapped;
}

} // namespace

double EphemerisHorizonService::AltitudeDeg(domain::Instant t, double raDeg, double decDeg, double latDeg, double lonDeg) {
    const double gmst = Wrap360(280.46061837 + 360.98564736629 * (JulianDate(t) - kJ2000JulianDate));
    const double hourAngle = Wrap360(gmst + lonDeg - raDeg) * kDegToRad;
    const double dec = decDeg * kDegToRad;
    const double lat = latDeg * kDegToRad;
    const double sinAlt = std::sin(dec) * std::sin(lat) + std::cos(dec) * std::cos(lat) * std::cos(hourAngle);
    return std::asin(std::fmax(-1.0, std::fmin(1.0, sinAlt))) / kDegToRad;
}

std::optional<domain::TimeWindow> EphemerisHorizonService::isAboveHorizon(const domain::OdsRecord& record,
                                                                          const domain::Standard& standard,
                                                                          double elevationLimitDeg,
                                                                          double timeStepSec) {
    if (timeStepSec <= 0.0) {
        std::cerr << "[EphemerisHorizonService] Time step must be positive, got " << timeStepSec << std::endl;
        return std::nullopt;
    }
    const auto& roles = standard.roles();
    auto start = record.instant(roles.start);
    auto stop = record.instant(roles.stop);
    auto lat = domain::ToNumber(record.get(roles.siteLat));
    auto lon = domain::ToNumber(record.get(roles.siteLon));
    auto ra = domain::ToNumber(record.get(roles.ra));
    auto dec = domain::ToNumber(record.get(roles.dec));
    if (!start || !stop || !lat || !lon || !ra || !dec) {
        std::cerr << "[EphemerisHorizonService] Record for " << domain::ToString(record.get(roles.source))
                  << " lacks times, site or pointing; treated as never above the horizon." << std::endl;
        return std::nullopt;
    }

    std::optional<domain::TimeWindow> window;
    for (domain::Instant t = *start; t < *stop; t = domain::TimeTools::AddSeconds(t, timeStepSec)) {
        if (AltitudeDeg(t, *ra, *dec, *lat, *lon) > elevationLimitDeg) {
            if (!window) window = domain::TimeWindow{t, t};
            window->stop = t;
        }
    }
    return window;
}

} // namespace odsmanager::infrastructure
