/**
 * @file EphemerisHorizonService.hpp
 * @brief HorizonService computing source elevation from mean sidereal time.
 */

#pragma once

#include "domain/HorizonService.hpp"

namespace odsmanager::infrastructure {

/**
 * @class EphemerisHorizonService
 * @brief Samples the record span and evaluates the source altitude at the site.
 *
 * Uses Greenwich mean sidereal time and J2000 coordinates without precession,
 * nutation or refraction, which is good to a fraction of a degree for scheduling.
 */
class EphemerisHorizonService : public domain::HorizonService {
public:
    std::optional<domain::TimeWindow> isAboveHorizon(const domain::OdsRecord& record,
                                                     const domain::Standard& standard,
                                                     double elevationLimitDeg,
                                                     double timeStepSec) override;

    /** @brief Altitude in degrees of (raDeg, decDeg) seen from (latDeg, lonDeg) at t. */
    static double AltitudeDeg(domain::Instant t, double raDeg, double decDeg, double latDeg, double lonDeg);
};

} // namespace odsmanager::infrastructure
