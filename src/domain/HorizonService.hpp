/**
 * @file HorizonService.hpp
 * @brief Interface for horizon-crossing checks of ODS records.
 */

#pragma once

#include <optional>

#include "domain/OdsRecord.hpp"
#include "domain/Standard.hpp"

namespace odsmanager::domain {

/**
 * @class HorizonService
 * @brief Abstract ephemeris collaborator.
 */
class HorizonService {
public:
    virtual ~HorizonService() = default;

    /**
     * @brief Finds when the record's source is above an elevation limit within its span.
     * @param record Record providing site, pointing and start/stop.
     * @param standard Schema naming the fields used.
     * @param elevationLimitDeg Elevation considered "above the horizon".
     * @param timeStepSec Sampling step through the record span.
     * @return First and last sampled instants above the limit, or nullopt if never above.
     */
    virtual std::optional<TimeWindow> isAboveHorizon(const OdsRecord& record,
                                                     const Standard& standard,
                                                     double elevationLimitDeg,
                                                     double timeStepSec) = 0;
};

} // namespace odsmanager::domain
