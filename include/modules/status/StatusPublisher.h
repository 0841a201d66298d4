#ifndef STATUS_PUBLISHER_H
#define STATUS_PUBLISHER_H

#include <string>
#include "events/ClimateEvents.h"
#include "modules/control/CircuitAggregator.h"
#include "modules/control/HubAggregator.h"
#include "shared/ClimateTypes.h"

class ClimateRegistry;

/**
 * @brief JSON rendering of the observable state for the host
 *
 * Temperatures are rounded to 0.01 °C, outputs and terms to 0.001.
 * Values that are not known yet (no reading, no broadcast set point,
 * "mixed" circuit summary) are written as null.
 */
class StatusPublisher {
public:
    static std::string zoneJson(const ZoneStatus& status);
    static std::string circuitJson(const CircuitStatus& status);
    static std::string hubJson(const HubStatus& status);

    /**
     * @brief Every zone and circuit keyed by id, plus the hub
     */
    static std::string snapshotJson(const ClimateRegistry& registry);

    static std::string notificationJson(const ClimateNotification& notification);
};

#endif // STATUS_PUBLISHER_H
