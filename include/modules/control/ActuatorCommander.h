#ifndef ACTUATOR_COMMANDER_H
#define ACTUATOR_COMMANDER_H

#include <cstdint>
#include "hal/HardwareAbstractionLayer.h"
#include "utils/RetryTracker.h"

/**
 * @brief Change-only command delivery to one heat actuator
 *
 * A demand is sent when it differs from the last acknowledged one. A
 * rejected command is retried with RetryTracker backoff.
 */
class ActuatorCommander {
public:
    explicit ActuatorCommander(HAL::IHeatActuator* actuator);

    /**
     * @brief Bring the actuator to the desired demand
     * @return true if the actuator acknowledged the desired demand
     */
    bool drive(bool desired, uint32_t nowMs);

    HAL::IHeatActuator* getActuator() const { return actuator_; }
    bool isAcknowledged() const { return hasCommanded_; }
    bool getCommanded() const { return commanded_; }
    bool isRetrying() const { return retry_.isFault(); }

private:
    HAL::IHeatActuator* actuator_;
    bool hasCommanded_;
    bool commanded_;
    RetryTracker retry_;
};

#endif // ACTUATOR_COMMANDER_H
