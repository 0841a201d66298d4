#include "modules/control/ActuatorCommander.h"
#include "utils/ErrorHandler.h"
#include "LoggingMacros.h"

static const char* TAG = "Actuator";

ActuatorCommander::ActuatorCommander(HAL::IHeatActuator* actuator)
    : actuator_(actuator)
    , hasCommanded_(false)
    , commanded_(false) {
}

bool ActuatorCommander::drive(bool desired, uint32_t nowMs) {
    if (hasCommanded_ && commanded_ == desired && !retry_.isFault()) {
        return true;
    }
    if (!retry_.shouldTry(nowMs)) {
        return false;
    }

    if (actuator_->applyDemand(desired)) {
        if (retry_.isFault()) {
            LOG_INFO(TAG, "%s accepted %s after retry", actuator_->getName(), desired ? "ON" : "OFF");
            ErrorHandler::clearErrorRateLimit(SystemError::ACTUATOR_COMMAND_FAILED);
        }
        hasCommanded_ = true;
        commanded_ = desired;
        retry_.resetFault();
        return true;
    }

    retry_.setFault(nowMs);
    ErrorHandler::logError(TAG, SystemError::ACTUATOR_COMMAND_FAILED, nowMs, actuator_->getName());
    LOG_DEBUG(TAG, "%s: retry in %lu ms", actuator_->getName(),
              static_cast<unsigned long>(retry_.getCurrentDelay()));
    return false;
}
