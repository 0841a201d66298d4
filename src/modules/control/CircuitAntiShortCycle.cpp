#include "modules/control/CircuitAntiShortCycle.h"
#include "config/ClimateConfig.h"
#include "utils/Utils.h"
#include "LoggingMacros.h"

const char* CircuitAntiShortCycle::TAG = "CircuitAntiCycle";

CircuitAntiShortCycle::CircuitAntiShortCycle()
    : isOn_(false)
    , everOff_(false)
    , lastOnTime_(0)
    , lastOffTime_(0) {
}

bool CircuitAntiShortCycle::isEnabled() {
    return ClimateConfig::circuitMinOnMs > 0 || ClimateConfig::circuitMinOffMs > 0;
}

bool CircuitAntiShortCycle::canTurnOn(uint32_t nowMs) const {
    if (isOn_ || !everOff_) {
        return true;
    }

    bool allowed = Utils::hasTimedOut(nowMs, lastOffTime_, ClimateConfig::circuitMinOffMs);
    if (!allowed) {
        LOG_DEBUG(TAG, "Cannot turn on yet - %lu ms remaining of minimum off time",
                  static_cast<unsigned long>(getTimeUntilCanTurnOn(nowMs)));
    }
    return allowed;
}

bool CircuitAntiShortCycle::canTurnOff(uint32_t nowMs) const {
    if (!isOn_) {
        return true;
    }

    bool allowed = Utils::hasTimedOut(nowMs, lastOnTime_, ClimateConfig::circuitMinOnMs);
    if (!allowed) {
        LOG_DEBUG(TAG, "Cannot turn off yet - %lu ms remaining of minimum on time",
                  static_cast<unsigned long>(getTimeUntilCanTurnOff(nowMs)));
    }
    return allowed;
}

void CircuitAntiShortCycle::recordOn(uint32_t nowMs) {
    if (!isOn_) {
        isOn_ = true;
        lastOnTime_ = nowMs;
    }
}

void CircuitAntiShortCycle::recordOff(uint32_t nowMs) {
    if (isOn_) {
        isOn_ = false;
        everOff_ = true;
        lastOffTime_ = nowMs;
    }
}

uint32_t CircuitAntiShortCycle::getTimeUntilCanTurnOn(uint32_t nowMs) const {
    if (isOn_ || !everOff_) {
        return 0;
    }
    uint32_t elapsed = Utils::elapsedMs(nowMs, lastOffTime_);
    return elapsed >= ClimateConfig::circuitMinOffMs ? 0 : ClimateConfig::circuitMinOffMs - elapsed;
}

uint32_t CircuitAntiShortCycle::getTimeUntilCanTurnOff(uint32_t nowMs) const {
    if (!isOn_) {
        return 0;
    }
    uint32_t elapsed = Utils::elapsedMs(nowMs, lastOnTime_);
    return elapsed >= ClimateConfig::circuitMinOnMs ? 0 : ClimateConfig::circuitMinOnMs - elapsed;
}
