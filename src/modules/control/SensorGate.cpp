#include "modules/control/SensorGate.h"
#include "config/ClimateConfig.h"
#include "config/ClimateConstants.h"
#include "utils/Utils.h"
#include "LoggingMacros.h"
#include <cmath>

static const char* TAG = "SensorGate";

// Timestamps less than half the clock range behind the last one count as older
static constexpr uint32_t NEWER_WINDOW_MS = 0x80000000u;

SensorGate::SensorGate(const std::string& ownerId, uint32_t createdAtMs)
    : ownerId_(ownerId)
    , lastValue_(NAN)
    , lastReadingAt_(createdAtMs)
    , hasReading_(false)
    , unavailable_(false)
    , fault_(false)
    , faultCause_(SystemError::SUCCESS) {
}

bool SensorGate::isPlausible(float temperature) {
    return std::isfinite(temperature) &&
           temperature >= ClimateConstants::Sensor::MIN_VALID_TEMP_C &&
           temperature <= ClimateConstants::Sensor::MAX_VALID_TEMP_C;
}

Result<void> SensorGate::onReading(const Reading& reading) {
    if (!reading.valid) {
        markUnavailable();
        return Result<void>(SystemError::SENSOR_UNAVAILABLE, "sensor reported unavailable");
    }

    if (!isPlausible(reading.temperature)) {
        LOG_WARN(TAG, "%s: rejecting implausible reading %.2f", ownerId_.c_str(), reading.temperature);
        markUnavailable();
        SystemError err = std::isfinite(reading.temperature) ? SystemError::SENSOR_OUT_OF_RANGE
                                                             : SystemError::SENSOR_INVALID_DATA;
        return Result<void>(err, "implausible reading");
    }

    // Re-delivery of an old observation must not refresh the gate
    if (hasReading_ && Utils::elapsedMs(lastReadingAt_, reading.timestamp) < NEWER_WINDOW_MS) {
        LOG_DEBUG(TAG, "%s: ignoring reading from %lu (last %lu)", ownerId_.c_str(),
                  static_cast<unsigned long>(reading.timestamp),
                  static_cast<unsigned long>(lastReadingAt_));
        return Result<void>();
    }

    lastValue_ = reading.temperature;
    lastReadingAt_ = reading.timestamp;
    hasReading_ = true;
    unavailable_ = false;
    clearFault();
    return Result<void>();
}

void SensorGate::markUnavailable() {
    unavailable_ = true;
    raiseFault(SystemError::SENSOR_UNAVAILABLE);
}

bool SensorGate::tick(uint32_t nowMs) {
    bool before = fault_;

    if (unavailable_) {
        raiseFault(SystemError::SENSOR_UNAVAILABLE);
    } else if (Utils::elapsedMs(nowMs, lastReadingAt_) > ClimateConfig::sensorStaleMs) {
        raiseFault(SystemError::SENSOR_STALE);
    }

    return before != fault_;
}

void SensorGate::raiseFault(SystemError cause) {
    if (fault_) {
        return;
    }
    fault_ = true;
    faultCause_ = cause;
    LOG_WARN(TAG, "%s: sensor fault raised (%s)", ownerId_.c_str(), ErrorHandler::errorToString(cause));
}

void SensorGate::clearFault() {
    if (!fault_) {
        return;
    }
    LOG_INFO(TAG, "%s: sensor fault cleared after %s", ownerId_.c_str(),
             ErrorHandler::errorToString(faultCause_));
    fault_ = false;
    faultCause_ = SystemError::SUCCESS;
}
