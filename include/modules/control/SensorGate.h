#ifndef SENSOR_GATE_H
#define SENSOR_GATE_H

#include <cstdint>
#include <string>
#include "hal/HardwareAbstractionLayer.h"
#include "utils/ErrorHandler.h"

/**
 * @brief Reading validation and staleness tracking for one zone sensor
 *
 * The fault flag is edge-triggered: it is raised by tick() when the last
 * valid reading is older than ClimateConfig::sensorStaleMs or when the sensor
 * reported unavailable, and it is cleared only by the next valid reading.
 * Before the first reading, staleness is measured from construction.
 */
class SensorGate {
public:
    using Reading = HAL::ITemperatureSource::Reading;

    SensorGate(const std::string& ownerId, uint32_t createdAtMs);

    /**
     * @brief Accept a reading from the collaborator
     *
     * A valid reading is recorded and clears the fault; one whose timestamp
     * is not newer than the last accepted reading is ignored. A reading flagged
     * invalid, non-finite or outside the plausible range counts as the
     * sensor reporting unavailable and raises the fault immediately.
     */
    Result<void> onReading(const Reading& reading);

    /**
     * @brief Collaborator reports the sensor as unavailable
     */
    void markUnavailable();

    /**
     * @brief Periodic staleness check
     * @return true if the fault flag changed
     */
    bool tick(uint32_t nowMs);

    bool hasFault() const { return fault_; }
    bool hasReading() const { return hasReading_; }
    float getLastValue() const { return lastValue_; }
    uint32_t getLastReadingAt() const { return lastReadingAt_; }

    // SENSOR_STALE or SENSOR_UNAVAILABLE while faulted, SUCCESS otherwise
    SystemError getFaultCause() const { return faultCause_; }

    static bool isPlausible(float temperature);

private:
    void raiseFault(SystemError cause);
    void clearFault();

    std::string ownerId_;
    float lastValue_;
    uint32_t lastReadingAt_;
    bool hasReading_;
    bool unavailable_;
    bool fault_;
    SystemError faultCause_;
};

#endif // SENSOR_GATE_H
