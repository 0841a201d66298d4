// include/events/ClimateEvents.h
#ifndef CLIMATE_EVENTS_H
#define CLIMATE_EVENTS_H

#include <cstdint>
#include <functional>
#include <string>
#include "shared/ClimateTypes.h"
#include "utils/ErrorHandler.h"

/**
 * @brief Inputs consumed by the scheduler, addressed by entity id
 */
enum class ClimateEventType : uint8_t {
    READING = 0,
    SENSOR_UNAVAILABLE,
    SET_TARGET,
    SET_MODE,
    SET_GAINS,
    SET_DEADBAND,
    ACTIVATE_PRESET,
    SAVE_PRESET,
    SET_WINDOW_OPEN,
    SET_CIRCUIT_SETPOINT,
    SET_CIRCUIT_MODE,
    ACTIVATE_CIRCUIT_PRESET,
    SET_BOILER_ONLINE
};

const char* climateEventTypeToString(ClimateEventType type);

struct ClimateEvent {
    ClimateEventType type = ClimateEventType::READING;
    std::string targetId;           // zone or circuit id, empty for hub events
    float value = 0.0f;             // temperature, target, setpoint, Kp or deadband
    float value2 = 0.0f;            // Ki for SET_GAINS
    bool flag = false;              // window open / boiler online
    ZoneMode mode = ZoneMode::HEAT;
    std::string presetName;
    uint32_t timestamp = 0;

    static ClimateEvent reading(const std::string& zoneId, float temperature, uint32_t observedAt);
    static ClimateEvent sensorUnavailable(const std::string& zoneId, uint32_t observedAt);
    static ClimateEvent setTarget(const std::string& zoneId, float target);
    static ClimateEvent setMode(const std::string& zoneId, ZoneMode mode);
    static ClimateEvent setGains(const std::string& zoneId, float kp, float ki);
    static ClimateEvent setDeadband(const std::string& zoneId, float deadband);
    static ClimateEvent activatePreset(const std::string& zoneId, const std::string& preset);
    static ClimateEvent savePreset(const std::string& zoneId, const std::string& preset);
    static ClimateEvent setWindowOpen(const std::string& zoneId, bool open);
    static ClimateEvent setCircuitSetpoint(const std::string& circuitId, float setpoint);
    static ClimateEvent setCircuitMode(const std::string& circuitId, ZoneMode mode);
    static ClimateEvent activateCircuitPreset(const std::string& circuitId, const std::string& preset);
    static ClimateEvent setBoilerOnline(bool online);
};

/**
 * @brief Observable changes emitted by zones, circuits and the hub
 */
enum class NotificationType : uint8_t {
    ZONE_OUTPUT_CHANGED = 0,
    SENSOR_FAULT_CHANGED,
    CONTROL_FAULT_CHANGED,
    ZONE_STATE_CHANGED,
    CIRCUIT_ACTIVE_CHANGED,
    HUB_OUTPUT_CHANGED,
    HUB_CONTROL_FAULT_CHANGED,
    BOILER_FAULT_CHANGED,
    COMMAND_REJECTED
};

const char* notificationTypeToString(NotificationType type);

struct ClimateNotification {
    NotificationType type = NotificationType::ZONE_OUTPUT_CHANGED;
    std::string sourceId;
    float value = 0.0f;             // output / state ordinal
    bool flag = false;              // fault or active state after the edge
    SystemError error = SystemError::SUCCESS;   // cause of a fault edge or rejection
    uint32_t timestamp = 0;
};

using NotificationSink = std::function<void(const ClimateNotification&)>;

#endif // CLIMATE_EVENTS_H
