// src/events/ClimateEvents.cpp
#include "events/ClimateEvents.h"

const char* climateEventTypeToString(ClimateEventType type) {
    switch (type) {
        case ClimateEventType::READING: return "reading";
        case ClimateEventType::SENSOR_UNAVAILABLE: return "sensor_unavailable";
        case ClimateEventType::SET_TARGET: return "set_target";
        case ClimateEventType::SET_MODE: return "set_mode";
        case ClimateEventType::SET_GAINS: return "set_gains";
        case ClimateEventType::SET_DEADBAND: return "set_deadband";
        case ClimateEventType::ACTIVATE_PRESET: return "activate_preset";
        case ClimateEventType::SAVE_PRESET: return "save_preset";
        case ClimateEventType::SET_WINDOW_OPEN: return "set_window_open";
        case ClimateEventType::SET_CIRCUIT_SETPOINT: return "set_circuit_setpoint";
        case ClimateEventType::SET_CIRCUIT_MODE: return "set_circuit_mode";
        case ClimateEventType::ACTIVATE_CIRCUIT_PRESET: return "activate_circuit_preset";
        case ClimateEventType::SET_BOILER_ONLINE: return "set_boiler_online";
        default: return "unknown";
    }
}

const char* notificationTypeToString(NotificationType type) {
    switch (type) {
        case NotificationType::ZONE_OUTPUT_CHANGED: return "zone_output";
        case NotificationType::SENSOR_FAULT_CHANGED: return "sensor_fault";
        case NotificationType::CONTROL_FAULT_CHANGED: return "control_fault";
        case NotificationType::ZONE_STATE_CHANGED: return "zone_state";
        case NotificationType::CIRCUIT_ACTIVE_CHANGED: return "circuit_active";
        case NotificationType::HUB_OUTPUT_CHANGED: return "hub_output";
        case NotificationType::HUB_CONTROL_FAULT_CHANGED: return "hub_control_fault";
        case NotificationType::BOILER_FAULT_CHANGED: return "boiler_fault";
        case NotificationType::COMMAND_REJECTED: return "command_rejected";
        default: return "unknown";
    }
}

ClimateEvent ClimateEvent::reading(const std::string& zoneId, float temperature, uint32_t observedAt) {
    ClimateEvent e;
    e.type = ClimateEventType::READING;
    e.targetId = zoneId;
    e.value = temperature;
    e.timestamp = observedAt;
    return e;
}

ClimateEvent ClimateEvent::sensorUnavailable(const std::string& zoneId, uint32_t observedAt) {
    ClimateEvent e;
    e.type = ClimateEventType::SENSOR_UNAVAILABLE;
    e.targetId = zoneId;
    e.timestamp = observedAt;
    return e;
}

ClimateEvent ClimateEvent::setTarget(const std::string& zoneId, float target) {
    ClimateEvent e;
    e.type = ClimateEventType::SET_TARGET;
    e.targetId = zoneId;
    e.value = target;
    return e;
}

ClimateEvent ClimateEvent::setMode(const std::string& zoneId, ZoneMode mode) {
    ClimateEvent e;
    e.type = ClimateEventType::SET_MODE;
    e.targetId = zoneId;
    e.mode = mode;
    return e;
}

ClimateEvent ClimateEvent::setGains(const std::string& zoneId, float kp, float ki) {
    ClimateEvent e;
    e.type = ClimateEventType::SET_GAINS;
    e.targetId = zoneId;
    e.value = kp;
    e.value2 = ki;
    return e;
}

ClimateEvent ClimateEvent::setDeadband(const std::string& zoneId, float deadband) {
    ClimateEvent e;
    e.type = ClimateEventType::SET_DEADBAND;
    e.targetId = zoneId;
    e.value = deadband;
    return e;
}

ClimateEvent ClimateEvent::activatePreset(const std::string& zoneId, const std::string& preset) {
    ClimateEvent e;
    e.type = ClimateEventType::ACTIVATE_PRESET;
    e.targetId = zoneId;
    e.presetName = preset;
    return e;
}

ClimateEvent ClimateEvent::savePreset(const std::string& zoneId, const std::string& preset) {
    ClimateEvent e;
    e.type = ClimateEventType::SAVE_PRESET;
    e.targetId = zoneId;
    e.presetName = preset;
    return e;
}

ClimateEvent ClimateEvent::setWindowOpen(const std::string& zoneId, bool open) {
    ClimateEvent e;
    e.type = ClimateEventType::SET_WINDOW_OPEN;
    e.targetId = zoneId;
    e.flag = open;
    return e;
}

ClimateEvent ClimateEvent::setCircuitSetpoint(const std::string& circuitId, float setpoint) {
    ClimateEvent e;
    e.type = ClimateEventType::SET_CIRCUIT_SETPOINT;
    e.targetId = circuitId;
    e.value = setpoint;
    return e;
}

ClimateEvent ClimateEvent::setCircuitMode(const std::string& circuitId, ZoneMode mode) {
    ClimateEvent e;
    e.type = ClimateEventType::SET_CIRCUIT_MODE;
    e.targetId = circuitId;
    e.mode = mode;
    return e;
}

ClimateEvent ClimateEvent::activateCircuitPreset(const std::string& circuitId, const std::string& preset) {
    ClimateEvent e;
    e.type = ClimateEventType::ACTIVATE_CIRCUIT_PRESET;
    e.targetId = circuitId;
    e.presetName = preset;
    return e;
}

ClimateEvent ClimateEvent::setBoilerOnline(bool online) {
    ClimateEvent e;
    e.type = ClimateEventType::SET_BOILER_ONLINE;
    e.flag = online;
    return e;
}
