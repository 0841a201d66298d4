// include/shared/ClimateTypes.h
#ifndef CLIMATE_TYPES_H
#define CLIMATE_TYPES_H

#include <cstdint>
#include <string>

enum class RegulatorKind : uint8_t {
    PID = 0,
    HYSTERESIS = 1
};

enum class ZoneMode : uint8_t {
    OFF = 0,
    HEAT = 1
};

enum class ZoneControlState : uint8_t {
    IDLE = 0,
    REGULATING = 1,
    WINDOW_PAUSED = 2,
    FAULTED = 3
};

struct PidGains {
    float kp;
    float ki;
};

inline const char* regulatorKindToString(RegulatorKind kind) {
    return kind == RegulatorKind::PID ? "PID" : "Hysteresis";
}

inline const char* zoneModeToString(ZoneMode mode) {
    return mode == ZoneMode::HEAT ? "heat" : "off";
}

inline const char* zoneStateToString(ZoneControlState state) {
    switch (state) {
        case ZoneControlState::IDLE: return "idle";
        case ZoneControlState::REGULATING: return "regulating";
        case ZoneControlState::WINDOW_PAUSED: return "window_paused";
        case ZoneControlState::FAULTED: return "faulted";
        default: return "unknown";
    }
}

/**
 * @brief Observable snapshot of one zone, returned by every zone command
 */
struct ZoneStatus {
    std::string id;
    RegulatorKind kind = RegulatorKind::PID;
    ZoneMode mode = ZoneMode::HEAT;
    ZoneControlState state = ZoneControlState::IDLE;
    std::string activePreset;
    float target = 0.0f;
    float currentTemperature = 0.0f;    // NAN until the first valid reading
    PidGains gains = {0.0f, 0.0f};
    float deadband = 0.0f;
    float integral = 0.0f;
    float pTerm = 0.0f;
    float iTerm = 0.0f;
    float output = 0.0f;
    bool windowOpen = false;
    bool sensorFault = false;
    bool controlFault = false;
    bool regulatorActive = false;
};

#endif // CLIMATE_TYPES_H
