#pragma once
#include <cstdint>
#include <string>
#include "utils/ErrorHandler.h"

/**
 * @brief Runtime-configurable control parameters
 *
 * These parameters are handed in by the external configuration store as a
 * JSON document and written back the same way. Every setter validates its
 * range and leaves the current value untouched on rejection.
 */
namespace ClimateConfig {
    // Compile-time defaults
    namespace Defaults {
        constexpr uint32_t SENSOR_STALE_MS = 5000;          // 5s
        constexpr float PID_INTEGRAL_LIMIT = 1000.0f;       // Imax, °C·s
        constexpr uint32_t WINDOW_WARMUP_MS = 0;            // Resume as soon as the window closes
        constexpr uint32_t BOILER_OFFLINE_GRACE_MS = 0;     // Fault immediately
        constexpr uint32_t CIRCUIT_MIN_ON_MS = 0;           // 0 = anti-short-cycle disabled
        constexpr uint32_t CIRCUIT_MIN_OFF_MS = 0;
        constexpr bool BOILER_OFFLINE_CIRCULATION = true;
    }

    // Valid ranges
    namespace Limits {
        constexpr uint32_t SENSOR_STALE_MIN_MS = 1000;      // 1s
        constexpr uint32_t SENSOR_STALE_MAX_MS = 300000;    // 5min

        constexpr float PID_INTEGRAL_LIMIT_MIN = 0.1f;
        constexpr float PID_INTEGRAL_LIMIT_MAX = 100000.0f;

        constexpr uint32_t WINDOW_WARMUP_MAX_MS = 1800000;  // 30min

        constexpr uint32_t BOILER_OFFLINE_GRACE_MAX_MS = 120000;  // 2min

        constexpr uint32_t CIRCUIT_DWELL_MAX_MS = 3600000;  // 1h
    }

    // Runtime values (loaded from JSON, modifiable by the host)
    extern uint32_t sensorStaleMs;
    extern float pidIntegralLimit;
    extern uint32_t windowWarmupMs;
    extern uint32_t boilerOfflineGraceMs;
    extern uint32_t circuitMinOnMs;
    extern uint32_t circuitMinOffMs;
    extern bool boilerOfflineCirculation;

    // Restore every value to its compile-time default
    void resetToDefaults();

    /**
     * @brief Load parameters from a JSON document
     *
     * Missing keys keep their defaults, out-of-range values fall back to
     * defaults with a warning. Fails only if the document cannot be parsed.
     */
    Result<void> loadFromJson(const std::string& json);

    // Serialize the current values for the external store
    std::string saveToJson();

    // Validate and set (returns false if out of range)
    bool setSensorStale(uint32_t ms);
    bool setPIDIntegralLimit(float limit);
    bool setWindowWarmup(uint32_t ms);
    bool setBoilerOfflineGrace(uint32_t ms);
    bool setCircuitDwell(uint32_t minOnMs, uint32_t minOffMs);
    void setBoilerOfflineCirculation(bool enabled);
}
