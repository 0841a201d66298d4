#include "config/ClimateConfig.h"
#include "LoggingMacros.h"
#include <ArduinoJson.h>
#include <cmath>

static const char* TAG = "ClimateConfig";

namespace ClimateConfig {
    // Runtime values initialized to defaults
    uint32_t sensorStaleMs = Defaults::SENSOR_STALE_MS;
    float pidIntegralLimit = Defaults::PID_INTEGRAL_LIMIT;
    uint32_t windowWarmupMs = Defaults::WINDOW_WARMUP_MS;
    uint32_t boilerOfflineGraceMs = Defaults::BOILER_OFFLINE_GRACE_MS;
    uint32_t circuitMinOnMs = Defaults::CIRCUIT_MIN_ON_MS;
    uint32_t circuitMinOffMs = Defaults::CIRCUIT_MIN_OFF_MS;
    bool boilerOfflineCirculation = Defaults::BOILER_OFFLINE_CIRCULATION;

    void resetToDefaults() {
        sensorStaleMs = Defaults::SENSOR_STALE_MS;
        pidIntegralLimit = Defaults::PID_INTEGRAL_LIMIT;
        windowWarmupMs = Defaults::WINDOW_WARMUP_MS;
        boilerOfflineGraceMs = Defaults::BOILER_OFFLINE_GRACE_MS;
        circuitMinOnMs = Defaults::CIRCUIT_MIN_ON_MS;
        circuitMinOffMs = Defaults::CIRCUIT_MIN_OFF_MS;
        boilerOfflineCirculation = Defaults::BOILER_OFFLINE_CIRCULATION;
    }

    Result<void> loadFromJson(const std::string& json) {
        JsonDocument doc;  // ArduinoJson v7
        DeserializationError err = deserializeJson(doc, json);
        if (err) {
            LOG_ERROR(TAG, "Failed to parse stored config: %s", err.c_str());
            return Result<void>(SystemError::CONFIG_CORRUPTED, err.c_str());
        }

        sensorStaleMs = doc["sensor_stale"] | Defaults::SENSOR_STALE_MS;
        pidIntegralLimit = doc["pid_int_limit"] | Defaults::PID_INTEGRAL_LIMIT;
        windowWarmupMs = doc["window_warmup"] | Defaults::WINDOW_WARMUP_MS;
        boilerOfflineGraceMs = doc["boiler_grace"] | Defaults::BOILER_OFFLINE_GRACE_MS;
        circuitMinOnMs = doc["circuit_min_on"] | Defaults::CIRCUIT_MIN_ON_MS;
        circuitMinOffMs = doc["circuit_min_off"] | Defaults::CIRCUIT_MIN_OFF_MS;
        boilerOfflineCirculation = doc["boiler_circulation"] | Defaults::BOILER_OFFLINE_CIRCULATION;

        // Validate loaded values
        if (sensorStaleMs < Limits::SENSOR_STALE_MIN_MS ||
            sensorStaleMs > Limits::SENSOR_STALE_MAX_MS) {
            LOG_WARN(TAG, "Invalid sensor_stale %lu ms in store, using default %lu ms",
                     static_cast<unsigned long>(sensorStaleMs),
                     static_cast<unsigned long>(Defaults::SENSOR_STALE_MS));
            sensorStaleMs = Defaults::SENSOR_STALE_MS;
        }

        if (!std::isfinite(pidIntegralLimit) ||
            pidIntegralLimit < Limits::PID_INTEGRAL_LIMIT_MIN ||
            pidIntegralLimit > Limits::PID_INTEGRAL_LIMIT_MAX) {
            LOG_WARN(TAG, "Invalid pid_int_limit %.3f in store, using default %.3f",
                     pidIntegralLimit, Defaults::PID_INTEGRAL_LIMIT);
            pidIntegralLimit = Defaults::PID_INTEGRAL_LIMIT;
        }

        if (windowWarmupMs > Limits::WINDOW_WARMUP_MAX_MS) {
            LOG_WARN(TAG, "Invalid window_warmup %lu ms in store, using default %lu ms",
                     static_cast<unsigned long>(windowWarmupMs),
                     static_cast<unsigned long>(Defaults::WINDOW_WARMUP_MS));
            windowWarmupMs = Defaults::WINDOW_WARMUP_MS;
        }

        if (boilerOfflineGraceMs > Limits::BOILER_OFFLINE_GRACE_MAX_MS) {
            LOG_WARN(TAG, "Invalid boiler_grace %lu ms in store, using default %lu ms",
                     static_cast<unsigned long>(boilerOfflineGraceMs),
                     static_cast<unsigned long>(Defaults::BOILER_OFFLINE_GRACE_MS));
            boilerOfflineGraceMs = Defaults::BOILER_OFFLINE_GRACE_MS;
        }

        if (circuitMinOnMs > Limits::CIRCUIT_DWELL_MAX_MS ||
            circuitMinOffMs > Limits::CIRCUIT_DWELL_MAX_MS) {
            LOG_WARN(TAG, "Invalid circuit dwell %lu/%lu ms in store, disabling",
                     static_cast<unsigned long>(circuitMinOnMs),
                     static_cast<unsigned long>(circuitMinOffMs));
            circuitMinOnMs = Defaults::CIRCUIT_MIN_ON_MS;
            circuitMinOffMs = Defaults::CIRCUIT_MIN_OFF_MS;
        }

        LOG_INFO(TAG, "Loaded config: sensor_stale=%lu ms, window_warmup=%lu ms, boiler_grace=%lu ms",
                 static_cast<unsigned long>(sensorStaleMs),
                 static_cast<unsigned long>(windowWarmupMs),
                 static_cast<unsigned long>(boilerOfflineGraceMs));
        LOG_INFO(TAG, "PID integral limit: %.3f, circuit dwell on/off: %lu/%lu ms, circulation: %s",
                 pidIntegralLimit,
                 static_cast<unsigned long>(circuitMinOnMs),
                 static_cast<unsigned long>(circuitMinOffMs),
                 boilerOfflineCirculation ? "on" : "off");
        return Result<void>();
    }

    std::string saveToJson() {
        JsonDocument doc;
        doc["sensor_stale"] = sensorStaleMs;
        doc["pid_int_limit"] = pidIntegralLimit;
        doc["window_warmup"] = windowWarmupMs;
        doc["boiler_grace"] = boilerOfflineGraceMs;
        doc["circuit_min_on"] = circuitMinOnMs;
        doc["circuit_min_off"] = circuitMinOffMs;
        doc["boiler_circulation"] = boilerOfflineCirculation;

        std::string out;
        serializeJson(doc, out);
        LOG_DEBUG(TAG, "Serialized config (%u bytes)", static_cast<unsigned>(out.size()));
        return out;
    }

    bool setSensorStale(uint32_t ms) {
        if (ms < Limits::SENSOR_STALE_MIN_MS || ms > Limits::SENSOR_STALE_MAX_MS) {
            LOG_WARN(TAG, "Invalid sensor_stale %lu ms (range: %lu-%lu ms)",
                     static_cast<unsigned long>(ms),
                     static_cast<unsigned long>(Limits::SENSOR_STALE_MIN_MS),
                     static_cast<unsigned long>(Limits::SENSOR_STALE_MAX_MS));
            return false;
        }
        sensorStaleMs = ms;
        LOG_INFO(TAG, "Set sensor_stale to %lu ms", static_cast<unsigned long>(ms));
        return true;
    }

    bool setPIDIntegralLimit(float limit) {
        if (!std::isfinite(limit) ||
            limit < Limits::PID_INTEGRAL_LIMIT_MIN || limit > Limits::PID_INTEGRAL_LIMIT_MAX) {
            LOG_WARN(TAG, "Invalid pid_int_limit %.3f (range: %.1f-%.1f)",
                     limit, Limits::PID_INTEGRAL_LIMIT_MIN, Limits::PID_INTEGRAL_LIMIT_MAX);
            return false;
        }
        pidIntegralLimit = limit;
        LOG_INFO(TAG, "Set pid_int_limit to %.3f", limit);
        return true;
    }

    bool setWindowWarmup(uint32_t ms) {
        if (ms > Limits::WINDOW_WARMUP_MAX_MS) {
            LOG_WARN(TAG, "Invalid window_warmup %lu ms (max %lu ms)",
                     static_cast<unsigned long>(ms),
                     static_cast<unsigned long>(Limits::WINDOW_WARMUP_MAX_MS));
            return false;
        }
        windowWarmupMs = ms;
        LOG_INFO(TAG, "Set window_warmup to %lu ms", static_cast<unsigned long>(ms));
        return true;
    }

    bool setBoilerOfflineGrace(uint32_t ms) {
        if (ms > Limits::BOILER_OFFLINE_GRACE_MAX_MS) {
            LOG_WARN(TAG, "Invalid boiler_grace %lu ms (max %lu ms)",
                     static_cast<unsigned long>(ms),
                     static_cast<unsigned long>(Limits::BOILER_OFFLINE_GRACE_MAX_MS));
            return false;
        }
        boilerOfflineGraceMs = ms;
        LOG_INFO(TAG, "Set boiler_grace to %lu ms", static_cast<unsigned long>(ms));
        return true;
    }

    bool setCircuitDwell(uint32_t minOnMs, uint32_t minOffMs) {
        if (minOnMs > Limits::CIRCUIT_DWELL_MAX_MS || minOffMs > Limits::CIRCUIT_DWELL_MAX_MS) {
            LOG_WARN(TAG, "Invalid circuit dwell %lu/%lu ms (max %lu ms)",
                     static_cast<unsigned long>(minOnMs),
                     static_cast<unsigned long>(minOffMs),
                     static_cast<unsigned long>(Limits::CIRCUIT_DWELL_MAX_MS));
            return false;
        }
        circuitMinOnMs = minOnMs;
        circuitMinOffMs = minOffMs;
        LOG_INFO(TAG, "Set circuit dwell on/off to %lu/%lu ms",
                 static_cast<unsigned long>(minOnMs), static_cast<unsigned long>(minOffMs));
        return true;
    }

    void setBoilerOfflineCirculation(bool enabled) {
        boilerOfflineCirculation = enabled;
        LOG_INFO(TAG, "Boiler offline circulation %s", enabled ? "enabled" : "disabled");
    }
}
