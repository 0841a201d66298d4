// include/config/ClimateConstants.h
#ifndef CLIMATE_CONSTANTS_H
#define CLIMATE_CONSTANTS_H

#include <cstdint>
#include <cstddef>

/**
 * @brief Compile-time constants for the zone/circuit/hub control engine
 *
 * Runtime-tunable values live in ClimateConfig; the ones here are fixed
 * properties of the control law and of the data model.
 */
namespace ClimateConstants {

    namespace Timing {
        constexpr uint32_t TICK_PERIOD_MS = 1000;        // Scheduler tick
    }

    namespace Sensor {
        // Plausibility window for room temperature readings
        constexpr float MIN_VALID_TEMP_C = -50.0f;
        constexpr float MAX_VALID_TEMP_C = 150.0f;
    }

    namespace PID {
        constexpr float DEFAULT_KP = 0.5f;
        constexpr float DEFAULT_KI = 0.001f;
        constexpr float OUTPUT_MIN = 0.0f;
        constexpr float OUTPUT_MAX = 1.0f;

        constexpr float KP_MIN = 0.0f;
        constexpr float KP_MAX = 100.0f;
        constexpr float KI_MIN = 0.0f;
        constexpr float KI_MAX = 10.0f;
    }

    namespace Hysteresis {
        constexpr float DEFAULT_DEADBAND = 0.5f;     // Half-width of the band, °C
        constexpr float MIN_DEADBAND = 0.0f;
        constexpr float MAX_DEADBAND = 5.0f;
    }

    namespace Zone {
        constexpr float DEFAULT_TARGET_C = 22.0f;
        constexpr float MIN_TARGET_C = 5.0f;
        constexpr float MAX_TARGET_C = 35.0f;

        // Preset slots every zone starts with
        constexpr const char* PRESET_HOME = "home";
        constexpr const char* PRESET_SLEEP = "sleep";
        constexpr const char* PRESET_AWAY = "away";
        constexpr size_t MAX_PRESET_NAME_LEN = 32;
    }

    namespace Retry {
        constexpr uint32_t INITIAL_DELAY_MS = 1000;
        constexpr uint32_t BACKOFF_MULTIPLIER = 2;
        constexpr uint32_t MAX_DELAY_MS = 16000;
    }

    namespace Queue {
        constexpr size_t INPUT_QUEUE_LENGTH = 64;
        constexpr size_t NOTIFICATION_QUEUE_LENGTH = 128;
        constexpr uint32_t WARNING_THRESHOLD_PERCENT = 80;
    }

    namespace ErrorLogging {
        constexpr uint32_t RATE_LIMIT_INITIAL_INTERVAL_MS = 1000;
        constexpr uint32_t RATE_LIMIT_MAX_INTERVAL_MS = 60000;
        constexpr size_t RATE_LIMIT_SLOTS = 8;
    }
}

#endif // CLIMATE_CONSTANTS_H
