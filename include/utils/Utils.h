#ifndef UTILS_H
#define UTILS_H

#include <cstdint>
#include <cmath>

// Namespace for utility functions
namespace Utils {

    inline float roundF(float value, uint8_t precision) {
        float pow10 = std::pow(10.0f, precision);
        return std::round(value * pow10) / pow10;
    }

    inline float clampF(float value, float lo, float hi) {
        return value < lo ? lo : (value > hi ? hi : value);
    }

    /**
     * @brief Calculate elapsed time since a start time, handling counter overflow
     *
     * The millisecond clock wraps after ~49.7 days (2^32 milliseconds).
     * Simple subtraction (now - start) handles the wrap correctly due to
     * unsigned integer wraparound behavior in C/C++.
     *
     * Example: If start=0xFFFFFFF0 and now=0x00000010,
     *          now - start = 0x00000020 (32 ms elapsed) - correct!
     *
     * @param nowMs Current time in milliseconds
     * @param startTime The start time captured earlier from the same clock
     * @return Elapsed time in milliseconds (always positive, max ~49.7 days)
     */
    inline uint32_t elapsedMs(uint32_t nowMs, uint32_t startTime) {
        return nowMs - startTime;
    }

    /**
     * @brief Check if a timeout has elapsed since start time
     */
    inline bool hasTimedOut(uint32_t nowMs, uint32_t startTime, uint32_t timeoutMs) {
        return elapsedMs(nowMs, startTime) >= timeoutMs;
    }

}

#endif // UTILS_H
