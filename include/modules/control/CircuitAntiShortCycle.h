#pragma once

#include <cstdint>

/**
 * @brief Minimum on/off dwell for a circuit's shared switches
 *
 * Prevents rapid cycling of pumps and zone valves. Dwell times come from
 * ClimateConfig::circuitMinOnMs / circuitMinOffMs; both 0 disables the
 * protection. The first switch-on is never delayed.
 */
class CircuitAntiShortCycle {
public:
    CircuitAntiShortCycle();

    static bool isEnabled();

    /**
     * @brief Check if the switches can turn on
     * @return true if minimum off time has elapsed
     */
    bool canTurnOn(uint32_t nowMs) const;

    /**
     * @brief Check if the switches can turn off
     * @return true if minimum on time has elapsed
     */
    bool canTurnOff(uint32_t nowMs) const;

    void recordOn(uint32_t nowMs);
    void recordOff(uint32_t nowMs);

    /**
     * @brief Milliseconds until turning on is allowed, 0 if allowed now
     */
    uint32_t getTimeUntilCanTurnOn(uint32_t nowMs) const;

    /**
     * @brief Milliseconds until turning off is allowed, 0 if allowed now
     */
    uint32_t getTimeUntilCanTurnOff(uint32_t nowMs) const;

    bool isOn() const { return isOn_; }

private:
    bool isOn_;
    bool everOff_;
    uint32_t lastOnTime_;
    uint32_t lastOffTime_;

    static const char* TAG;
};
