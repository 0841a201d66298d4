// include/hal/HardwareAbstractionLayer.h
#pragma once

#include <cstdint>

/**
 * @brief Hardware Abstraction Layer for the climate control engine
 *
 * The regulators and aggregators only see these capabilities, never a
 * concrete device type. Drivers for physical relays, valves and sensors
 * live in the host and implement the device-level interfaces below.
 */

namespace HAL {

/**
 * @brief Source of room temperature readings
 */
class ITemperatureSource {
public:
    struct Reading {
        float temperature;    // Temperature in Celsius
        bool valid;          // false if the sensor reports unavailable
        uint32_t timestamp;  // Observation time in milliseconds
    };

    virtual ~ITemperatureSource() = default;

    /**
     * @brief Read the latest temperature
     * @param nowMs Current time, used as timestamp by sources without their own clock
     */
    virtual Reading readTemperature(uint32_t nowMs) = 0;

    virtual const char* getName() const = 0;
};

/**
 * @brief Binary input (window contact, boiler online status, ...)
 */
class IBinaryState {
public:
    virtual ~IBinaryState() = default;

    /**
     * @brief true if the input currently reports a usable state
     */
    virtual bool isAvailable() const = 0;

    virtual bool getState() const = 0;

    virtual const char* getName() const = 0;
};

/**
 * @brief Anything that can be told to heat or stop heating
 *
 * Commands are fire-and-forget; the return value only reports whether the
 * command was accepted by the device.
 */
class IHeatActuator {
public:
    virtual ~IHeatActuator() = default;

    /**
     * @brief Request heating on or off
     * @return true if the device accepted the command
     */
    virtual bool applyDemand(bool heat) = 0;

    virtual const char* getName() const = 0;
};

/**
 * @brief Relay module interface
 */
class IRelay {
public:
    enum class State {
        OFF = 0,
        ON = 1,
        UNKNOWN = 2
    };

    virtual ~IRelay() = default;

    /**
     * @brief Set relay state
     * @param channel Relay channel
     * @param state Desired state
     * @return true if successful
     */
    virtual bool setState(uint8_t channel, State state) = 0;

    virtual State getState(uint8_t channel) const = 0;

    virtual uint8_t getChannelCount() const = 0;

    virtual const char* getName() const = 0;
};

/**
 * @brief Thermostatic radiator valve / climate device
 */
class IThermostaticValve {
public:
    enum class Mode {
        OFF = 0,
        HEAT = 1
    };

    virtual ~IThermostaticValve() = default;

    virtual bool setMode(Mode mode) = 0;

    virtual Mode getMode() const = 0;

    virtual const char* getName() const = 0;
};

} // namespace HAL
