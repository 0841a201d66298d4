#ifndef PID_REGULATOR_H
#define PID_REGULATOR_H

#include <cstdint>
#include "shared/ClimateTypes.h"

/**
 * @brief PI control law with clamped integral and conditional integration
 *
 * Output is normalized heat demand in [0,1]:
 *   output = clamp(Kp*error + Ki*integral, 0, 1)
 * The integral accumulates error*dt (°C·s) clamped to +-ClimateConfig::pidIntegralLimit
 * and is only advanced when the resulting raw output stays inside [0,1].
 */
class PidRegulator {
public:
    struct Step {
        float output;       // clamped demand
        float pTerm;
        float iTerm;
        bool finite;        // false if the computation produced NaN/Inf
    };

    PidRegulator();

    PidRegulator(const PidRegulator&) = delete;
    PidRegulator& operator=(const PidRegulator&) = delete;

    /**
     * @brief Compute one control step
     *
     * @param target Set point in °C
     * @param current Measured temperature in °C
     * @param gains Kp/Ki
     * @param dtSeconds Time since the previous integrating step; 0 recomputes
     *        the output without touching the integral
     */
    Step calculate(float target, float current, const PidGains& gains, float dtSeconds);

    /**
     * @brief Keep Ki*integral unchanged across a Ki change (bumpless transfer)
     *
     * The result is clamped to the integral limit. No-op if either gain is 0.
     */
    void rescaleIntegral(float oldKi, float newKi);

    /**
     * @brief P-term only, for telemetry while regulation is suspended
     */
    static float proportional(float target, float current, const PidGains& gains);

    void reset() { integral = 0.0f; }

    float getIntegral() const { return integral; }

#ifdef UNIT_TEST
    void setIntegralForTesting(float value) { integral = value; }
#endif

private:
    float integral;
};

#endif // PID_REGULATOR_H
