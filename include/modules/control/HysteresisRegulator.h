#ifndef HYSTERESIS_REGULATOR_H
#define HYSTERESIS_REGULATOR_H

/**
 * @brief On/off control with a dead zone of +-deadband around the target
 */
class HysteresisRegulator {
public:
    /**
     * @return 1 below target-deadband, 0 above target+deadband,
     *         previousOutput inside the band
     */
    static float calculate(float target, float current, float deadband, float previousOutput) {
        if (current < target - deadband) {
            return 1.0f;
        }
        if (current > target + deadband) {
            return 0.0f;
        }
        return previousOutput;
    }
};

#endif // HYSTERESIS_REGULATOR_H
