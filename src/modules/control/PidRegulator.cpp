#include "modules/control/PidRegulator.h"
#include "config/ClimateConfig.h"
#include "config/ClimateConstants.h"
#include "utils/Utils.h"
#include <cmath>

PidRegulator::PidRegulator()
    : integral(0.0f) {
}

float PidRegulator::proportional(float target, float current, const PidGains& gains) {
    return gains.kp * (target - current);
}

PidRegulator::Step PidRegulator::calculate(float target, float current, const PidGains& gains,
                                           float dtSeconds) {
    Step step = {0.0f, 0.0f, 0.0f, false};

    // A corrupted integral cannot recover by itself; drop it and report the fault
    if (!std::isfinite(integral)) {
        integral = 0.0f;
        return step;
    }

    float error = target - current;
    float P = gains.kp * error;

    // Conditional integration: only commit the new integral if it keeps the
    // raw output inside the actuator range
    if (dtSeconds > 0.0f) {
        float limit = ClimateConfig::pidIntegralLimit;
        float candidate = Utils::clampF(integral + error * dtSeconds, -limit, limit);
        float raw = P + gains.ki * candidate;
        if (std::isfinite(raw) &&
            raw >= ClimateConstants::PID::OUTPUT_MIN &&
            raw <= ClimateConstants::PID::OUTPUT_MAX) {
            integral = candidate;
        }
    }

    float I = gains.ki * integral;
    float raw = P + I;

    step.pTerm = P;
    step.iTerm = I;
    step.finite = std::isfinite(raw);
    step.output = step.finite
        ? Utils::clampF(raw, ClimateConstants::PID::OUTPUT_MIN, ClimateConstants::PID::OUTPUT_MAX)
        : 0.0f;
    return step;
}

void PidRegulator::rescaleIntegral(float oldKi, float newKi) {
    if (oldKi <= 0.0f || newKi <= 0.0f || oldKi == newKi || !std::isfinite(integral)) {
        return;
    }
    float limit = ClimateConfig::pidIntegralLimit;
    integral = Utils::clampF(integral * (oldKi / newKi), -limit, limit);
}
