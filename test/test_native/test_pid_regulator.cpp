/**
 * @file test_pid_regulator.cpp
 * @brief Unit tests for the PI control law
 *
 * Test functions are declared in test_main.cpp and run as part of the test suite.
 */

#include <unity.h>
#include <cmath>
#include "modules/control/PidRegulator.h"
#include "config/ClimateConfig.h"

void test_pid_unit_error_full_output() {
    PidRegulator pid;
    PidGains gains = {1.0f, 0.0f};
    PidRegulator::Step step = pid.calculate(21.0f, 20.0f, gains, 0.0f);

    TEST_ASSERT_TRUE(step.finite);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, step.output);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, step.pTerm);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, step.iTerm);
}

void test_pid_output_clamped_to_zero() {
    PidRegulator pid;
    PidGains gains = {1.0f, 0.0f};
    PidRegulator::Step step = pid.calculate(20.0f, 22.0f, gains, 1.0f);

    TEST_ASSERT_EQUAL_FLOAT(0.0f, step.output);
    TEST_ASSERT_EQUAL_FLOAT(-2.0f, step.pTerm);
}

void test_pid_integral_accumulates() {
    PidRegulator pid;
    PidGains gains = {0.1f, 0.01f};

    PidRegulator::Step step = pid.calculate(21.0f, 20.0f, gains, 10.0f);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 10.0f, pid.getIntegral());
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.2f, step.output);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.1f, step.iTerm);

    step = pid.calculate(21.0f, 20.0f, gains, 10.0f);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 20.0f, pid.getIntegral());
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.3f, step.output);
}

void test_pid_freezes_integral_on_saturation() {
    PidRegulator pid;
    PidGains gains = {1.0f, 0.01f};

    // P alone already saturates: integrating would push raw above 1
    PidRegulator::Step step = pid.calculate(21.0f, 20.0f, gains, 10.0f);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, pid.getIntegral());
    TEST_ASSERT_EQUAL_FLOAT(1.0f, step.output);

    // Negative error with negative raw is frozen too
    step = pid.calculate(20.0f, 21.0f, gains, 10.0f);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, pid.getIntegral());
    TEST_ASSERT_EQUAL_FLOAT(0.0f, step.output);
}

void test_pid_integral_bounded_by_limit() {
    TEST_ASSERT_TRUE(ClimateConfig::setPIDIntegralLimit(5.0f));
    PidRegulator pid;
    PidGains gains = {0.01f, 0.01f};

    for (int i = 0; i < 10; i++) {
        pid.calculate(21.0f, 20.0f, gains, 100.0f);
        TEST_ASSERT_TRUE(std::fabs(pid.getIntegral()) <= 5.0f);
    }
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 5.0f, pid.getIntegral());
}

void test_pid_zero_dt_does_not_integrate() {
    PidRegulator pid;
    PidGains gains = {0.1f, 0.01f};
    PidRegulator::Step step = pid.calculate(21.0f, 20.0f, gains, 0.0f);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, pid.getIntegral());
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.1f, step.output);
}

void test_pid_rescale_keeps_integral_term() {
    PidRegulator pid;
    pid.setIntegralForTesting(950.0f);

    pid.rescaleIntegral(0.001f, 0.01f);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 95.0f, pid.getIntegral());

    // Clamped to the limit when Ki drops
    pid.rescaleIntegral(0.01f, 0.0001f);
    TEST_ASSERT_EQUAL_FLOAT(ClimateConfig::pidIntegralLimit, pid.getIntegral());

    // Ki of 0 leaves the integral alone
    pid.rescaleIntegral(0.01f, 0.0f);
    TEST_ASSERT_EQUAL_FLOAT(ClimateConfig::pidIntegralLimit, pid.getIntegral());
}

void test_pid_non_finite_integral_discarded() {
    PidRegulator pid;
    PidGains gains = {0.5f, 0.01f};
    pid.setIntegralForTesting(NAN);

    PidRegulator::Step step = pid.calculate(21.0f, 20.0f, gains, 1.0f);
    TEST_ASSERT_FALSE(step.finite);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, step.output);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, pid.getIntegral());

    step = pid.calculate(21.0f, 20.0f, gains, 0.0f);
    TEST_ASSERT_TRUE(step.finite);
    TEST_ASSERT_EQUAL_FLOAT(0.5f, step.output);
}

void test_pid_proportional_only_helper() {
    PidGains gains = {2.0f, 0.5f};
    TEST_ASSERT_EQUAL_FLOAT(3.0f, PidRegulator::proportional(21.5f, 20.0f, gains));
    TEST_ASSERT_EQUAL_FLOAT(-1.0f, PidRegulator::proportional(20.0f, 20.5f, gains));
}
