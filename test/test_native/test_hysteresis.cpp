/**
 * @file test_hysteresis.cpp
 * @brief Unit tests for the on/off control law
 *
 * Test functions are declared in test_main.cpp and run as part of the test suite.
 */

#include <unity.h>
#include "modules/control/HysteresisRegulator.h"

void test_hysteresis_heats_below_band() {
    TEST_ASSERT_EQUAL_FLOAT(1.0f, HysteresisRegulator::calculate(21.0f, 20.4f, 0.5f, 0.0f));
}

void test_hysteresis_holds_inside_band() {
    TEST_ASSERT_EQUAL_FLOAT(1.0f, HysteresisRegulator::calculate(21.0f, 21.4f, 0.5f, 1.0f));
    TEST_ASSERT_EQUAL_FLOAT(0.0f, HysteresisRegulator::calculate(21.0f, 20.6f, 0.5f, 0.0f));
    // Band edges are inside the band
    TEST_ASSERT_EQUAL_FLOAT(0.0f, HysteresisRegulator::calculate(21.0f, 20.5f, 0.5f, 0.0f));
    TEST_ASSERT_EQUAL_FLOAT(1.0f, HysteresisRegulator::calculate(21.0f, 21.5f, 0.5f, 1.0f));
}

void test_hysteresis_stops_above_band() {
    TEST_ASSERT_EQUAL_FLOAT(0.0f, HysteresisRegulator::calculate(21.0f, 21.6f, 0.5f, 1.0f));
}

void test_hysteresis_rising_sequence() {
    float output = 0.0f;
    output = HysteresisRegulator::calculate(21.0f, 20.4f, 0.5f, output);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, output);
    output = HysteresisRegulator::calculate(21.0f, 21.4f, 0.5f, output);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, output);
    output = HysteresisRegulator::calculate(21.0f, 21.6f, 0.5f, output);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, output);
    output = HysteresisRegulator::calculate(21.0f, 20.8f, 0.5f, output);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, output);
}
