/**
 * @file test_sensor_gate.cpp
 * @brief Unit tests for SensorGate staleness and validation
 *
 * Test functions are declared in test_main.cpp and run as part of the test suite.
 */

#include <unity.h>
#include <cmath>
#include "modules/control/SensorGate.h"
#include "config/ClimateConfig.h"

static SensorGate::Reading makeReading(float t, uint32_t at) {
    SensorGate::Reading r;
    r.temperature = t;
    r.valid = true;
    r.timestamp = at;
    return r;
}

void test_sensor_gate_initial_state() {
    SensorGate gate("living", 0);
    TEST_ASSERT_FALSE(gate.hasFault());
    TEST_ASSERT_FALSE(gate.hasReading());
    TEST_ASSERT_TRUE(std::isnan(gate.getLastValue()));
    TEST_ASSERT_FALSE(gate.tick(4000));
    TEST_ASSERT_FALSE(gate.hasFault());
}

void test_sensor_gate_stale_before_first_reading() {
    SensorGate gate("living", 1000);
    TEST_ASSERT_FALSE(gate.tick(6000));     // exactly 5 s is still fresh
    TEST_ASSERT_TRUE(gate.tick(6001));
    TEST_ASSERT_TRUE(gate.hasFault());
    TEST_ASSERT_EQUAL(SystemError::SENSOR_STALE, gate.getFaultCause());
}

void test_sensor_gate_stale_after_six_seconds() {
    SensorGate gate("living", 0);
    TEST_ASSERT_TRUE(gate.onReading(makeReading(20.5f, 1000)).isSuccess());
    TEST_ASSERT_FALSE(gate.tick(5000));
    TEST_ASSERT_FALSE(gate.hasFault());

    TEST_ASSERT_TRUE(gate.tick(7000));
    TEST_ASSERT_TRUE(gate.hasFault());
    TEST_ASSERT_EQUAL_FLOAT(20.5f, gate.getLastValue());
}

void test_sensor_gate_fault_edge_only() {
    SensorGate gate("living", 0);
    TEST_ASSERT_TRUE(gate.tick(10000));
    TEST_ASSERT_FALSE(gate.tick(11000));
    TEST_ASSERT_FALSE(gate.tick(12000));
    TEST_ASSERT_TRUE(gate.hasFault());
}

void test_sensor_gate_valid_reading_clears_fault() {
    SensorGate gate("living", 0);
    gate.tick(10000);
    TEST_ASSERT_TRUE(gate.hasFault());

    TEST_ASSERT_TRUE(gate.onReading(makeReading(19.0f, 10500)).isSuccess());
    TEST_ASSERT_FALSE(gate.hasFault());
    TEST_ASSERT_EQUAL(SystemError::SUCCESS, gate.getFaultCause());
    TEST_ASSERT_EQUAL_UINT32(10500, gate.getLastReadingAt());
    TEST_ASSERT_FALSE(gate.tick(11000));
}

void test_sensor_gate_unavailable_raises_immediately() {
    SensorGate gate("living", 0);
    gate.onReading(makeReading(21.0f, 100));

    SensorGate::Reading r = makeReading(21.0f, 200);
    r.valid = false;
    Result<void> result = gate.onReading(r);

    TEST_ASSERT_TRUE(result.isError());
    TEST_ASSERT_EQUAL(SystemError::SENSOR_UNAVAILABLE, result.error());
    TEST_ASSERT_TRUE(gate.hasFault());
    TEST_ASSERT_EQUAL(SystemError::SENSOR_UNAVAILABLE, gate.getFaultCause());

    // Staying unavailable keeps the fault even with a recent timestamp
    TEST_ASSERT_FALSE(gate.tick(300));
    TEST_ASSERT_TRUE(gate.hasFault());
}

void test_sensor_gate_rejects_implausible_values() {
    SensorGate gate("living", 0);
    gate.onReading(makeReading(21.0f, 100));

    Result<void> high = gate.onReading(makeReading(200.0f, 200));
    TEST_ASSERT_EQUAL(SystemError::SENSOR_OUT_OF_RANGE, high.error());
    TEST_ASSERT_TRUE(gate.hasFault());
    TEST_ASSERT_EQUAL_FLOAT(21.0f, gate.getLastValue());

    Result<void> nan = gate.onReading(makeReading(NAN, 300));
    TEST_ASSERT_EQUAL(SystemError::SENSOR_INVALID_DATA, nan.error());
    TEST_ASSERT_EQUAL_FLOAT(21.0f, gate.getLastValue());

    TEST_ASSERT_TRUE(gate.onReading(makeReading(21.2f, 400)).isSuccess());
    TEST_ASSERT_FALSE(gate.hasFault());
}

void test_sensor_gate_respects_configured_timeout() {
    TEST_ASSERT_TRUE(ClimateConfig::setSensorStale(10000));
    SensorGate gate("living", 0);
    gate.onReading(makeReading(20.0f, 0));
    TEST_ASSERT_FALSE(gate.tick(9000));
    TEST_ASSERT_TRUE(gate.tick(10001));
}
