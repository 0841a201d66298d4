/**
 * @file test_zone_regulator.cpp
 * @brief Unit tests for ZoneRegulator state machine and commands
 *
 * Test functions are declared in test_main.cpp and run as part of the test suite.
 */

#include <unity.h>
#include <cmath>
#include <vector>
#include "modules/control/ZoneRegulator.h"
#include "config/ClimateConfig.h"
#include "mocks/MockHeatActuator.h"

namespace {
    ZoneConfig pidConfig(const char* id, float target, float kp, float ki) {
        ZoneConfig cfg;
        cfg.id = id;
        cfg.kind = RegulatorKind::PID;
        cfg.target = target;
        cfg.gains = {kp, ki};
        return cfg;
    }

    ZoneConfig hysteresisConfig(const char* id, float target, float deadband) {
        ZoneConfig cfg;
        cfg.id = id;
        cfg.kind = RegulatorKind::HYSTERESIS;
        cfg.target = target;
        cfg.deadband = deadband;
        return cfg;
    }

    ZoneRegulator::Reading reading(float t, uint32_t at) {
        ZoneRegulator::Reading r;
        r.temperature = t;
        r.valid = true;
        r.timestamp = at;
        return r;
    }

    size_t countOf(const std::vector<ClimateNotification>& log, NotificationType type) {
        size_t n = 0;
        for (const auto& entry : log) {
            if (entry.type == type) {
                n++;
            }
        }
        return n;
    }
}

void test_zone_idle_until_first_reading() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);

    TEST_ASSERT_EQUAL(ZoneControlState::IDLE, zone.getState());
    TEST_ASSERT_EQUAL_FLOAT(0.0f, zone.getOutput());
    TEST_ASSERT_TRUE(std::isnan(zone.getCurrentTemperature()));
    TEST_ASSERT_EQUAL_STRING("home", zone.getActivePreset().c_str());
    TEST_ASSERT_EQUAL(3, presets.listPresets("living").size());
}

void test_zone_pid_unit_error_full_output() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);

    Result<ZoneStatus> result = zone.onReading(reading(20.0f, 100), 100);
    TEST_ASSERT_TRUE(result.isSuccess());
    TEST_ASSERT_EQUAL(ZoneControlState::REGULATING, result.value().state);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, result.value().output);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, result.value().pTerm);
    TEST_ASSERT_TRUE(result.value().regulatorActive);
}

void test_zone_hysteresis_band_sequence() {
    PresetStore presets;
    ZoneRegulator zone(hysteresisConfig("bath", 21.0f, 0.5f), presets, 0);

    TEST_ASSERT_EQUAL_FLOAT(1.0f, zone.onReading(reading(20.4f, 100), 100).value().output);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, zone.onReading(reading(21.4f, 200), 200).value().output);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, zone.onReading(reading(21.6f, 300), 300).value().output);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, zone.onReading(reading(20.9f, 400), 400).value().output);
}

void test_zone_stale_sensor_faults_and_recovers() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);
    std::vector<ClimateNotification> log;
    zone.setNotificationSink([&log](const ClimateNotification& n) { log.push_back(n); });

    zone.onReading(reading(20.0f, 0), 0);
    zone.tick(1000);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, zone.getOutput());

    zone.tick(6000);
    TEST_ASSERT_TRUE(zone.hasSensorFault());
    TEST_ASSERT_EQUAL(ZoneControlState::FAULTED, zone.getState());
    TEST_ASSERT_EQUAL_FLOAT(0.0f, zone.getOutput());
    TEST_ASSERT_EQUAL(1, countOf(log, NotificationType::SENSOR_FAULT_CHANGED));

    // Fault stays latched until a fresh reading
    zone.tick(7000);
    TEST_ASSERT_TRUE(zone.hasSensorFault());
    TEST_ASSERT_EQUAL(1, countOf(log, NotificationType::SENSOR_FAULT_CHANGED));

    Result<ZoneStatus> result = zone.onReading(reading(20.0f, 7500), 7500);
    TEST_ASSERT_FALSE(result.value().sensorFault);
    TEST_ASSERT_EQUAL(ZoneControlState::REGULATING, result.value().state);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, result.value().output);
    TEST_ASSERT_EQUAL(2, countOf(log, NotificationType::SENSOR_FAULT_CHANGED));
}

void test_zone_sensor_unavailable_faults_immediately() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);
    zone.onReading(reading(20.0f, 100), 100);

    Result<ZoneStatus> result = zone.onSensorUnavailable(200);
    TEST_ASSERT_TRUE(result.isSuccess());
    TEST_ASSERT_TRUE(result.value().sensorFault);
    TEST_ASSERT_EQUAL(ZoneControlState::FAULTED, result.value().state);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, result.value().output);
}

void test_zone_window_open_freezes_integral() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 0.1f, 0.01f), presets, 0);

    zone.onReading(reading(20.0f, 0), 0);
    zone.onReading(reading(20.0f, 4000), 4000);
    zone.tick(5000);
    float integralBefore = zone.getIntegral();
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 5.0f, integralBefore);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.15f, zone.getOutput());

    Result<ZoneStatus> opened = zone.setWindowOpen(true, 5500);
    TEST_ASSERT_EQUAL(ZoneControlState::WINDOW_PAUSED, opened.value().state);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, opened.value().output);
    TEST_ASSERT_EQUAL_FLOAT(integralBefore, opened.value().integral);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.1f, opened.value().pTerm);
    TEST_ASSERT_TRUE(opened.value().windowOpen);

    zone.onReading(reading(20.0f, 5800), 5800);
    zone.tick(6000);
    TEST_ASSERT_EQUAL_FLOAT(integralBefore, zone.getIntegral());
    TEST_ASSERT_EQUAL_FLOAT(0.0f, zone.getOutput());

    Result<ZoneStatus> closed = zone.setWindowOpen(false, 6500);
    TEST_ASSERT_EQUAL(ZoneControlState::REGULATING, closed.value().state);
    TEST_ASSERT_EQUAL_FLOAT(integralBefore, closed.value().integral);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.15f, closed.value().output);
}

void test_zone_window_warmup_keeps_paused() {
    TEST_ASSERT_TRUE(ClimateConfig::setWindowWarmup(10000));
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);
    zone.onReading(reading(20.0f, 0), 0);

    zone.setWindowOpen(true, 1000);
    zone.setWindowOpen(false, 2000);
    TEST_ASSERT_EQUAL(ZoneControlState::WINDOW_PAUSED, zone.getState());
    TEST_ASSERT_EQUAL_FLOAT(0.0f, zone.getOutput());

    zone.onReading(reading(20.0f, 11000), 11000);
    zone.tick(12000);
    TEST_ASSERT_EQUAL(ZoneControlState::REGULATING, zone.getState());
    TEST_ASSERT_EQUAL_FLOAT(1.0f, zone.getOutput());
}

void test_zone_mode_off_resets_integral() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 0.1f, 0.01f), presets, 0);
    zone.onReading(reading(20.0f, 0), 0);
    zone.tick(5000);
    TEST_ASSERT_TRUE(zone.getIntegral() > 0.0f);

    Result<ZoneStatus> off = zone.setMode(ZoneMode::OFF, 5100);
    TEST_ASSERT_EQUAL(ZoneControlState::IDLE, off.value().state);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, off.value().output);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, off.value().integral);

    Result<ZoneStatus> heat = zone.setMode(ZoneMode::HEAT, 5200);
    TEST_ASSERT_EQUAL(ZoneControlState::REGULATING, heat.value().state);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.1f, heat.value().output);
}

void test_zone_rejects_out_of_range_target() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);

    Result<ZoneStatus> result = zone.setTarget(50.0f, 100);
    TEST_ASSERT_TRUE(result.isError());
    TEST_ASSERT_EQUAL(SystemError::INVALID_PARAMETER, result.error());
    TEST_ASSERT_EQUAL_FLOAT(21.0f, zone.getTarget());

    TEST_ASSERT_TRUE(zone.setTarget(NAN, 100).isError());
    TEST_ASSERT_TRUE(zone.setTarget(19.5f, 100).isSuccess());
    TEST_ASSERT_EQUAL_FLOAT(19.5f, zone.getTarget());
}

void test_zone_gains_on_hysteresis_is_mismatch() {
    PresetStore presets;
    ZoneRegulator zone(hysteresisConfig("bath", 21.0f, 0.5f), presets, 0);

    Result<ZoneStatus> result = zone.setGains(1.0f, 0.1f, 100);
    TEST_ASSERT_EQUAL(SystemError::CONFIG_MISMATCH, result.error());
    TEST_ASSERT_TRUE(zone.setDeadband(1.0f, 100).isSuccess());
    TEST_ASSERT_EQUAL_FLOAT(1.0f, zone.getStatus().deadband);
}

void test_zone_deadband_on_pid_is_mismatch() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);

    TEST_ASSERT_EQUAL(SystemError::CONFIG_MISMATCH, zone.setDeadband(1.0f, 100).error());
    TEST_ASSERT_EQUAL(SystemError::INVALID_PARAMETER, zone.setGains(-1.0f, 0.0f, 100).error());

    Result<ZoneStatus> ok = zone.setGains(2.0f, 0.05f, 100);
    TEST_ASSERT_TRUE(ok.isSuccess());
    TEST_ASSERT_EQUAL_FLOAT(2.0f, ok.value().gains.kp);
    TEST_ASSERT_EQUAL_FLOAT(0.05f, ok.value().gains.ki);
}

void test_zone_activate_preset_keeps_integral() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 0.1f, 0.01f), presets, 0);
    zone.onReading(reading(20.0f, 0), 0);
    zone.setIntegralForTesting(3.0f);

    Preset sleep;
    sleep.name = "sleep";
    sleep.kind = RegulatorKind::PID;
    sleep.mode = ZoneMode::HEAT;
    sleep.target = 18.0f;
    sleep.gains = {0.8f, 0.002f};
    TEST_ASSERT_TRUE(presets.definePreset("living", sleep).isSuccess());

    Result<ZoneStatus> result = zone.activatePreset("sleep", 100);
    TEST_ASSERT_TRUE(result.isSuccess());
    TEST_ASSERT_EQUAL_FLOAT(18.0f, result.value().target);
    TEST_ASSERT_EQUAL_FLOAT(0.8f, result.value().gains.kp);
    TEST_ASSERT_EQUAL_FLOAT(3.0f, result.value().integral);
    TEST_ASSERT_EQUAL_STRING("sleep", result.value().activePreset.c_str());
}

void test_zone_activate_unknown_preset_fails() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);

    Result<ZoneStatus> result = zone.activatePreset("party", 100);
    TEST_ASSERT_EQUAL(SystemError::PRESET_NOT_FOUND, result.error());
    TEST_ASSERT_EQUAL_FLOAT(21.0f, zone.getTarget());
    TEST_ASSERT_EQUAL_STRING("home", zone.getActivePreset().c_str());
}

void test_zone_activate_preset_of_other_kind_fails() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);

    Preset foreign;
    foreign.name = "eco";
    foreign.kind = RegulatorKind::HYSTERESIS;
    foreign.target = 17.0f;
    foreign.deadband = 1.0f;
    TEST_ASSERT_TRUE(presets.definePreset("living", foreign).isSuccess());

    TEST_ASSERT_EQUAL(SystemError::CONFIG_MISMATCH, zone.activatePreset("eco", 100).error());
    TEST_ASSERT_EQUAL_FLOAT(21.0f, zone.getTarget());
}

void test_zone_preset_with_mode_off() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 0.1f, 0.01f), presets, 0);
    zone.onReading(reading(20.0f, 0), 0);
    zone.setIntegralForTesting(3.0f);

    Preset away;
    away.name = "away";
    away.kind = RegulatorKind::PID;
    away.mode = ZoneMode::OFF;
    away.target = 16.0f;
    away.gains = {0.1f, 0.01f};
    presets.definePreset("living", away);

    Result<ZoneStatus> result = zone.activatePreset("away", 100);
    TEST_ASSERT_EQUAL(ZoneMode::OFF, result.value().mode);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, result.value().integral);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, result.value().output);
}

void test_zone_save_preset_captures_live_values() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);
    zone.setTarget(23.0f, 100);
    zone.setGains(0.7f, 0.003f, 100);

    TEST_ASSERT_TRUE(zone.savePreset("home").isSuccess());
    Result<Preset> stored = presets.get("living", "home");
    TEST_ASSERT_EQUAL_FLOAT(23.0f, stored.value().target);
    TEST_ASSERT_EQUAL_FLOAT(0.7f, stored.value().gains.kp);

    TEST_ASSERT_EQUAL(SystemError::PRESET_NOT_FOUND, zone.savePreset("party").error());
}

void test_zone_control_fault_recovers_next_tick() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);
    std::vector<ClimateNotification> log;
    zone.setNotificationSink([&log](const ClimateNotification& n) { log.push_back(n); });
    zone.onReading(reading(20.0f, 0), 0);

    zone.setIntegralForTesting(NAN);
    zone.tick(1000);
    TEST_ASSERT_TRUE(zone.hasControlFault());
    TEST_ASSERT_EQUAL_FLOAT(0.0f, zone.getOutput());
    TEST_ASSERT_EQUAL_FLOAT(0.0f, zone.getIntegral());

    zone.tick(2000);
    TEST_ASSERT_FALSE(zone.hasControlFault());
    TEST_ASSERT_EQUAL_FLOAT(1.0f, zone.getOutput());
    TEST_ASSERT_EQUAL(2, countOf(log, NotificationType::CONTROL_FAULT_CHANGED));
}

void test_zone_global_pause_forces_zero() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 0.1f, 0.01f), presets, 0);
    zone.onReading(reading(20.0f, 0), 0);
    zone.tick(1000);
    float integral = zone.getIntegral();

    zone.setGlobalPause(true, 1500);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, zone.getOutput());
    TEST_ASSERT_EQUAL(ZoneControlState::REGULATING, zone.getState());
    TEST_ASSERT_FALSE(zone.isRegulatorActive());

    zone.tick(2000);
    TEST_ASSERT_EQUAL_FLOAT(integral, zone.getIntegral());

    zone.setGlobalPause(false, 2500);
    TEST_ASSERT_TRUE(zone.isRegulatorActive());
    TEST_ASSERT_TRUE(zone.getOutput() > 0.0f);
}

void test_zone_drives_trvs() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);
    MockHeatActuator trv("trv-1");
    zone.attachTrv(&trv);
    zone.attachTrv(&trv);
    TEST_ASSERT_EQUAL(1, zone.getTrvCount());

    zone.onReading(reading(20.0f, 100), 100);
    TEST_ASSERT_TRUE(trv.isHeating());

    zone.onReading(reading(22.0f, 200), 200);
    TEST_ASSERT_FALSE(trv.isHeating());

    // Open window leaves the valve where it is
    zone.onReading(reading(20.0f, 300), 300);
    TEST_ASSERT_TRUE(trv.isHeating());
    zone.setWindowOpen(true, 400);
    TEST_ASSERT_TRUE(trv.isHeating());

    zone.detachTrv(&trv);
    TEST_ASSERT_EQUAL(0, zone.getTrvCount());
}

void test_zone_trv_retry_backoff() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);
    MockHeatActuator trv("trv-1");
    zone.attachTrv(&trv);
    zone.onReading(reading(20.0f, 0), 0);
    TEST_ASSERT_TRUE(trv.isHeating());

    trv.setAccept(false);
    trv.resetCounts();
    zone.onReading(reading(22.0f, 100), 100);
    TEST_ASSERT_EQUAL(1, trv.getCommandCount());

    zone.onReading(reading(22.0f, 600), 600);
    TEST_ASSERT_EQUAL(1, trv.getCommandCount());     // backing off for 1 s

    zone.onReading(reading(22.0f, 1100), 1100);
    TEST_ASSERT_EQUAL(2, trv.getCommandCount());

    trv.setAccept(true);
    zone.onReading(reading(22.0f, 3100), 3100);
    TEST_ASSERT_EQUAL(3, trv.getCommandCount());
    TEST_ASSERT_FALSE(trv.isHeating());
}

void test_zone_circulation_override_opens_trvs() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);
    MockHeatActuator trv("trv-1");
    zone.attachTrv(&trv);
    zone.onReading(reading(22.0f, 100), 100);
    TEST_ASSERT_FALSE(trv.isHeating());

    zone.setCirculationOverride(true, 200);
    TEST_ASSERT_TRUE(trv.isHeating());
    TEST_ASSERT_EQUAL_FLOAT(0.0f, zone.getOutput());

    zone.setCirculationOverride(false, 300);
    TEST_ASSERT_FALSE(trv.isHeating());
}

void test_zone_notifies_state_and_output_changes() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);
    std::vector<ClimateNotification> log;
    zone.setNotificationSink([&log](const ClimateNotification& n) { log.push_back(n); });

    zone.onReading(reading(20.0f, 100), 100);
    TEST_ASSERT_EQUAL(1, countOf(log, NotificationType::ZONE_STATE_CHANGED));
    TEST_ASSERT_EQUAL(1, countOf(log, NotificationType::ZONE_OUTPUT_CHANGED));

    // Same output again: no new notification
    zone.onReading(reading(20.0f, 200), 200);
    TEST_ASSERT_EQUAL(1, countOf(log, NotificationType::ZONE_OUTPUT_CHANGED));
    TEST_ASSERT_EQUAL_STRING("living", log.back().sourceId.c_str());
}

void test_zone_config_validation() {
    ZoneConfig cfg = pidConfig("", 21.0f, 1.0f, 0.0f);
    TEST_ASSERT_TRUE(ZoneRegulator::validateConfig(cfg).isError());

    cfg = pidConfig("living", 40.0f, 1.0f, 0.0f);
    TEST_ASSERT_EQUAL(SystemError::INVALID_PARAMETER, ZoneRegulator::validateConfig(cfg).error());

    cfg = hysteresisConfig("bath", 21.0f, 9.0f);
    TEST_ASSERT_TRUE(ZoneRegulator::validateConfig(cfg).isError());

    cfg = hysteresisConfig("bath", 21.0f, 0.3f);
    TEST_ASSERT_TRUE(ZoneRegulator::validateConfig(cfg).isSuccess());
}

void test_zone_late_reading_keeps_warmup_pause() {
    TEST_ASSERT_TRUE(ClimateConfig::setWindowWarmup(600000));
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);
    zone.onReading(reading(20.0f, 99000), 99000);
    TEST_ASSERT_EQUAL(ZoneControlState::REGULATING, zone.getState());

    zone.setWindowOpen(true, 99200);
    zone.setWindowOpen(false, 100000);
    TEST_ASSERT_EQUAL(ZoneControlState::WINDOW_PAUSED, zone.getState());

    // Observed before the window closed, delivered after
    Result<ZoneStatus> status = zone.onReading(reading(20.0f, 99500), 100000);
    TEST_ASSERT_EQUAL(ZoneControlState::WINDOW_PAUSED, status.value().state);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, status.value().output);

    zone.tick(101000);
    TEST_ASSERT_EQUAL(ZoneControlState::WINDOW_PAUSED, zone.getState());

    zone.onReading(reading(20.0f, 700000), 700000);
    TEST_ASSERT_EQUAL(ZoneControlState::REGULATING, zone.getState());
    TEST_ASSERT_EQUAL_FLOAT(1.0f, zone.getOutput());
}

void test_zone_late_reading_respects_trv_backoff() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 1.0f, 0.0f), presets, 0);
    MockHeatActuator trv("trv-1");
    zone.attachTrv(&trv);
    zone.onReading(reading(20.0f, 500), 500);
    TEST_ASSERT_TRUE(trv.isHeating());

    trv.setAccept(false);
    trv.resetCounts();
    zone.setTarget(19.0f, 1000);
    TEST_ASSERT_EQUAL(1, trv.getCommandCount());

    zone.onReading(reading(20.0f, 800), 1200);
    TEST_ASSERT_EQUAL(1, trv.getCommandCount());     // still inside the 1 s backoff

    zone.onReading(reading(20.0f, 1900), 2000);
    TEST_ASSERT_EQUAL(2, trv.getCommandCount());
}

void test_zone_gain_change_keeps_integral_term() {
    PresetStore presets;
    ZoneRegulator zone(pidConfig("living", 21.0f, 0.1f, 0.001f), presets, 0);
    zone.onReading(reading(25.0f, 0), 0);
    zone.setIntegralForTesting(950.0f);

    Result<ZoneStatus> status = zone.setGains(0.1f, 0.01f, 100);
    TEST_ASSERT_TRUE(status.isSuccess());
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 95.0f, status.value().integral);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.55f, status.value().output);

    // Inside the actuator range the integral unwinds again
    zone.tick(1000);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 91.0f, zone.getIntegral());
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.51f, zone.getOutput());
}
