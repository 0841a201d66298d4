#ifndef ZONE_REGULATOR_H
#define ZONE_REGULATOR_H

#include <cstdint>
#include <string>
#include <vector>
#include "config/ClimateConstants.h"
#include "events/ClimateEvents.h"
#include "hal/HardwareAbstractionLayer.h"
#include "modules/control/ActuatorCommander.h"
#include "modules/control/PidRegulator.h"
#include "modules/control/PresetStore.h"
#include "modules/control/SensorGate.h"
#include "modules/control/WindowTracker.h"
#include "shared/ClimateTypes.h"
#include "utils/ErrorHandler.h"
#include "utils/StateMachine.h"

/**
 * @brief Initial settings of a zone
 */
struct ZoneConfig {
    std::string id;
    RegulatorKind kind = RegulatorKind::PID;
    ZoneMode mode = ZoneMode::HEAT;
    float target = ClimateConstants::Zone::DEFAULT_TARGET_C;
    PidGains gains = {ClimateConstants::PID::DEFAULT_KP, ClimateConstants::PID::DEFAULT_KI};
    float deadband = ClimateConstants::Hysteresis::DEFAULT_DEADBAND;
};

/**
 * @brief One regulated heating zone
 *
 * States: IDLE (mode off or no reading yet), REGULATING, WINDOW_PAUSED
 * (window open or warming up after closing), FAULTED (sensor fault).
 * Output is forced to 0 in every state but REGULATING, and also while the
 * hub holds a global pause. The integral is frozen whenever the output is
 * not being regulated and is reset only by switching the mode to OFF.
 *
 * Commands recompute the output immediately without integrating; tick()
 * integrates over the time elapsed since the previous tick.
 */
class ZoneRegulator {
public:
    using Reading = SensorGate::Reading;

    ZoneRegulator(const ZoneConfig& config, PresetStore& presets, uint32_t nowMs);
    ~ZoneRegulator();

    ZoneRegulator(const ZoneRegulator&) = delete;
    ZoneRegulator& operator=(const ZoneRegulator&) = delete;

    static Result<void> validateConfig(const ZoneConfig& config);

    // Commands - each returns the updated status or the reason it was rejected
    Result<ZoneStatus> setTarget(float target, uint32_t nowMs);
    Result<ZoneStatus> setMode(ZoneMode mode, uint32_t nowMs);
    Result<ZoneStatus> setGains(float kp, float ki, uint32_t nowMs);
    Result<ZoneStatus> setDeadband(float deadband, uint32_t nowMs);
    Result<ZoneStatus> setWindowOpen(bool open, uint32_t nowMs);
    Result<ZoneStatus> activatePreset(const std::string& name, uint32_t nowMs);
    Result<ZoneStatus> savePreset(const std::string& name);

    // Inputs - sensor problems are absorbed into the fault flag, never rejected.
    // reading.timestamp is the observation time and only feeds the staleness
    // check; nowMs is the scheduler clock the zone re-evaluates at.
    Result<ZoneStatus> onReading(const Reading& reading, uint32_t nowMs);
    Result<ZoneStatus> onSensorUnavailable(uint32_t nowMs);

    /**
     * @brief Periodic step: staleness check, warm-up expiry, integration
     */
    void tick(uint32_t nowMs);

    /**
     * @brief Hub-wide suspension (boiler offline); integral frozen, output 0
     */
    void setGlobalPause(bool paused, uint32_t nowMs);

    /**
     * @brief Force attached TRVs open so residual heat can circulate
     */
    void setCirculationOverride(bool enabled, uint32_t nowMs);

    // Actuators and sources (non-owning, must outlive the zone or be detached)
    void attachTrv(HAL::IHeatActuator* trv);
    void detachTrv(HAL::IHeatActuator* trv);
    size_t getTrvCount() const { return trvs_.size(); }
    void bindTemperatureSource(HAL::ITemperatureSource* source) { source_ = source; }
    HAL::ITemperatureSource* getTemperatureSource() const { return source_; }
    void attachWindowSensor(HAL::IBinaryState* sensor);
    const std::vector<HAL::IBinaryState*>& getWindowSensors() const { return windowSensors_; }

    void setNotificationSink(NotificationSink sink) { sink_ = sink; }

    ZoneStatus getStatus() const;

    const std::string& getId() const { return id_; }
    RegulatorKind getKind() const { return kind_; }
    ZoneMode getMode() const { return mode_; }
    ZoneControlState getState() const { return stateMachine_.getCurrentState(); }
    float getTarget() const { return target_; }
    float getOutput() const { return output_; }
    float getIntegral() const { return pid_.getIntegral(); }
    float getCurrentTemperature() const { return gate_.getLastValue(); }
    const std::string& getActivePreset() const { return activePreset_; }
    bool hasSensorFault() const { return gate_.hasFault(); }
    bool hasControlFault() const { return controlFault_; }
    bool isWindowOpen() const { return window_.isOpen(); }
    bool isRegulatorActive() const;

#ifdef UNIT_TEST
    void setIntegralForTesting(float value) { pid_.setIntegralForTesting(value); }
#endif

private:
    ZoneControlState evaluateState();
    void recompute(uint32_t nowMs, float dtSeconds);
    void driveTrvs(uint32_t nowMs);
    void setControlFault(bool fault, uint32_t nowMs);
    void notify(NotificationType type, float value, bool flag, SystemError error, uint32_t nowMs);
    Preset livePreset(const std::string& name) const;
    Result<ZoneStatus> statusResult() const { return Result<ZoneStatus>(getStatus()); }

    std::string id_;
    RegulatorKind kind_;
    ZoneMode mode_;
    float target_;
    PidGains gains_;
    float deadband_;
    std::string activePreset_;

    PresetStore& presets_;
    SensorGate gate_;
    WindowTracker window_;
    PidRegulator pid_;
    StateMachine<ZoneControlState> stateMachine_;

    float output_;
    float pTerm_;
    float iTerm_;
    bool controlFault_;
    bool globalPause_;
    bool circulationOverride_;
    uint32_t lastTickAt_;
    uint32_t lastEvalAt_;

    std::vector<ActuatorCommander> trvs_;
    std::vector<HAL::IBinaryState*> windowSensors_;
    HAL::ITemperatureSource* source_;
    NotificationSink sink_;
};

#endif // ZONE_REGULATOR_H
