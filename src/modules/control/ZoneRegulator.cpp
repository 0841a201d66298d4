#include "modules/control/ZoneRegulator.h"
#include "modules/control/HysteresisRegulator.h"
#include "utils/Utils.h"
#include "LoggingMacros.h"
#include <algorithm>
#include <cmath>

static const char* TAG = "ZoneRegulator";

namespace {
    bool inRange(float value, float lo, float hi) {
        return std::isfinite(value) && value >= lo && value <= hi;
    }

    bool validTarget(float target) {
        return inRange(target, ClimateConstants::Zone::MIN_TARGET_C, ClimateConstants::Zone::MAX_TARGET_C);
    }

    bool validGains(float kp, float ki) {
        return inRange(kp, ClimateConstants::PID::KP_MIN, ClimateConstants::PID::KP_MAX) &&
               inRange(ki, ClimateConstants::PID::KI_MIN, ClimateConstants::PID::KI_MAX);
    }

    bool validDeadband(float deadband) {
        return inRange(deadband, ClimateConstants::Hysteresis::MIN_DEADBAND,
                       ClimateConstants::Hysteresis::MAX_DEADBAND);
    }
}

ZoneRegulator::ZoneRegulator(const ZoneConfig& config, PresetStore& presets, uint32_t nowMs)
    : id_(config.id)
    , kind_(config.kind)
    , mode_(config.mode)
    , target_(config.target)
    , gains_(config.gains)
    , deadband_(config.deadband)
    , activePreset_(ClimateConstants::Zone::PRESET_HOME)
    , presets_(presets)
    , gate_(config.id, nowMs)
    , window_()
    , pid_()
    , stateMachine_(id_.c_str(), ZoneControlState::IDLE)
    , output_(0.0f)
    , pTerm_(0.0f)
    , iTerm_(0.0f)
    , controlFault_(false)
    , globalPause_(false)
    , circulationOverride_(false)
    , lastTickAt_(nowMs)
    , lastEvalAt_(nowMs)
    , source_(nullptr)
    , sink_(nullptr) {

    const ZoneControlState states[] = {
        ZoneControlState::IDLE,
        ZoneControlState::REGULATING,
        ZoneControlState::WINDOW_PAUSED,
        ZoneControlState::FAULTED
    };
    for (ZoneControlState state : states) {
        stateMachine_.registerState(state, [this]() { return evaluateState(); });
    }
    stateMachine_.setTransitionCallback([this](ZoneControlState from, ZoneControlState to) {
        LOG_DEBUG(TAG, "%s: %s -> %s", id_.c_str(), zoneStateToString(from), zoneStateToString(to));
        notify(NotificationType::ZONE_STATE_CHANGED, static_cast<float>(to), false,
               SystemError::SUCCESS, lastEvalAt_);
    });

    presets_.createDefaults(id_, livePreset(""));

    LOG_INFO(TAG, "Zone %s created (%s, target %.1f, mode %s)", id_.c_str(),
             regulatorKindToString(kind_), target_, zoneModeToString(mode_));
}

ZoneRegulator::~ZoneRegulator() {
    LOG_DEBUG(TAG, "Zone %s destroyed", id_.c_str());
}

Result<void> ZoneRegulator::validateConfig(const ZoneConfig& config) {
    if (config.id.empty()) {
        return Result<void>(SystemError::INVALID_PARAMETER, "zone id is empty");
    }
    if (!validTarget(config.target)) {
        return Result<void>(SystemError::INVALID_PARAMETER, "target out of range");
    }
    if (config.kind == RegulatorKind::PID && !validGains(config.gains.kp, config.gains.ki)) {
        return Result<void>(SystemError::INVALID_PARAMETER, "gains out of range");
    }
    if (config.kind == RegulatorKind::HYSTERESIS && !validDeadband(config.deadband)) {
        return Result<void>(SystemError::INVALID_PARAMETER, "deadband out of range");
    }
    return Result<void>();
}

Result<ZoneStatus> ZoneRegulator::setTarget(float target, uint32_t nowMs) {
    if (!validTarget(target)) {
        LOG_WARN(TAG, "%s: invalid target %.2f (range: %.1f-%.1f)", id_.c_str(), target,
                 ClimateConstants::Zone::MIN_TARGET_C, ClimateConstants::Zone::MAX_TARGET_C);
        return Result<ZoneStatus>(SystemError::INVALID_PARAMETER, "target out of range");
    }
    target_ = target;
    LOG_INFO(TAG, "%s: target set to %.1f", id_.c_str(), target);
    recompute(nowMs, 0.0f);
    return statusResult();
}

Result<ZoneStatus> ZoneRegulator::setMode(ZoneMode mode, uint32_t nowMs) {
    if (mode == ZoneMode::OFF) {
        pid_.reset();
    }
    if (mode != mode_) {
        LOG_INFO(TAG, "%s: mode %s -> %s", id_.c_str(), zoneModeToString(mode_), zoneModeToString(mode));
        mode_ = mode;
    }
    recompute(nowMs, 0.0f);
    return statusResult();
}

Result<ZoneStatus> ZoneRegulator::setGains(float kp, float ki, uint32_t nowMs) {
    if (kind_ != RegulatorKind::PID) {
        LOG_WARN(TAG, "%s: gains rejected, zone uses %s", id_.c_str(), regulatorKindToString(kind_));
        return Result<ZoneStatus>(SystemError::CONFIG_MISMATCH, "gains require a PID zone");
    }
    if (!validGains(kp, ki)) {
        LOG_WARN(TAG, "%s: invalid gains Kp=%.4f Ki=%.4f", id_.c_str(), kp, ki);
        return Result<ZoneStatus>(SystemError::INVALID_PARAMETER, "gains out of range");
    }
    pid_.rescaleIntegral(gains_.ki, ki);
    gains_.kp = kp;
    gains_.ki = ki;
    LOG_INFO(TAG, "%s: gains set to Kp=%.4f Ki=%.4f", id_.c_str(), kp, ki);
    recompute(nowMs, 0.0f);
    return statusResult();
}

Result<ZoneStatus> ZoneRegulator::setDeadband(float deadband, uint32_t nowMs) {
    if (kind_ != RegulatorKind::HYSTERESIS) {
        LOG_WARN(TAG, "%s: deadband rejected, zone uses %s", id_.c_str(), regulatorKindToString(kind_));
        return Result<ZoneStatus>(SystemError::CONFIG_MISMATCH, "deadband requires a hysteresis zone");
    }
    if (!validDeadband(deadband)) {
        LOG_WARN(TAG, "%s: invalid deadband %.2f", id_.c_str(), deadband);
        return Result<ZoneStatus>(SystemError::INVALID_PARAMETER, "deadband out of range");
    }
    deadband_ = deadband;
    LOG_INFO(TAG, "%s: deadband set to %.2f", id_.c_str(), deadband);
    recompute(nowMs, 0.0f);
    return statusResult();
}

Result<ZoneStatus> ZoneRegulator::setWindowOpen(bool open, uint32_t nowMs) {
    if (window_.setOpen(open, nowMs)) {
        LOG_INFO(TAG, "%s: window %s", id_.c_str(), open ? "opened" : "closed");
    }
    recompute(nowMs, 0.0f);
    return statusResult();
}

Result<ZoneStatus> ZoneRegulator::activatePreset(const std::string& name, uint32_t nowMs) {
    Result<Preset> found = presets_.get(id_, name);
    if (found.isError()) {
        LOG_WARN(TAG, "%s: cannot activate preset '%s': %s", id_.c_str(), name.c_str(),
                 ErrorHandler::errorToString(found.error()));
        return Result<ZoneStatus>(found.error(), found.message());
    }

    const Preset& preset = found.value();
    if (preset.kind != kind_) {
        LOG_WARN(TAG, "%s: preset '%s' is for %s zones", id_.c_str(), name.c_str(),
                 regulatorKindToString(preset.kind));
        return Result<ZoneStatus>(SystemError::CONFIG_MISMATCH, "preset regulator kind differs");
    }

    target_ = preset.target;
    if (kind_ == RegulatorKind::PID) {
        gains_ = preset.gains;
    } else {
        deadband_ = preset.deadband;
    }
    if (preset.mode == ZoneMode::OFF) {
        pid_.reset();
    }
    mode_ = preset.mode;
    activePreset_ = name;

    LOG_INFO(TAG, "%s: preset '%s' active (target %.1f, mode %s)", id_.c_str(), name.c_str(),
             target_, zoneModeToString(mode_));
    recompute(nowMs, 0.0f);
    return statusResult();
}

Result<ZoneStatus> ZoneRegulator::savePreset(const std::string& name) {
    Result<void> saved = presets_.save(id_, livePreset(name));
    if (saved.isError()) {
        LOG_WARN(TAG, "%s: cannot save preset '%s': %s", id_.c_str(), name.c_str(),
                 ErrorHandler::errorToString(saved.error()));
        return Result<ZoneStatus>(saved.error(), saved.message());
    }
    return statusResult();
}

Result<ZoneStatus> ZoneRegulator::onReading(const Reading& reading, uint32_t nowMs) {
    bool before = gate_.hasFault();
    Result<void> accepted = gate_.onReading(reading);
    if (accepted.isError()) {
        LOG_DEBUG(TAG, "%s: reading not accepted: %s", id_.c_str(), accepted.message().c_str());
    }
    if (before != gate_.hasFault()) {
        notify(NotificationType::SENSOR_FAULT_CHANGED, 0.0f, gate_.hasFault(),
               gate_.getFaultCause(), nowMs);
    }
    recompute(nowMs, 0.0f);
    return statusResult();
}

Result<ZoneStatus> ZoneRegulator::onSensorUnavailable(uint32_t nowMs) {
    bool before = gate_.hasFault();
    gate_.markUnavailable();
    if (before != gate_.hasFault()) {
        notify(NotificationType::SENSOR_FAULT_CHANGED, 0.0f, true, gate_.getFaultCause(), nowMs);
    }
    recompute(nowMs, 0.0f);
    return statusResult();
}

void ZoneRegulator::tick(uint32_t nowMs) {
    if (gate_.tick(nowMs)) {
        notify(NotificationType::SENSOR_FAULT_CHANGED, 0.0f, gate_.hasFault(),
               gate_.getFaultCause(), nowMs);
    }

    float dtSeconds = Utils::elapsedMs(nowMs, lastTickAt_) / 1000.0f;
    lastTickAt_ = nowMs;
    recompute(nowMs, dtSeconds);
}

void ZoneRegulator::setGlobalPause(bool paused, uint32_t nowMs) {
    if (paused == globalPause_) {
        return;
    }
    globalPause_ = paused;
    LOG_INFO(TAG, "%s: global pause %s", id_.c_str(), paused ? "on" : "off");
    recompute(nowMs, 0.0f);
}

void ZoneRegulator::setCirculationOverride(bool enabled, uint32_t nowMs) {
    if (enabled == circulationOverride_) {
        return;
    }
    circulationOverride_ = enabled;
    LOG_INFO(TAG, "%s: circulation override %s", id_.c_str(), enabled ? "on" : "off");
    driveTrvs(nowMs);
}

void ZoneRegulator::attachTrv(HAL::IHeatActuator* trv) {
    if (trv == nullptr) {
        return;
    }
    for (const auto& commander : trvs_) {
        if (commander.getActuator() == trv) {
            return;
        }
    }
    trvs_.emplace_back(trv);
    LOG_DEBUG(TAG, "%s: TRV %s attached", id_.c_str(), trv->getName());
}

void ZoneRegulator::detachTrv(HAL::IHeatActuator* trv) {
    trvs_.erase(std::remove_if(trvs_.begin(), trvs_.end(),
                               [trv](const ActuatorCommander& c) { return c.getActuator() == trv; }),
                trvs_.end());
}

void ZoneRegulator::attachWindowSensor(HAL::IBinaryState* sensor) {
    if (sensor == nullptr ||
        std::find(windowSensors_.begin(), windowSensors_.end(), sensor) != windowSensors_.end()) {
        return;
    }
    windowSensors_.push_back(sensor);
}

bool ZoneRegulator::isRegulatorActive() const {
    return stateMachine_.isInState(ZoneControlState::REGULATING) && !globalPause_;
}

ZoneStatus ZoneRegulator::getStatus() const {
    ZoneStatus status;
    status.id = id_;
    status.kind = kind_;
    status.mode = mode_;
    status.state = stateMachine_.getCurrentState();
    status.activePreset = activePreset_;
    status.target = target_;
    status.currentTemperature = gate_.getLastValue();
    status.gains = gains_;
    status.deadband = deadband_;
    status.integral = pid_.getIntegral();
    status.pTerm = pTerm_;
    status.iTerm = iTerm_;
    status.output = output_;
    status.windowOpen = window_.isOpen();
    status.sensorFault = gate_.hasFault();
    status.controlFault = controlFault_;
    status.regulatorActive = isRegulatorActive();
    return status;
}

ZoneControlState ZoneRegulator::evaluateState() {
    if (mode_ == ZoneMode::OFF) {
        return ZoneControlState::IDLE;
    }
    if (gate_.hasFault()) {
        return ZoneControlState::FAULTED;
    }
    if (!gate_.hasReading()) {
        return ZoneControlState::IDLE;
    }
    if (!window_.shouldHeat(lastEvalAt_)) {
        return ZoneControlState::WINDOW_PAUSED;
    }
    return ZoneControlState::REGULATING;
}

void ZoneRegulator::recompute(uint32_t nowMs, float dtSeconds) {
    lastEvalAt_ = nowMs;
    stateMachine_.update();
    ZoneControlState state = stateMachine_.getCurrentState();

    float previous = output_;
    float next = 0.0f;
    bool fault = false;
    pTerm_ = 0.0f;
    iTerm_ = (kind_ == RegulatorKind::PID) ? gains_.ki * pid_.getIntegral() : 0.0f;

    if (state == ZoneControlState::REGULATING && !globalPause_) {
        float current = gate_.getLastValue();
        if (kind_ == RegulatorKind::PID) {
            PidRegulator::Step step = pid_.calculate(target_, current, gains_, dtSeconds);
            fault = !step.finite;
            next = step.output;
            pTerm_ = step.pTerm;
            iTerm_ = step.iTerm;
        } else {
            next = HysteresisRegulator::calculate(target_, current, deadband_, previous);
        }
    } else if (kind_ == RegulatorKind::PID && gate_.hasReading() &&
               (state == ZoneControlState::WINDOW_PAUSED || state == ZoneControlState::REGULATING)) {
        // Suspended: error still tracked for telemetry, integral untouched
        pTerm_ = PidRegulator::proportional(target_, gate_.getLastValue(), gains_);
    }

    setControlFault(fault, nowMs);

    output_ = next;
    if (output_ != previous) {
        LOG_DEBUG(TAG, "%s: output %.3f -> %.3f", id_.c_str(), previous, output_);
        notify(NotificationType::ZONE_OUTPUT_CHANGED, output_, output_ > 0.0f,
               SystemError::SUCCESS, nowMs);
    }

    driveTrvs(nowMs);
}

void ZoneRegulator::driveTrvs(uint32_t nowMs) {
    if (trvs_.empty()) {
        return;
    }

    bool desired;
    if (circulationOverride_ && mode_ == ZoneMode::HEAT) {
        desired = true;
    } else if (window_.isOpen()) {
        return;     // leave valves alone while the window is open
    } else {
        desired = output_ > 0.0f;
    }

    for (auto& trv : trvs_) {
        if (!trv.drive(desired, nowMs)) {
            LOG_DEBUG(TAG, "%s: TRV %s not at demand %d yet", id_.c_str(),
                      trv.getActuator()->getName(), desired ? 1 : 0);
        }
    }
}

void ZoneRegulator::setControlFault(bool fault, uint32_t nowMs) {
    if (fault == controlFault_) {
        return;
    }
    controlFault_ = fault;
    if (fault) {
        LOG_ERROR(TAG, "%s: %s, output forced to 0", id_.c_str(),
                  ErrorHandler::errorToString(SystemError::CONTROL_ERROR));
    } else {
        LOG_INFO(TAG, "%s: control fault cleared", id_.c_str());
    }
    notify(NotificationType::CONTROL_FAULT_CHANGED, 0.0f, fault,
           fault ? SystemError::CONTROL_ERROR : SystemError::SUCCESS, nowMs);
}

void ZoneRegulator::notify(NotificationType type, float value, bool flag, SystemError error,
                           uint32_t nowMs) {
    if (!sink_) {
        return;
    }
    ClimateNotification n;
    n.type = type;
    n.sourceId = id_;
    n.value = value;
    n.flag = flag;
    n.error = error;
    n.timestamp = nowMs;
    sink_(n);
}

Preset ZoneRegulator::livePreset(const std::string& name) const {
    Preset preset;
    preset.name = name;
    preset.kind = kind_;
    preset.mode = mode_;
    preset.target = target_;
    preset.gains = gains_;
    preset.deadband = deadband_;
    return preset;
}
