#include "modules/control/CircuitAggregator.h"
#include "modules/control/ZoneRegulator.h"
#include "config/ClimateConstants.h"
#include "LoggingMacros.h"
#include <algorithm>
#include <cmath>

static const char* TAG = "Circuit";

CircuitAggregator::CircuitAggregator(const std::string& id)
    : id_(id)
    , aggregatedSetpoint_(NAN)
    , active_(false)
    , demand_(0.0f)
    , controlFault_(false)
    , switchesOn_(false)
    , circulationOverride_(false)
    , sink_(nullptr) {
    summary_.minTemperature = NAN;
    LOG_INFO(TAG, "Circuit %s created", id_.c_str());
}

bool CircuitAggregator::addMember(const std::string& zoneId) {
    if (hasMember(zoneId)) {
        return false;
    }
    members_.push_back(zoneId);
    LOG_INFO(TAG, "%s: zone %s added (%u members)", id_.c_str(), zoneId.c_str(),
             static_cast<unsigned>(members_.size()));
    return true;
}

void CircuitAggregator::removeMember(const std::string& zoneId) {
    auto it = std::find(members_.begin(), members_.end(), zoneId);
    if (it == members_.end()) {
        return;
    }
    members_.erase(it);
    LOG_INFO(TAG, "%s: zone %s removed (%u members)", id_.c_str(), zoneId.c_str(),
             static_cast<unsigned>(members_.size()));
}

bool CircuitAggregator::hasMember(const std::string& zoneId) const {
    return std::find(members_.begin(), members_.end(), zoneId) != members_.end();
}

void CircuitAggregator::attachSwitch(HAL::IHeatActuator* sw) {
    if (sw == nullptr) {
        return;
    }
    for (const auto& commander : switches_) {
        if (commander.getActuator() == sw) {
            return;
        }
    }
    switches_.emplace_back(sw);
    LOG_DEBUG(TAG, "%s: switch %s attached", id_.c_str(), sw->getName());
}

void CircuitAggregator::detachSwitch(HAL::IHeatActuator* sw) {
    switches_.erase(std::remove_if(switches_.begin(), switches_.end(),
                                   [sw](const ActuatorCommander& c) { return c.getActuator() == sw; }),
                    switches_.end());
}

Result<void> CircuitAggregator::setAggregatedSetpoint(float value, const IClimateDirectory& directory,
                                                      uint32_t nowMs) {
    if (!std::isfinite(value) ||
        value < ClimateConstants::Zone::MIN_TARGET_C || value > ClimateConstants::Zone::MAX_TARGET_C) {
        LOG_WARN(TAG, "%s: invalid set point %.2f", id_.c_str(), value);
        return Result<void>(SystemError::INVALID_PARAMETER, "set point out of range");
    }

    aggregatedSetpoint_ = value;
    LOG_INFO(TAG, "%s: broadcasting set point %.1f to %u zones", id_.c_str(), value,
             static_cast<unsigned>(members_.size()));

    for (const auto& zoneId : members_) {
        ZoneRegulator* zone = directory.findZone(zoneId);
        if (zone == nullptr) {
            ErrorHandler::logError(TAG, SystemError::UNKNOWN_MEMBER, nowMs, zoneId.c_str());
            continue;
        }
        Result<ZoneStatus> result = zone->setTarget(value, nowMs);
        if (result.isError()) {
            LOG_REJECTED(TAG, zoneId.c_str(), "set point", result);
        }
    }
    return Result<void>();
}

Result<void> CircuitAggregator::setMode(ZoneMode mode, const IClimateDirectory& directory, uint32_t nowMs) {
    LOG_INFO(TAG, "%s: broadcasting mode %s", id_.c_str(), zoneModeToString(mode));
    for (const auto& zoneId : members_) {
        ZoneRegulator* zone = directory.findZone(zoneId);
        if (zone == nullptr) {
            ErrorHandler::logError(TAG, SystemError::UNKNOWN_MEMBER, nowMs, zoneId.c_str());
            continue;
        }
        Result<ZoneStatus> result = zone->setMode(mode, nowMs);
        if (result.isError()) {
            LOG_REJECTED(TAG, zoneId.c_str(), "mode", result);
        }
    }
    return Result<void>();
}

Result<void> CircuitAggregator::activatePreset(const std::string& name, const IClimateDirectory& directory,
                                               uint32_t nowMs) {
    LOG_INFO(TAG, "%s: broadcasting preset '%s'", id_.c_str(), name.c_str());

    Result<void> firstError;
    for (const auto& zoneId : members_) {
        ZoneRegulator* zone = directory.findZone(zoneId);
        if (zone == nullptr) {
            ErrorHandler::logError(TAG, SystemError::UNKNOWN_MEMBER, nowMs, zoneId.c_str());
            continue;
        }
        Result<ZoneStatus> result = zone->activatePreset(name, nowMs);
        if (result.isError()) {
            LOG_REJECTED(TAG, zoneId.c_str(), "preset", result);
            if (firstError.isSuccess()) {
                firstError = Result<void>(result.error(), zoneId + ": " + result.message());
            }
        }
    }
    return firstError;
}

void CircuitAggregator::recompute(const IClimateDirectory& directory, uint32_t nowMs) {
    bool active = false;
    float demand = 0.0f;
    bool fault = false;

    CircuitSummary summary;
    summary.minTemperature = NAN;
    bool first = true;

    for (const auto& zoneId : members_) {
        const ZoneRegulator* zone = directory.findZone(zoneId);
        if (zone == nullptr) {
            ErrorHandler::logError(TAG, SystemError::UNKNOWN_MEMBER, nowMs, zoneId.c_str());
            continue;
        }

        float output = zone->getOutput();
        if (output > 0.0f) {
            active = true;
        }
        demand = std::max(demand, output);
        fault = fault || zone->hasControlFault();

        float temperature = zone->getCurrentTemperature();
        if (std::isfinite(temperature) &&
            (std::isnan(summary.minTemperature) || temperature < summary.minTemperature)) {
            summary.minTemperature = temperature;
        }

        if (first) {
            summary.targetUniform = true;
            summary.target = zone->getTarget();
            summary.modeUniform = true;
            summary.mode = zone->getMode();
            summary.presetUniform = true;
            summary.preset = zone->getActivePreset();
            first = false;
        } else {
            summary.targetUniform = summary.targetUniform && summary.target == zone->getTarget();
            summary.modeUniform = summary.modeUniform && summary.mode == zone->getMode();
            summary.presetUniform = summary.presetUniform && summary.preset == zone->getActivePreset();
        }
    }
    summary_ = summary;
    demand_ = demand;

    if (fault != controlFault_) {
        controlFault_ = fault;
        LOG_WARN(TAG, "%s: control fault %s", id_.c_str(), fault ? "present in members" : "cleared");
    }

    bool want = active || circulationOverride_;
    bool energize = want;
    if (CircuitAntiShortCycle::isEnabled() && want != switchesOn_) {
        if (want && !antiShortCycle_.canTurnOn(nowMs)) {
            energize = switchesOn_;
        } else if (!want && !antiShortCycle_.canTurnOff(nowMs)) {
            energize = switchesOn_;
        }
    }
    driveSwitches(energize, nowMs);

    if (active != active_) {
        active_ = active;
        LOG_INFO(TAG, "%s: %s (demand %.3f)", id_.c_str(), active ? "active" : "inactive", demand);
        notify(NotificationType::CIRCUIT_ACTIVE_CHANGED, demand, active, nowMs);
    }
}

void CircuitAggregator::setCirculationOverride(bool enabled, const IClimateDirectory& directory,
                                               uint32_t nowMs) {
    if (enabled == circulationOverride_) {
        return;
    }
    circulationOverride_ = enabled;
    LOG_INFO(TAG, "%s: circulation override %s", id_.c_str(), enabled ? "on" : "off");
    recompute(directory, nowMs);
}

CircuitStatus CircuitAggregator::getStatus() const {
    CircuitStatus status;
    status.id = id_;
    status.members = members_;
    status.active = active_;
    status.demand = demand_;
    status.aggregatedSetpoint = aggregatedSetpoint_;
    status.controlFault = controlFault_;
    status.switchesEnergized = switchesOn_;
    status.circulationOverride = circulationOverride_;
    status.summary = summary_;
    return status;
}

void CircuitAggregator::driveSwitches(bool energize, uint32_t nowMs) {
    if (energize != switchesOn_) {
        LOG_INFO(TAG, "%s: switches %s", id_.c_str(), energize ? "ON" : "OFF");
        switchesOn_ = energize;
        if (energize) {
            antiShortCycle_.recordOn(nowMs);
        } else {
            antiShortCycle_.recordOff(nowMs);
        }
    }

    for (auto& sw : switches_) {
        if (!sw.drive(energize, nowMs)) {
            LOG_DEBUG(TAG, "%s: switch %s not at %s yet", id_.c_str(), sw.getActuator()->getName(),
                      energize ? "ON" : "OFF");
        }
    }
}

void CircuitAggregator::notify(NotificationType type, float value, bool flag, uint32_t nowMs) {
    if (!sink_) {
        return;
    }
    ClimateNotification n;
    n.type = type;
    n.sourceId = id_;
    n.value = value;
    n.flag = flag;
    n.timestamp = nowMs;
    sink_(n);
}
