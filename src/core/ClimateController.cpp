#include "core/ClimateController.h"
#include "config/ClimateConfig.h"
#include "config/ClimateConstants.h"
#include "LoggingMacros.h"

static const char* TAG = "Controller";

namespace {
    Result<void> toVoid(const Result<ZoneStatus>& result) {
        if (result.isError()) {
            return Result<void>(result.error(), result.message());
        }
        return Result<void>();
    }
}

ClimateController::ClimateController(ClimateRegistry& registry)
    : registry_(registry)
    , inputQueue_("InputQueue", ClimateConstants::Queue::INPUT_QUEUE_LENGTH,
                  EventQueue<ClimateEvent>::OverflowStrategy::DROP_NEWEST)
    , notificationQueue_("NotificationQueue", ClimateConstants::Queue::NOTIFICATION_QUEUE_LENGTH,
                         EventQueue<ClimateNotification>::OverflowStrategy::DROP_OLDEST)
    , tickCount_(0) {
    registry_.setNotificationSink([this](const ClimateNotification& n) { publish(n); });
    registry_.setRemovalListener([this](const std::string& id) { onEntityRemoved(id); });
    registry_.getHub().setBoilerFaultCallback([this](bool fault, uint32_t nowMs) { onBoilerFault(fault, nowMs); });
}

ClimateController::~ClimateController() {
    registry_.setNotificationSink(nullptr);
    registry_.setRemovalListener(nullptr);
    registry_.getHub().setBoilerFaultCallback(nullptr);
}

Result<void> ClimateController::post(const ClimateEvent& event) {
    if (!inputQueue_.send(event)) {
        return Result<void>(SystemError::QUEUE_FULL, "input queue full");
    }
    return Result<void>();
}

Result<void> ClimateController::execute(const ClimateEvent& event, uint32_t nowMs) {
    Result<void> result = dispatch(event, nowMs);
    aggregate(nowMs);
    return result;
}

void ClimateController::tick(uint32_t nowMs) {
    tickCount_++;

    ClimateEvent event;
    while (inputQueue_.receive(event)) {
        Result<void> result = dispatch(event, nowMs);
        if (result.isError()) {
            LOG_REJECTED(TAG, event.targetId.c_str(), climateEventTypeToString(event.type), result);
            ClimateNotification rejected;
            rejected.type = NotificationType::COMMAND_REJECTED;
            rejected.sourceId = event.targetId;
            rejected.value = static_cast<float>(event.type);
            rejected.error = result.error();
            rejected.timestamp = nowMs;
            publish(rejected);
        }
    }

    pollInputs(nowMs);

    for (const auto& id : registry_.getZoneIds()) {
        ZoneRegulator* zone = registry_.findZone(id);
        if (zone != nullptr) {
            zone->tick(nowMs);
        }
    }

    aggregate(nowMs);
}

void ClimateController::aggregate(uint32_t nowMs) {
    for (const auto& id : registry_.getCircuitIds()) {
        CircuitAggregator* circuit = registry_.findCircuit(id);
        if (circuit != nullptr) {
            circuit->recompute(registry_, nowMs);
        }
    }
    registry_.getHub().recompute(registry_, nowMs);
}

bool ClimateController::pollNotification(ClimateNotification& notification) {
    return notificationQueue_.receive(notification);
}

Result<void> ClimateController::dispatch(const ClimateEvent& event, uint32_t nowMs) {
    LOG_DEBUG(TAG, "Dispatch %s -> '%s'", climateEventTypeToString(event.type), event.targetId.c_str());

    switch (event.type) {
        case ClimateEventType::SET_CIRCUIT_SETPOINT:
        case ClimateEventType::SET_CIRCUIT_MODE:
        case ClimateEventType::ACTIVATE_CIRCUIT_PRESET: {
            CircuitAggregator* circuit = registry_.findCircuit(event.targetId);
            if (circuit == nullptr) {
                return Result<void>(SystemError::NOT_FOUND, "unknown circuit");
            }
            if (event.type == ClimateEventType::SET_CIRCUIT_SETPOINT) {
                return circuit->setAggregatedSetpoint(event.value, registry_, nowMs);
            }
            if (event.type == ClimateEventType::SET_CIRCUIT_MODE) {
                return circuit->setMode(event.mode, registry_, nowMs);
            }
            return circuit->activatePreset(event.presetName, registry_, nowMs);
        }

        case ClimateEventType::SET_BOILER_ONLINE:
            registry_.getHub().setBoilerOnline(event.flag);
            return Result<void>();

        default: {
            ZoneRegulator* zone = registry_.findZone(event.targetId);
            if (zone == nullptr) {
                return Result<void>(SystemError::NOT_FOUND, "unknown zone");
            }
            return dispatchZoneEvent(*zone, event, nowMs);
        }
    }
}

Result<void> ClimateController::dispatchZoneEvent(ZoneRegulator& zone, const ClimateEvent& event, uint32_t nowMs) {
    switch (event.type) {
        case ClimateEventType::READING: {
            ZoneRegulator::Reading reading;
            reading.temperature = event.value;
            reading.valid = true;
            reading.timestamp = event.timestamp;
            return toVoid(zone.onReading(reading, nowMs));
        }
        case ClimateEventType::SENSOR_UNAVAILABLE:
            return toVoid(zone.onSensorUnavailable(nowMs));
        case ClimateEventType::SET_TARGET:
            return toVoid(zone.setTarget(event.value, nowMs));
        case ClimateEventType::SET_MODE:
            return toVoid(zone.setMode(event.mode, nowMs));
        case ClimateEventType::SET_GAINS:
            return toVoid(zone.setGains(event.value, event.value2, nowMs));
        case ClimateEventType::SET_DEADBAND:
            return toVoid(zone.setDeadband(event.value, nowMs));
        case ClimateEventType::ACTIVATE_PRESET:
            return toVoid(zone.activatePreset(event.presetName, nowMs));
        case ClimateEventType::SAVE_PRESET:
            return toVoid(zone.savePreset(event.presetName));
        case ClimateEventType::SET_WINDOW_OPEN:
            return toVoid(zone.setWindowOpen(event.flag, nowMs));
        default:
            return Result<void>(SystemError::INVALID_PARAMETER, "event not addressed to a zone");
    }
}

void ClimateController::pollInputs(uint32_t nowMs) {
    for (const auto& id : registry_.getZoneIds()) {
        ZoneRegulator* zone = registry_.findZone(id);
        if (zone == nullptr) {
            continue;
        }

        HAL::ITemperatureSource* source = zone->getTemperatureSource();
        if (source != nullptr) {
            HAL::ITemperatureSource::Reading reading = source->readTemperature(nowMs);
            if (reading.valid) {
                (void)zone->onReading(reading, nowMs);
            } else {
                (void)zone->onSensorUnavailable(nowMs);
            }
        }

        const auto& contacts = zone->getWindowSensors();
        if (!contacts.empty()) {
            bool open = false;
            for (const HAL::IBinaryState* contact : contacts) {
                if (contact->isAvailable() && contact->getState()) {
                    open = true;
                    break;
                }
            }
            if (open != zone->isWindowOpen()) {
                (void)zone->setWindowOpen(open, nowMs);
            }
        }
    }

    HubAggregator& hub = registry_.getHub();
    HAL::IBinaryState* boiler = hub.getBoilerInput();
    if (boiler != nullptr) {
        hub.setBoilerOnline(boiler->isAvailable() && boiler->getState());
    }
}

void ClimateController::onBoilerFault(bool fault, uint32_t nowMs) {
    bool circulate = fault && ClimateConfig::boilerOfflineCirculation;
    LOG_WARN(TAG, "Boiler %s - %s zones%s", fault ? "fault" : "recovered",
             fault ? "pausing" : "resuming", circulate ? ", circulating residual heat" : "");

    for (const auto& id : registry_.getZoneIds()) {
        ZoneRegulator* zone = registry_.findZone(id);
        if (zone != nullptr) {
            zone->setGlobalPause(fault, nowMs);
            zone->setCirculationOverride(circulate, nowMs);
        }
    }

    for (const auto& id : registry_.getCircuitIds()) {
        CircuitAggregator* circuit = registry_.findCircuit(id);
        if (circuit != nullptr) {
            circuit->setCirculationOverride(circulate, registry_, nowMs);
            circuit->recompute(registry_, nowMs);
        }
    }
}

void ClimateController::onEntityRemoved(const std::string& id) {
    size_t purged = inputQueue_.purge([&id](const ClimateEvent& e) { return e.targetId == id; });
    if (purged > 0) {
        LOG_INFO(TAG, "Purged %u queued events for removed '%s'", static_cast<unsigned>(purged), id.c_str());
    }
}

void ClimateController::publish(const ClimateNotification& notification) {
    if (!notificationQueue_.send(notification)) {
        ErrorHandler::logError(TAG, SystemError::QUEUE_FULL, notification.timestamp, "notification");
    }
}
