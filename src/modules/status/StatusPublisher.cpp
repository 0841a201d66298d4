#include "modules/status/StatusPublisher.h"
#include "core/ClimateRegistry.h"
#include "utils/Utils.h"
#include <ArduinoJson.h>
#include <cmath>

namespace {
    constexpr uint8_t TEMP_PRECISION = 2;
    constexpr uint8_t RATIO_PRECISION = 3;

    void putFloat(JsonObject obj, const char* key, float value, uint8_t precision) {
        if (std::isfinite(value)) {
            obj[key] = Utils::roundF(value, precision);
        } else {
            obj[key] = nullptr;
        }
    }

    void writeZone(JsonObject obj, const ZoneStatus& s) {
        obj["id"] = s.id;
        obj["kind"] = regulatorKindToString(s.kind);
        obj["mode"] = zoneModeToString(s.mode);
        obj["state"] = zoneStateToString(s.state);
        obj["preset"] = s.activePreset;
        putFloat(obj, "target", s.target, TEMP_PRECISION);
        putFloat(obj, "temperature", s.currentTemperature, TEMP_PRECISION);
        putFloat(obj, "output", s.output, RATIO_PRECISION);

        if (s.kind == RegulatorKind::PID) {
            putFloat(obj, "kp", s.gains.kp, 4);
            putFloat(obj, "ki", s.gains.ki, 6);
            putFloat(obj, "p_term", s.pTerm, RATIO_PRECISION);
            putFloat(obj, "i_term", s.iTerm, RATIO_PRECISION);
            putFloat(obj, "integral", s.integral, RATIO_PRECISION);
        } else {
            putFloat(obj, "deadband", s.deadband, TEMP_PRECISION);
        }

        obj["window_open"] = s.windowOpen;
        obj["sensor_fault"] = s.sensorFault;
        obj["control_fault"] = s.controlFault;
        obj["regulator_active"] = s.regulatorActive;
    }

    void writeCircuit(JsonObject obj, const CircuitStatus& s) {
        obj["id"] = s.id;
        JsonArray members = obj["members"].to<JsonArray>();
        for (const auto& m : s.members) {
            members.add(m);
        }
        obj["active"] = s.active;
        putFloat(obj, "demand", s.demand, RATIO_PRECISION);
        putFloat(obj, "setpoint", s.aggregatedSetpoint, TEMP_PRECISION);
        obj["control_fault"] = s.controlFault;
        obj["switches"] = s.switchesEnergized;
        obj["circulation"] = s.circulationOverride;

        JsonObject summary = obj["summary"].to<JsonObject>();
        putFloat(summary, "min_temperature", s.summary.minTemperature, TEMP_PRECISION);
        if (s.summary.targetUniform) {
            putFloat(summary, "target", s.summary.target, TEMP_PRECISION);
        } else {
            summary["target"] = nullptr;
        }
        if (s.summary.modeUniform) {
            summary["mode"] = zoneModeToString(s.summary.mode);
        } else {
            summary["mode"] = nullptr;
        }
        if (s.summary.presetUniform) {
            summary["preset"] = s.summary.preset;
        } else {
            summary["preset"] = nullptr;
        }
    }

    void writeHub(JsonObject obj, const HubStatus& s) {
        obj["id"] = s.id;
        JsonArray members = obj["members"].to<JsonArray>();
        for (const auto& m : s.members) {
            members.add(m);
        }
        putFloat(obj, "output", s.aggregatedOutput, RATIO_PRECISION);
        putFloat(obj, "demand", s.memberDemand, RATIO_PRECISION);
        obj["control_fault"] = s.controlFault;
        obj["boiler_fault"] = s.boilerFault;
        if (s.boilerInputPresent) {
            obj["boiler_online"] = s.boilerOnline;
        } else {
            obj["boiler_online"] = nullptr;
        }
    }

    std::string serialize(const JsonDocument& doc) {
        std::string out;
        serializeJson(doc, out);
        return out;
    }
}

std::string StatusPublisher::zoneJson(const ZoneStatus& status) {
    JsonDocument doc;  // ArduinoJson v7
    writeZone(doc.to<JsonObject>(), status);
    return serialize(doc);
}

std::string StatusPublisher::circuitJson(const CircuitStatus& status) {
    JsonDocument doc;
    writeCircuit(doc.to<JsonObject>(), status);
    return serialize(doc);
}

std::string StatusPublisher::hubJson(const HubStatus& status) {
    JsonDocument doc;
    writeHub(doc.to<JsonObject>(), status);
    return serialize(doc);
}

std::string StatusPublisher::snapshotJson(const ClimateRegistry& registry) {
    JsonDocument doc;

    JsonObject zones = doc["zones"].to<JsonObject>();
    for (const auto& id : registry.getZoneIds()) {
        const ZoneRegulator* zone = registry.findZone(id);
        if (zone != nullptr) {
            writeZone(zones[id].to<JsonObject>(), zone->getStatus());
        }
    }

    JsonObject circuits = doc["circuits"].to<JsonObject>();
    for (const auto& id : registry.getCircuitIds()) {
        const CircuitAggregator* circuit = registry.findCircuit(id);
        if (circuit != nullptr) {
            writeCircuit(circuits[id].to<JsonObject>(), circuit->getStatus());
        }
    }

    writeHub(doc["hub"].to<JsonObject>(), registry.getHub().getStatus());
    return serialize(doc);
}

std::string StatusPublisher::notificationJson(const ClimateNotification& notification) {
    JsonDocument doc;
    JsonObject obj = doc.to<JsonObject>();
    obj["type"] = notificationTypeToString(notification.type);
    obj["source"] = notification.sourceId;
    putFloat(obj, "value", notification.value, RATIO_PRECISION);
    obj["flag"] = notification.flag;
    obj["error"] = static_cast<uint32_t>(notification.error);
    if (notification.error != SystemError::SUCCESS) {
        obj["error_text"] = ErrorHandler::errorToString(notification.error);
    }
    obj["ts"] = notification.timestamp;
    return serialize(doc);
}
