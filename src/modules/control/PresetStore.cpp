#include "modules/control/PresetStore.h"
#include "config/ClimateConstants.h"
#include "LoggingMacros.h"
#include <ArduinoJson.h>
#include <cmath>
#include <cstring>

static const char* TAG = "PresetStore";

namespace {
    bool inRange(float value, float lo, float hi) {
        return std::isfinite(value) && value >= lo && value <= hi;
    }
}

Result<void> PresetStore::validate(const Preset& preset) {
    if (preset.name.empty() || preset.name.size() > ClimateConstants::Zone::MAX_PRESET_NAME_LEN) {
        return Result<void>(SystemError::INVALID_PARAMETER, "preset name empty or too long");
    }
    if (!inRange(preset.target, ClimateConstants::Zone::MIN_TARGET_C, ClimateConstants::Zone::MAX_TARGET_C)) {
        return Result<void>(SystemError::INVALID_PARAMETER, "preset target out of range");
    }
    if (preset.kind == RegulatorKind::PID) {
        if (!inRange(preset.gains.kp, ClimateConstants::PID::KP_MIN, ClimateConstants::PID::KP_MAX) ||
            !inRange(preset.gains.ki, ClimateConstants::PID::KI_MIN, ClimateConstants::PID::KI_MAX)) {
            return Result<void>(SystemError::INVALID_PARAMETER, "preset gains out of range");
        }
    } else if (!inRange(preset.deadband, ClimateConstants::Hysteresis::MIN_DEADBAND,
                        ClimateConstants::Hysteresis::MAX_DEADBAND)) {
        return Result<void>(SystemError::INVALID_PARAMETER, "preset deadband out of range");
    }
    return Result<void>();
}

void PresetStore::createDefaults(const std::string& zoneId, const Preset& initial) {
    auto& slots = zones_[zoneId];

    for (auto it = slots.begin(); it != slots.end();) {
        if (it->second.kind != initial.kind) {
            LOG_WARN(TAG, "%s: dropping stored preset '%s' (regulator kind %s, zone is %s)",
                     zoneId.c_str(), it->first.c_str(),
                     regulatorKindToString(it->second.kind), regulatorKindToString(initial.kind));
            it = slots.erase(it);
        } else {
            ++it;
        }
    }

    const char* defaults[] = {
        ClimateConstants::Zone::PRESET_HOME,
        ClimateConstants::Zone::PRESET_SLEEP,
        ClimateConstants::Zone::PRESET_AWAY
    };
    for (const char* name : defaults) {
        if (slots.find(name) == slots.end()) {
            Preset preset = initial;
            preset.name = name;
            slots[name] = preset;
        }
    }
    LOG_DEBUG(TAG, "%s: %u preset slots", zoneId.c_str(), static_cast<unsigned>(slots.size()));
}

Result<void> PresetStore::definePreset(const std::string& zoneId, const Preset& preset) {
    Result<void> valid = validate(preset);
    if (valid.isError()) {
        LOG_WARN(TAG, "%s: rejecting preset '%s': %s", zoneId.c_str(), preset.name.c_str(),
                 valid.message().c_str());
        return valid;
    }
    zones_[zoneId][preset.name] = preset;
    LOG_INFO(TAG, "%s: defined preset '%s' (target %.1f, mode %s)", zoneId.c_str(),
             preset.name.c_str(), preset.target, zoneModeToString(preset.mode));
    return Result<void>();
}

Result<Preset> PresetStore::get(const std::string& zoneId, const std::string& name) const {
    auto zone = zones_.find(zoneId);
    if (zone == zones_.end()) {
        return Result<Preset>(SystemError::PRESET_NOT_FOUND, "no presets for zone " + zoneId);
    }
    auto slot = zone->second.find(name);
    if (slot == zone->second.end()) {
        return Result<Preset>(SystemError::PRESET_NOT_FOUND, "unknown preset " + name);
    }
    return Result<Preset>(slot->second);
}

Result<void> PresetStore::save(const std::string& zoneId, const Preset& live) {
    auto zone = zones_.find(zoneId);
    if (zone == zones_.end()) {
        return Result<void>(SystemError::PRESET_NOT_FOUND, "no presets for zone " + zoneId);
    }
    auto slot = zone->second.find(live.name);
    if (slot == zone->second.end()) {
        return Result<void>(SystemError::PRESET_NOT_FOUND, "unknown preset " + live.name);
    }
    slot->second = live;
    LOG_INFO(TAG, "%s: saved preset '%s' (target %.1f, mode %s)", zoneId.c_str(),
             live.name.c_str(), live.target, zoneModeToString(live.mode));
    return Result<void>();
}

void PresetStore::removeZone(const std::string& zoneId) {
    if (zones_.erase(zoneId) > 0) {
        LOG_DEBUG(TAG, "%s: presets removed", zoneId.c_str());
    }
}

bool PresetStore::hasZone(const std::string& zoneId) const {
    return zones_.find(zoneId) != zones_.end();
}

std::vector<std::string> PresetStore::listPresets(const std::string& zoneId) const {
    std::vector<std::string> names;
    auto zone = zones_.find(zoneId);
    if (zone != zones_.end()) {
        for (const auto& slot : zone->second) {
            names.push_back(slot.first);
        }
    }
    return names;
}

std::string PresetStore::exportJson() const {
    JsonDocument doc;  // ArduinoJson v7
    doc.to<JsonObject>();

    for (const auto& zone : zones_) {
        JsonObject zoneObj = doc[zone.first].to<JsonObject>();
        for (const auto& slot : zone.second) {
            const Preset& preset = slot.second;
            JsonObject p = zoneObj[slot.first].to<JsonObject>();
            p["kind"] = regulatorKindToString(preset.kind);
            p["mode"] = zoneModeToString(preset.mode);
            p["target"] = preset.target;
            if (preset.kind == RegulatorKind::PID) {
                p["kp"] = preset.gains.kp;
                p["ki"] = preset.gains.ki;
            } else {
                p["deadband"] = preset.deadband;
            }
        }
    }

    std::string out;
    serializeJson(doc, out);
    return out;
}

Result<void> PresetStore::importJson(const std::string& json) {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        LOG_ERROR(TAG, "Failed to parse stored presets: %s", err.c_str());
        return Result<void>(SystemError::CONFIG_CORRUPTED, err.c_str());
    }
    if (!doc.is<JsonObject>()) {
        LOG_ERROR(TAG, "Stored presets are not an object");
        return Result<void>(SystemError::CONFIG_INVALID, "expected object at root");
    }

    size_t imported = 0;
    size_t skipped = 0;
    for (JsonPair zone : doc.as<JsonObject>()) {
        JsonObject slots = zone.value().as<JsonObject>();
        if (slots.isNull()) {
            LOG_WARN(TAG, "Skipping zone '%s': not an object", zone.key().c_str());
            skipped++;
            continue;
        }

        for (JsonPair slot : slots) {
            JsonObject p = slot.value().as<JsonObject>();
            if (p.isNull()) {
                skipped++;
                continue;
            }

            Preset preset;
            preset.name = slot.key().c_str();
            const char* kind = p["kind"] | "PID";
            preset.kind = (std::strcmp(kind, "Hysteresis") == 0) ? RegulatorKind::HYSTERESIS
                                                                  : RegulatorKind::PID;
            const char* mode = p["mode"] | "heat";
            preset.mode = (std::strcmp(mode, "off") == 0) ? ZoneMode::OFF : ZoneMode::HEAT;
            preset.target = p["target"] | NAN;
            preset.gains.kp = p["kp"] | ClimateConstants::PID::DEFAULT_KP;
            preset.gains.ki = p["ki"] | ClimateConstants::PID::DEFAULT_KI;
            preset.deadband = p["deadband"] | ClimateConstants::Hysteresis::DEFAULT_DEADBAND;

            Result<void> valid = validate(preset);
            if (valid.isError()) {
                LOG_WARN(TAG, "Skipping preset '%s' of zone '%s': %s", preset.name.c_str(),
                         zone.key().c_str(), valid.message().c_str());
                skipped++;
                continue;
            }
            zones_[zone.key().c_str()][preset.name] = preset;
            imported++;
        }
    }

    LOG_INFO(TAG, "Imported %u presets (%u skipped)", static_cast<unsigned>(imported),
             static_cast<unsigned>(skipped));
    return Result<void>();
}
