#ifndef PRESET_STORE_H
#define PRESET_STORE_H

#include <map>
#include <string>
#include <vector>
#include "shared/ClimateTypes.h"
#include "utils/ErrorHandler.h"

/**
 * @brief Named bundle of zone settings for quick recall
 *
 * Only the field matching the regulator kind is meaningful: gains for PID
 * zones, deadband for hysteresis zones.
 */
struct Preset {
    std::string name;
    RegulatorKind kind = RegulatorKind::PID;
    ZoneMode mode = ZoneMode::HEAT;
    float target = 0.0f;
    PidGains gains = {0.0f, 0.0f};
    float deadband = 0.0f;
};

/**
 * @brief Per-zone preset slots
 *
 * Slots are created explicitly (defaults on zone creation, definePreset,
 * importJson). save() only overwrites an existing slot; an unknown slot is
 * PRESET_NOT_FOUND for both get() and save().
 */
class PresetStore {
public:
    PresetStore() = default;

    PresetStore(const PresetStore&) = delete;
    PresetStore& operator=(const PresetStore&) = delete;

    /**
     * @brief Create the home/sleep/away slots for a zone from its initial values
     *
     * Slots that already exist (e.g. imported before the zone was created) are
     * kept unless their regulator kind differs from the zone's.
     */
    void createDefaults(const std::string& zoneId, const Preset& initial);

    /**
     * @brief Add or replace a named slot
     */
    Result<void> definePreset(const std::string& zoneId, const Preset& preset);

    Result<Preset> get(const std::string& zoneId, const std::string& name) const;

    /**
     * @brief Overwrite an existing slot with the zone's live values
     */
    Result<void> save(const std::string& zoneId, const Preset& live);

    /**
     * @brief Drop every slot of a zone
     */
    void removeZone(const std::string& zoneId);

    bool hasZone(const std::string& zoneId) const;
    std::vector<std::string> listPresets(const std::string& zoneId) const;

    /**
     * @brief Serialize every zone's slots for the external configuration store
     */
    std::string exportJson() const;

    /**
     * @brief Merge slots from a document produced by exportJson()
     *
     * Malformed entries are skipped with a warning.
     */
    Result<void> importJson(const std::string& json);

    static Result<void> validate(const Preset& preset);

private:
    std::map<std::string, std::map<std::string, Preset>> zones_;
};

#endif // PRESET_STORE_H
