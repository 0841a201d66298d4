#ifndef CLIMATE_REGISTRY_H
#define CLIMATE_REGISTRY_H

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/IClimateDirectory.h"
#include "modules/control/CircuitAggregator.h"
#include "modules/control/HubAggregator.h"
#include "modules/control/PresetStore.h"
#include "modules/control/ZoneRegulator.h"
#include "utils/ErrorHandler.h"

/**
 * @brief Owner of every zone and circuit, plus the single hub
 *
 * Ids are unique across zones, circuits and the hub. Cross references
 * (circuit -> zone, hub -> circuit/zone) are ids resolved through this
 * registry, so removing an entity never leaves a dangling pointer; removal
 * also unregisters the id from every owner.
 */
class ClimateRegistry : public IClimateDirectory {
public:
    using RemovalListener = std::function<void(const std::string& id)>;

    explicit ClimateRegistry(const std::string& hubId = "hub");
    ~ClimateRegistry() override;

    ClimateRegistry(const ClimateRegistry&) = delete;
    ClimateRegistry& operator=(const ClimateRegistry&) = delete;

    Result<ZoneRegulator*> addZone(const ZoneConfig& config, uint32_t nowMs);
    Result<CircuitAggregator*> addCircuit(const std::string& id);

    /**
     * @brief Delete a zone and detach it from every circuit and the hub
     *
     * Its preset slots are dropped and the removal listener is told so that
     * queued events addressed to it can be purged.
     */
    Result<void> removeZone(const std::string& id);
    Result<void> removeCircuit(const std::string& id);

    // Membership
    Result<void> attachZoneToCircuit(const std::string& zoneId, const std::string& circuitId);
    Result<void> detachZoneFromCircuit(const std::string& zoneId, const std::string& circuitId);
    Result<void> attachToHub(const std::string& memberId);
    Result<void> detachFromHub(const std::string& memberId);

    ZoneRegulator* findZone(const std::string& id) const override;
    CircuitAggregator* findCircuit(const std::string& id) const override;

    HubAggregator& getHub() { return hub_; }
    const HubAggregator& getHub() const { return hub_; }
    PresetStore& getPresets() { return presets_; }
    const PresetStore& getPresets() const { return presets_; }

    std::vector<std::string> getZoneIds() const;
    std::vector<std::string> getCircuitIds() const;
    size_t getZoneCount() const { return zones_.size(); }
    size_t getCircuitCount() const { return circuits_.size(); }

    /**
     * @brief Route notifications of every current and future entity to one sink
     */
    void setNotificationSink(NotificationSink sink);
    void setRemovalListener(RemovalListener listener) { removalListener_ = listener; }

private:
    bool idInUse(const std::string& id) const;

    PresetStore presets_;
    HubAggregator hub_;
    std::map<std::string, std::unique_ptr<ZoneRegulator>> zones_;
    std::map<std::string, std::unique_ptr<CircuitAggregator>> circuits_;

    NotificationSink sink_;
    RemovalListener removalListener_;
};

#endif // CLIMATE_REGISTRY_H
