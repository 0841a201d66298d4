#include "core/ClimateRegistry.h"
#include "LoggingMacros.h"

static const char* TAG = "Registry";

ClimateRegistry::ClimateRegistry(const std::string& hubId)
    : presets_()
    , hub_(hubId)
    , sink_(nullptr)
    , removalListener_(nullptr) {
}

ClimateRegistry::~ClimateRegistry() {
    // Zones hold a reference to presets_; drop them first
    circuits_.clear();
    zones_.clear();
}

bool ClimateRegistry::idInUse(const std::string& id) const {
    return id == hub_.getId() || zones_.count(id) > 0 || circuits_.count(id) > 0;
}

Result<ZoneRegulator*> ClimateRegistry::addZone(const ZoneConfig& config, uint32_t nowMs) {
    Result<void> valid = ZoneRegulator::validateConfig(config);
    if (valid.isError()) {
        LOG_WARN(TAG, "Zone '%s' rejected: %s", config.id.c_str(), valid.message().c_str());
        return Result<ZoneRegulator*>(valid.error(), valid.message());
    }
    if (idInUse(config.id)) {
        LOG_WARN(TAG, "Id '%s' already registered", config.id.c_str());
        return Result<ZoneRegulator*>(SystemError::ALREADY_EXISTS, "id already registered");
    }

    std::unique_ptr<ZoneRegulator> zone(new ZoneRegulator(config, presets_, nowMs));
    if (sink_) {
        zone->setNotificationSink(sink_);
    }
    ZoneRegulator* raw = zone.get();
    zones_[config.id] = std::move(zone);

    LOG_INFO(TAG, "Zone %s registered (%u zones)", config.id.c_str(),
             static_cast<unsigned>(zones_.size()));
    return Result<ZoneRegulator*>(raw);
}

Result<CircuitAggregator*> ClimateRegistry::addCircuit(const std::string& id) {
    if (id.empty()) {
        return Result<CircuitAggregator*>(SystemError::INVALID_PARAMETER, "circuit id is empty");
    }
    if (idInUse(id)) {
        LOG_WARN(TAG, "Id '%s' already registered", id.c_str());
        return Result<CircuitAggregator*>(SystemError::ALREADY_EXISTS, "id already registered");
    }

    std::unique_ptr<CircuitAggregator> circuit(new CircuitAggregator(id));
    if (sink_) {
        circuit->setNotificationSink(sink_);
    }
    CircuitAggregator* raw = circuit.get();
    circuits_[id] = std::move(circuit);

    LOG_INFO(TAG, "Circuit %s registered (%u circuits)", id.c_str(),
             static_cast<unsigned>(circuits_.size()));
    return Result<CircuitAggregator*>(raw);
}

Result<void> ClimateRegistry::removeZone(const std::string& id) {
    auto it = zones_.find(id);
    if (it == zones_.end()) {
        LOG_WARN(TAG, "Cannot remove zone '%s': not registered", id.c_str());
        return Result<void>(SystemError::NOT_FOUND, "zone not registered");
    }

    for (auto& entry : circuits_) {
        entry.second->removeMember(id);
    }
    hub_.removeMember(id);
    presets_.removeZone(id);

    if (removalListener_) {
        removalListener_(id);
    }
    zones_.erase(it);

    LOG_INFO(TAG, "Zone %s removed (%u zones)", id.c_str(), static_cast<unsigned>(zones_.size()));
    return Result<void>();
}

Result<void> ClimateRegistry::removeCircuit(const std::string& id) {
    auto it = circuits_.find(id);
    if (it == circuits_.end()) {
        LOG_WARN(TAG, "Cannot remove circuit '%s': not registered", id.c_str());
        return Result<void>(SystemError::NOT_FOUND, "circuit not registered");
    }

    hub_.removeMember(id);
    if (removalListener_) {
        removalListener_(id);
    }
    circuits_.erase(it);

    LOG_INFO(TAG, "Circuit %s removed (%u circuits)", id.c_str(),
             static_cast<unsigned>(circuits_.size()));
    return Result<void>();
}

Result<void> ClimateRegistry::attachZoneToCircuit(const std::string& zoneId, const std::string& circuitId) {
    if (findZone(zoneId) == nullptr) {
        return Result<void>(SystemError::NOT_FOUND, "zone not registered");
    }
    CircuitAggregator* circuit = findCircuit(circuitId);
    if (circuit == nullptr) {
        return Result<void>(SystemError::NOT_FOUND, "circuit not registered");
    }
    if (!circuit->addMember(zoneId)) {
        return Result<void>(SystemError::ALREADY_EXISTS, "zone already in circuit");
    }
    return Result<void>();
}

Result<void> ClimateRegistry::detachZoneFromCircuit(const std::string& zoneId, const std::string& circuitId) {
    CircuitAggregator* circuit = findCircuit(circuitId);
    if (circuit == nullptr) {
        return Result<void>(SystemError::NOT_FOUND, "circuit not registered");
    }
    circuit->removeMember(zoneId);
    return Result<void>();
}

Result<void> ClimateRegistry::attachToHub(const std::string& memberId) {
    if (findZone(memberId) == nullptr && findCircuit(memberId) == nullptr) {
        return Result<void>(SystemError::NOT_FOUND, "no zone or circuit with this id");
    }
    if (!hub_.addMember(memberId)) {
        return Result<void>(SystemError::ALREADY_EXISTS, "already a hub member");
    }
    return Result<void>();
}

Result<void> ClimateRegistry::detachFromHub(const std::string& memberId) {
    hub_.removeMember(memberId);
    return Result<void>();
}

ZoneRegulator* ClimateRegistry::findZone(const std::string& id) const {
    auto it = zones_.find(id);
    return it != zones_.end() ? it->second.get() : nullptr;
}

CircuitAggregator* ClimateRegistry::findCircuit(const std::string& id) const {
    auto it = circuits_.find(id);
    return it != circuits_.end() ? it->second.get() : nullptr;
}

std::vector<std::string> ClimateRegistry::getZoneIds() const {
    std::vector<std::string> ids;
    ids.reserve(zones_.size());
    for (const auto& entry : zones_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::vector<std::string> ClimateRegistry::getCircuitIds() const {
    std::vector<std::string> ids;
    ids.reserve(circuits_.size());
    for (const auto& entry : circuits_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void ClimateRegistry::setNotificationSink(NotificationSink sink) {
    sink_ = sink;
    for (auto& entry : zones_) {
        entry.second->setNotificationSink(sink);
    }
    for (auto& entry : circuits_) {
        entry.second->setNotificationSink(sink);
    }
    hub_.setNotificationSink(sink);
}
