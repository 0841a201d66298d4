#ifndef CIRCUIT_AGGREGATOR_H
#define CIRCUIT_AGGREGATOR_H

#include <cstdint>
#include <string>
#include <vector>
#include "core/IClimateDirectory.h"
#include "events/ClimateEvents.h"
#include "hal/HardwareAbstractionLayer.h"
#include "modules/control/ActuatorCommander.h"
#include "modules/control/CircuitAntiShortCycle.h"
#include "shared/ClimateTypes.h"
#include "utils/ErrorHandler.h"

/**
 * @brief Values derived from the member zones for display
 *
 * The uniform flags are false ("mixed") when members disagree or the
 * circuit has no reachable members.
 */
struct CircuitSummary {
    float minTemperature = 0.0f;        // coldest member reading, NAN if none
    bool targetUniform = false;
    float target = 0.0f;
    bool modeUniform = false;
    ZoneMode mode = ZoneMode::OFF;
    bool presetUniform = false;
    std::string preset;
};

struct CircuitStatus {
    std::string id;
    std::vector<std::string> members;
    bool active = false;
    float demand = 0.0f;                // max member output
    float aggregatedSetpoint = 0.0f;    // NAN until a set point was broadcast
    bool controlFault = false;
    bool switchesEnergized = false;
    bool circulationOverride = false;
    CircuitSummary summary;
};

/**
 * @brief Group of zones sharing pumps/valves
 *
 * Set points flow down (broadcast to members), outputs flow up only.
 * The circuit is active iff any member output is above 0; attached switches
 * follow the active flag, optionally delayed by CircuitAntiShortCycle.
 */
class CircuitAggregator {
public:
    explicit CircuitAggregator(const std::string& id);

    CircuitAggregator(const CircuitAggregator&) = delete;
    CircuitAggregator& operator=(const CircuitAggregator&) = delete;

    /**
     * @return false if the zone is already a member
     */
    bool addMember(const std::string& zoneId);

    /**
     * @brief Remove a member; removing an absent id is a no-op
     */
    void removeMember(const std::string& zoneId);

    bool hasMember(const std::string& zoneId) const;
    const std::vector<std::string>& getMembers() const { return members_; }

    // Shared switches (non-owning)
    void attachSwitch(HAL::IHeatActuator* sw);
    void detachSwitch(HAL::IHeatActuator* sw);
    size_t getSwitchCount() const { return switches_.size(); }

    /**
     * @brief Broadcast a target to every member zone
     *
     * The value is validated once before any member is touched; per-member
     * failures are logged and do not stop the fan-out.
     */
    Result<void> setAggregatedSetpoint(float value, const IClimateDirectory& directory, uint32_t nowMs);
    Result<void> setMode(ZoneMode mode, const IClimateDirectory& directory, uint32_t nowMs);
    Result<void> activatePreset(const std::string& name, const IClimateDirectory& directory, uint32_t nowMs);

    /**
     * @brief Re-derive active/demand/fault from the members and drive switches
     */
    void recompute(const IClimateDirectory& directory, uint32_t nowMs);

    /**
     * @brief Keep switches energized regardless of demand (boiler offline)
     */
    void setCirculationOverride(bool enabled, const IClimateDirectory& directory, uint32_t nowMs);

    void setNotificationSink(NotificationSink sink) { sink_ = sink; }

    CircuitStatus getStatus() const;

    const std::string& getId() const { return id_; }
    bool isActive() const { return active_; }
    float getDemand() const { return demand_; }
    float getAggregatedSetpoint() const { return aggregatedSetpoint_; }
    bool hasControlFault() const { return controlFault_; }
    bool areSwitchesEnergized() const { return switchesOn_; }
    const CircuitSummary& getSummary() const { return summary_; }

private:
    void driveSwitches(bool energize, uint32_t nowMs);
    void notify(NotificationType type, float value, bool flag, uint32_t nowMs);

    std::string id_;
    std::vector<std::string> members_;
    std::vector<ActuatorCommander> switches_;
    CircuitAntiShortCycle antiShortCycle_;

    float aggregatedSetpoint_;
    bool active_;
    float demand_;
    bool controlFault_;
    bool switchesOn_;
    bool circulationOverride_;
    CircuitSummary summary_;

    NotificationSink sink_;
};

#endif // CIRCUIT_AGGREGATOR_H
