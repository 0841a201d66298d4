#ifndef HUB_AGGREGATOR_H
#define HUB_AGGREGATOR_H

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "core/IClimateDirectory.h"
#include "events/ClimateEvents.h"
#include "hal/HardwareAbstractionLayer.h"
#include "modules/control/OnlineTracker.h"

struct HubStatus {
    std::string id;
    std::vector<std::string> members;
    float aggregatedOutput = 0.0f;
    float memberDemand = 0.0f;          // max demand before boiler gating
    bool controlFault = false;
    bool boilerFault = false;
    bool boilerInputPresent = false;
    bool boilerOnline = true;           // last raw report
};

/**
 * @brief Global demand aggregator and boiler gate
 *
 * Members are circuit or zone ids. aggregatedOutput is the maximum member
 * demand (circuit demand or zone output), forced to 0 while the boiler is
 * faulted. Without a boiler input the boiler never faults.
 */
class HubAggregator {
public:
    using BoilerFaultCallback = std::function<void(bool fault, uint32_t nowMs)>;

    explicit HubAggregator(const std::string& id);

    HubAggregator(const HubAggregator&) = delete;
    HubAggregator& operator=(const HubAggregator&) = delete;

    bool addMember(const std::string& memberId);
    void removeMember(const std::string& memberId);
    bool hasMember(const std::string& memberId) const;
    const std::vector<std::string>& getMembers() const { return members_; }

    /**
     * @brief Record the boiler availability reported by the host
     *
     * The first report makes the boiler input present. Takes effect on the
     * next recompute().
     */
    void setBoilerOnline(bool online);

    /**
     * @brief Bind a binary input polled by the scheduler; unavailable means offline
     */
    void bindBoilerInput(HAL::IBinaryState* input);
    HAL::IBinaryState* getBoilerInput() const { return boilerInput_; }

    void recompute(const IClimateDirectory& directory, uint32_t nowMs);

    void setNotificationSink(NotificationSink sink) { sink_ = sink; }
    void setBoilerFaultCallback(BoilerFaultCallback callback) { boilerFaultCallback_ = callback; }

    HubStatus getStatus() const;

    const std::string& getId() const { return id_; }
    float getAggregatedOutput() const { return aggregatedOutput_; }
    float getMemberDemand() const { return memberDemand_; }
    bool hasControlFault() const { return controlFault_; }
    bool hasBoilerFault() const { return boilerFault_; }

private:
    void notify(NotificationType type, float value, bool flag, SystemError error, uint32_t nowMs);

    std::string id_;
    std::vector<std::string> members_;

    HAL::IBinaryState* boilerInput_;
    bool boilerInputPresent_;
    bool boilerOnlineRaw_;
    OnlineTracker boilerTracker_;

    float aggregatedOutput_;
    float memberDemand_;
    bool controlFault_;
    bool boilerFault_;

    NotificationSink sink_;
    BoilerFaultCallback boilerFaultCallback_;
};

#endif // HUB_AGGREGATOR_H
