#include "modules/control/HubAggregator.h"
#include "modules/control/CircuitAggregator.h"
#include "modules/control/ZoneRegulator.h"
#include "utils/ErrorHandler.h"
#include "LoggingMacros.h"
#include <algorithm>

static const char* TAG = "Hub";

HubAggregator::HubAggregator(const std::string& id)
    : id_(id)
    , boilerInput_(nullptr)
    , boilerInputPresent_(false)
    , boilerOnlineRaw_(true)
    , boilerTracker_("Boiler")
    , aggregatedOutput_(0.0f)
    , memberDemand_(0.0f)
    , controlFault_(false)
    , boilerFault_(false)
    , sink_(nullptr)
    , boilerFaultCallback_(nullptr) {
}

bool HubAggregator::addMember(const std::string& memberId) {
    if (hasMember(memberId)) {
        return false;
    }
    members_.push_back(memberId);
    LOG_INFO(TAG, "%s added to hub %s", memberId.c_str(), id_.c_str());
    return true;
}

void HubAggregator::removeMember(const std::string& memberId) {
    auto it = std::find(members_.begin(), members_.end(), memberId);
    if (it != members_.end()) {
        members_.erase(it);
        LOG_INFO(TAG, "%s removed from hub %s", memberId.c_str(), id_.c_str());
    }
}

bool HubAggregator::hasMember(const std::string& memberId) const {
    return std::find(members_.begin(), members_.end(), memberId) != members_.end();
}

void HubAggregator::setBoilerOnline(bool online) {
    if (!boilerInputPresent_) {
        LOG_INFO(TAG, "Boiler availability input present");
    }
    boilerInputPresent_ = true;
    boilerOnlineRaw_ = online;
}

void HubAggregator::bindBoilerInput(HAL::IBinaryState* input) {
    boilerInput_ = input;
    if (input != nullptr) {
        LOG_INFO(TAG, "Boiler input bound to %s", input->getName());
    }
}

void HubAggregator::recompute(const IClimateDirectory& directory, uint32_t nowMs) {
    // Boiler first: the fault callback pauses or resumes the members, so the
    // demand below already reflects it
    bool boilerFault = false;
    if (boilerInputPresent_) {
        boilerFault = !boilerTracker_.update(boilerOnlineRaw_, nowMs);
    }

    if (boilerFault != boilerFault_) {
        boilerFault_ = boilerFault;
        if (boilerFault) {
            LOG_ERROR(TAG, "Boiler offline - hub output forced to 0");
        } else {
            LOG_INFO(TAG, "Boiler online - resuming from member demand");
        }
        notify(NotificationType::BOILER_FAULT_CHANGED, 0.0f, boilerFault,
               boilerFault ? SystemError::BOILER_OFFLINE : SystemError::SUCCESS, nowMs);
        if (boilerFaultCallback_) {
            boilerFaultCallback_(boilerFault, nowMs);
        }
    }

    float demand = 0.0f;
    bool fault = false;

    for (const auto& memberId : members_) {
        if (const CircuitAggregator* circuit = directory.findCircuit(memberId)) {
            demand = std::max(demand, circuit->getDemand());
            fault = fault || circuit->hasControlFault();
        } else if (const ZoneRegulator* zone = directory.findZone(memberId)) {
            demand = std::max(demand, zone->getOutput());
            fault = fault || zone->hasControlFault();
        } else {
            ErrorHandler::logError(TAG, SystemError::UNKNOWN_MEMBER, nowMs, memberId.c_str());
        }
    }
    memberDemand_ = demand;

    if (fault != controlFault_) {
        controlFault_ = fault;
        LOG_WARN(TAG, "Control fault %s", fault ? "raised by a member" : "cleared");
        notify(NotificationType::HUB_CONTROL_FAULT_CHANGED, 0.0f, fault,
               fault ? SystemError::CONTROL_ERROR : SystemError::SUCCESS, nowMs);
    }

    // The grace period only delays the fault; demand is withheld from the
    // first offline report
    bool boilerOffline = boilerInputPresent_ && !boilerOnlineRaw_;
    float output = (boilerFault_ || boilerOffline) ? 0.0f : demand;
    if (output != aggregatedOutput_) {
        aggregatedOutput_ = output;
        LOG_DEBUG(TAG, "Aggregated output %.3f", output);
        notify(NotificationType::HUB_OUTPUT_CHANGED, output, output > 0.0f, SystemError::SUCCESS, nowMs);
    }
}

HubStatus HubAggregator::getStatus() const {
    HubStatus status;
    status.id = id_;
    status.members = members_;
    status.aggregatedOutput = aggregatedOutput_;
    status.memberDemand = memberDemand_;
    status.controlFault = controlFault_;
    status.boilerFault = boilerFault_;
    status.boilerInputPresent = boilerInputPresent_;
    status.boilerOnline = boilerOnlineRaw_;
    return status;
}

void HubAggregator::notify(NotificationType type, float value, bool flag, SystemError error, uint32_t nowMs) {
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
