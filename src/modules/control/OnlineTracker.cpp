#include "modules/control/OnlineTracker.h"
#include "config/ClimateConfig.h"
#include "utils/Utils.h"
#include "LoggingMacros.h"

static const char* TAG = "OnlineTracker";

OnlineTracker::OnlineTracker(const char* name)
    : name_(name)
    , online_(true)
    , offlinePending_(false)
    , offlineSince_(0) {
}

bool OnlineTracker::update(bool onlineRaw, uint32_t nowMs) {
    if (onlineRaw) {
        if (!online_) {
            LOG_INFO(TAG, "%s back online", name_);
        }
        online_ = true;
        offlinePending_ = false;
        return true;
    }

    if (!online_) {
        return false;
    }

    if (!offlinePending_) {
        offlinePending_ = true;
        offlineSince_ = nowMs;
        if (ClimateConfig::boilerOfflineGraceMs > 0) {
            LOG_WARN(TAG, "%s reported offline - waiting %lu ms before faulting", name_,
                     static_cast<unsigned long>(ClimateConfig::boilerOfflineGraceMs));
        }
    }

    if (Utils::hasTimedOut(nowMs, offlineSince_, ClimateConfig::boilerOfflineGraceMs)) {
        online_ = false;
        offlinePending_ = false;
        LOG_ERROR(TAG, "%s offline", name_);
    }
    return online_;
}
