#include "modules/control/WindowTracker.h"
#include "config/ClimateConfig.h"
#include "utils/Utils.h"

WindowTracker::WindowTracker()
    : open_(false)
    , warmupPending_(false)
    , closedAt_(0) {
}

bool WindowTracker::setOpen(bool open, uint32_t nowMs) {
    if (open == open_) {
        return false;
    }

    open_ = open;
    if (open) {
        warmupPending_ = false;
    } else {
        warmupPending_ = true;
        closedAt_ = nowMs;
    }
    return true;
}

bool WindowTracker::shouldHeat(uint32_t nowMs) {
    if (open_) {
        return false;
    }
    if (warmupPending_ && Utils::hasTimedOut(nowMs, closedAt_, ClimateConfig::windowWarmupMs)) {
        warmupPending_ = false;
    }
    return !warmupPending_;
}
