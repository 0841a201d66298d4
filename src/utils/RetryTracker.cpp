// src/utils/RetryTracker.cpp
#include "utils/RetryTracker.h"
#include "utils/Utils.h"
#include <algorithm>

RetryTracker::RetryTracker(uint32_t initialDelayMs, uint32_t multiplier, uint32_t maxDelayMs)
    : initialDelayMs_(initialDelayMs)
    , multiplier_(multiplier)
    , maxDelayMs_(maxDelayMs)
    , currentDelayMs_(0)
    , faultAt_(0)
    , fault_(false) {
}

void RetryTracker::setFault(uint32_t nowMs) {
    currentDelayMs_ = fault_ ? std::min(currentDelayMs_ * multiplier_, maxDelayMs_)
                             : initialDelayMs_;
    faultAt_ = nowMs;
    fault_ = true;
}

void RetryTracker::resetFault() {
    fault_ = false;
    currentDelayMs_ = 0;
}

bool RetryTracker::shouldTry(uint32_t nowMs) const {
    return !fault_ || Utils::hasTimedOut(nowMs, faultAt_, currentDelayMs_);
}
