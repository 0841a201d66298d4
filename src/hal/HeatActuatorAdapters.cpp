// src/hal/HeatActuatorAdapters.cpp
#include "hal/HeatActuatorAdapters.h"
#include "LoggingMacros.h"

static const char* TAG = "HeatActuator";

namespace HAL {

RelaySwitchActuator::RelaySwitchActuator(IRelay& relay, uint8_t channel)
    : relay_(relay)
    , channel_(channel)
    , name_(std::string(relay.getName()) + "/" + std::to_string(channel)) {
}

bool RelaySwitchActuator::applyDemand(bool heat) {
    if (channel_ >= relay_.getChannelCount()) {
        LOG_ERROR(TAG, "%s: channel %u out of range (%u channels)",
                  name_.c_str(), channel_, relay_.getChannelCount());
        return false;
    }

    bool ok = relay_.setState(channel_, heat ? IRelay::State::ON : IRelay::State::OFF);
    if (!ok) {
        LOG_WARN(TAG, "%s: relay rejected %s", name_.c_str(), heat ? "ON" : "OFF");
    }
    return ok;
}

TrvClimateActuator::TrvClimateActuator(IThermostaticValve& valve)
    : valve_(valve) {
}

bool TrvClimateActuator::applyDemand(bool heat) {
    bool ok = valve_.setMode(heat ? IThermostaticValve::Mode::HEAT : IThermostaticValve::Mode::OFF);
    if (!ok) {
        LOG_WARN(TAG, "%s: valve rejected mode %s", valve_.getName(), heat ? "HEAT" : "OFF");
    }
    return ok;
}

} // namespace HAL
