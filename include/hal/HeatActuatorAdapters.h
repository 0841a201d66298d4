// include/hal/HeatActuatorAdapters.h
#pragma once

#include <string>
#include "hal/HardwareAbstractionLayer.h"

namespace HAL {

/**
 * @brief One relay channel driven as a heat actuator (pump, zone valve)
 */
class RelaySwitchActuator : public IHeatActuator {
public:
    RelaySwitchActuator(IRelay& relay, uint8_t channel);

    bool applyDemand(bool heat) override;
    const char* getName() const override { return name_.c_str(); }

    uint8_t getChannel() const { return channel_; }

private:
    IRelay& relay_;
    uint8_t channel_;
    std::string name_;
};

/**
 * @brief TRV climate device driven as a heat actuator
 *
 * Heat demand maps to HEAT mode, no demand to OFF.
 */
class TrvClimateActuator : public IHeatActuator {
public:
    explicit TrvClimateActuator(IThermostaticValve& valve);

    bool applyDemand(bool heat) override;
    const char* getName() const override { return valve_.getName(); }

private:
    IThermostaticValve& valve_;
};

} // namespace HAL
