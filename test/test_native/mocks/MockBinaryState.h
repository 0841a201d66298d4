/**
 * @file MockBinaryState.h
 * @brief Window contact / boiler status input for testing
 */

#ifndef MOCK_BINARY_STATE_H
#define MOCK_BINARY_STATE_H

#include <string>
#include "hal/HardwareAbstractionLayer.h"

class MockBinaryState : public HAL::IBinaryState {
public:
    explicit MockBinaryState(const std::string& name = "mock-input", bool state = false)
        : name_(name), available_(true), state_(state) {}

    bool isAvailable() const override { return available_; }
    bool getState() const override { return state_; }
    const char* getName() const override { return name_.c_str(); }

    void setAvailable(bool available) { available_ = available; }
    void setState(bool state) { state_ = state; }

private:
    std::string name_;
    bool available_;
    bool state_;
};

#endif // MOCK_BINARY_STATE_H
