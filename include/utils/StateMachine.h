// include/utils/StateMachine.h
#ifndef STATE_MACHINE_H
#define STATE_MACHINE_H

#include <functional>
#include <map>
#include "LoggingMacros.h"

/**
 * @brief Generic state machine template
 *
 * @tparam StateEnum The enum type representing states
 *
 * Each state registers a handler that returns the next state. update() runs
 * the handler of the current state and reports any change through the
 * transition callback.
 */
template<typename StateEnum>
class StateMachine {
public:
    using StateHandler = std::function<StateEnum()>;
    using TransitionCallback = std::function<void(StateEnum from, StateEnum to)>;

private:
    StateEnum currentState;
    std::map<StateEnum, StateHandler> handlers;
    TransitionCallback transitionCallback;
    const char* name;

public:
    StateMachine(const char* machineName, StateEnum initialState)
        : currentState(initialState)
        , transitionCallback(nullptr)
        , name(machineName) {
    }

    void registerState(StateEnum state, StateHandler handler) {
        handlers[state] = handler;
    }

    /**
     * @brief Set callback for state transitions
     */
    void setTransitionCallback(TransitionCallback callback) {
        transitionCallback = callback;
    }

    /**
     * @brief Run the current state's handler and follow its result
     */
    void update() {
        auto it = handlers.find(currentState);
        if (it == handlers.end() || !it->second) {
            LOG_ERROR(name, "No handler for state %d", (int)currentState);
            return;
        }

        StateEnum nextState = it->second();
        if (nextState == currentState) {
            return;
        }

        LOG_DEBUG(name, "State transition: %d -> %d", (int)currentState, (int)nextState);
        StateEnum previousState = currentState;
        currentState = nextState;
        if (transitionCallback) {
            transitionCallback(previousState, currentState);
        }
    }

    StateEnum getCurrentState() const {
        return currentState;
    }

    bool isInState(StateEnum state) const {
        return currentState == state;
    }
};

#endif // STATE_MACHINE_H
