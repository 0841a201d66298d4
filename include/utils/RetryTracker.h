// include/utils/RetryTracker.h
#ifndef RETRY_TRACKER_H
#define RETRY_TRACKER_H

#include <cstdint>
#include "config/ClimateConstants.h"

/**
 * @brief Exponential backoff for fire-and-forget actuator commands
 *
 * The first failure waits INITIAL_DELAY_MS, each further failure multiplies
 * the wait by BACKOFF_MULTIPLIER up to MAX_DELAY_MS. A success clears it.
 */
class RetryTracker {
public:
    RetryTracker(uint32_t initialDelayMs = ClimateConstants::Retry::INITIAL_DELAY_MS,
                 uint32_t multiplier = ClimateConstants::Retry::BACKOFF_MULTIPLIER,
                 uint32_t maxDelayMs = ClimateConstants::Retry::MAX_DELAY_MS);

    /**
     * @brief Record a failed attempt at time nowMs
     */
    void setFault(uint32_t nowMs);

    /**
     * @brief Record a successful attempt
     */
    void resetFault();

    /**
     * @brief true if no fault is pending or its backoff has elapsed
     */
    bool shouldTry(uint32_t nowMs) const;

    bool isFault() const { return fault_; }
    uint32_t getCurrentDelay() const { return currentDelayMs_; }

private:
    uint32_t initialDelayMs_;
    uint32_t multiplier_;
    uint32_t maxDelayMs_;
    uint32_t currentDelayMs_;
    uint32_t faultAt_;
    bool fault_;
};

#endif // RETRY_TRACKER_H
