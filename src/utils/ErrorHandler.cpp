// src/utils/ErrorHandler.cpp
#include "utils/ErrorHandler.h"
#include "config/ClimateConstants.h"
#include "LoggingMacros.h"
#include <algorithm>

// Rate limiting data structure - shared between logError and clearErrorRateLimit
namespace {
    struct ErrorRateLimit {
        SystemError error;
        uint32_t lastLogTime;
        uint32_t logInterval;
        uint32_t count;
    };

    constexpr size_t SLOTS = ClimateConstants::ErrorLogging::RATE_LIMIT_SLOTS;
    constexpr uint32_t INITIAL_INTERVAL = ClimateConstants::ErrorLogging::RATE_LIMIT_INITIAL_INTERVAL_MS;
    constexpr uint32_t MAX_INTERVAL = ClimateConstants::ErrorLogging::RATE_LIMIT_MAX_INTERVAL_MS;

    ErrorRateLimit rateLimits[SLOTS] = {};
}

void ErrorHandler::logError(const char* tag, SystemError error, uint32_t nowMs, const char* context) {
    ErrorRateLimit* rateLimit = nullptr;
    for (size_t i = 0; i < SLOTS; i++) {
        if (rateLimits[i].error == error || rateLimits[i].error == SystemError::SUCCESS) {
            rateLimit = &rateLimits[i];
            if (rateLimit->error == SystemError::SUCCESS) {
                rateLimit->error = error;
                rateLimit->logInterval = INITIAL_INTERVAL;
                rateLimit->lastLogTime = 0;
                rateLimit->count = 0;
            }
            break;
        }
    }

    // No slot available, always log
    if (!rateLimit) {
        LOG_ERROR(tag, "%s: %s (code: %lu)", context ? context : "Error",
                  errorToString(error), static_cast<unsigned long>(error));
        return;
    }

    if (rateLimit->count == 0 || nowMs - rateLimit->lastLogTime >= rateLimit->logInterval) {
        rateLimit->count++;

        if (rateLimit->count > 1) {
            LOG_ERROR(tag, "%s: %s (code: %lu) [occurrence %lu, interval %lu ms]",
                      context ? context : "Error", errorToString(error),
                      static_cast<unsigned long>(error),
                      static_cast<unsigned long>(rateLimit->count),
                      static_cast<unsigned long>(rateLimit->logInterval));
            // Exponential backoff once the error starts repeating
            rateLimit->logInterval = std::min(rateLimit->logInterval * 2, MAX_INTERVAL);
        } else {
            LOG_ERROR(tag, "%s: %s (code: %lu)", context ? context : "Error",
                      errorToString(error), static_cast<unsigned long>(error));
        }

        rateLimit->lastLogTime = nowMs;
    }
}

void ErrorHandler::clearErrorRateLimit(SystemError error) {
    for (size_t i = 0; i < SLOTS; i++) {
        if (rateLimits[i].error == error) {
            rateLimits[i].error = SystemError::SUCCESS;
            rateLimits[i].lastLogTime = 0;
            rateLimits[i].logInterval = INITIAL_INTERVAL;
            rateLimits[i].count = 0;
            break;
        }
    }
}

void ErrorHandler::resetRateLimits() {
    for (size_t i = 0; i < SLOTS; i++) {
        rateLimits[i] = ErrorRateLimit{};
    }
}
