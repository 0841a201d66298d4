// include/utils/ErrorHandler.h
#ifndef ERROR_HANDLER_H
#define ERROR_HANDLER_H

#include <cstdint>
#include <string>

/**
 * @brief Error Return Type Conventions
 *
 * Use Result<T> / Result<void> for:
 * - Commands addressed to a zone, circuit or the hub
 * - Registry structure changes (add/remove/attach)
 * - Anything the caller must be told WHY it failed
 *
 * Use bool for:
 * - Predicates and checks (isValid, canSwitchOn, hasFault, etc.)
 * - Validated config setters that log internally
 */

/**
 * @brief Unified error codes for the control engine
 */
enum class SystemError : uint32_t {
    SUCCESS = 0,

    // General errors (1-99)
    UNKNOWN_ERROR = 1,
    INVALID_PARAMETER = 2,
    NOT_FOUND = 3,
    ALREADY_EXISTS = 4,
    QUEUE_FULL = 5,

    // Sensor errors (500-599)
    SENSOR_STALE = 500,
    SENSOR_UNAVAILABLE = 501,
    SENSOR_OUT_OF_RANGE = 502,
    SENSOR_INVALID_DATA = 503,

    // Control errors (600-649)
    CONTROL_ERROR = 600,
    CONFIG_MISMATCH = 601,
    PRESET_NOT_FOUND = 602,
    UNKNOWN_MEMBER = 603,

    // Actuator / boiler errors (650-699)
    ACTUATOR_COMMAND_FAILED = 650,
    BOILER_OFFLINE = 660,

    // Configuration errors (800-899)
    CONFIG_INVALID = 800,
    CONFIG_MISSING = 801,
    CONFIG_CORRUPTED = 802
};

/**
 * @brief Application Result type for error handling
 */
template<typename T>
class Result {
private:
    bool success_;
    T value_;
    SystemError error_;
    std::string message_;

public:
    // Success constructor
    explicit Result(const T& value)
        : success_(true), value_(value), error_(SystemError::SUCCESS), message_("") {}

    // Error constructor
    Result(SystemError error, const std::string& message = "")
        : success_(false), value_{}, error_(error), message_(message) {}

    bool isSuccess() const { return success_; }
    bool isError() const { return !success_; }

    const T& value() const { return value_; }
    SystemError error() const { return error_; }
    const std::string& message() const { return message_; }
};

// Specialization for void
template<>
class Result<void> {
private:
    bool success_;
    SystemError error_;
    std::string message_;

public:
    // Success constructor
    Result() : success_(true), error_(SystemError::SUCCESS), message_("") {}

    // Error constructor
    Result(SystemError error, const std::string& message = "")
        : success_(false), error_(error), message_(message) {}

    bool isSuccess() const { return success_; }
    bool isError() const { return !success_; }

    SystemError error() const { return error_; }
    const std::string& message() const { return message_; }
};

/**
 * @brief Error handler utility class
 */
class ErrorHandler {
public:
    /**
     * @brief Convert error code to string
     */
    static const char* errorToString(SystemError error) {
        switch (error) {
            case SystemError::SUCCESS: return "Success";
            case SystemError::UNKNOWN_ERROR: return "Unknown error";
            case SystemError::INVALID_PARAMETER: return "Invalid parameter";
            case SystemError::NOT_FOUND: return "Not found";
            case SystemError::ALREADY_EXISTS: return "Already exists";
            case SystemError::QUEUE_FULL: return "Queue full";

            case SystemError::SENSOR_STALE: return "Sensor stale";
            case SystemError::SENSOR_UNAVAILABLE: return "Sensor unavailable";
            case SystemError::SENSOR_OUT_OF_RANGE: return "Sensor out of range";
            case SystemError::SENSOR_INVALID_DATA: return "Sensor invalid data";

            case SystemError::CONTROL_ERROR: return "Control error";
            case SystemError::CONFIG_MISMATCH: return "Config mismatch";
            case SystemError::PRESET_NOT_FOUND: return "Preset not found";
            case SystemError::UNKNOWN_MEMBER: return "Unknown member";

            case SystemError::ACTUATOR_COMMAND_FAILED: return "Actuator command failed";
            case SystemError::BOILER_OFFLINE: return "Boiler offline";

            case SystemError::CONFIG_INVALID: return "Config invalid";
            case SystemError::CONFIG_MISSING: return "Config missing";
            case SystemError::CONFIG_CORRUPTED: return "Config corrupted";

            default: return "Unknown error code";
        }
    }

    /**
     * @brief Log error with context, rate limited per error code
     *
     * Repeats of the same code are suppressed with an exponentially growing
     * interval (1 s doubling up to 60 s).
     */
    static void logError(const char* tag, SystemError error, uint32_t nowMs,
                         const char* context = nullptr);

    /**
     * @brief Clear rate limit for a specific error (when error is resolved)
     */
    static void clearErrorRateLimit(SystemError error);

    /**
     * @brief Forget every rate limit entry
     */
    static void resetRateLimits();
};

#endif // ERROR_HANDLER_H
