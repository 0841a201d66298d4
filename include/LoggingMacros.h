// include/LoggingMacros.h
#ifndef CLIMATE_LOGGING_MACROS_H
#define CLIMATE_LOGGING_MACROS_H

// LOG_ERROR/WARN/INFO/DEBUG/VERBOSE(tag, fmt, ...) come from the Logger library
#include <LogInterface.h>

/**
 * CLIMATE_LOG_LEVEL trims output at compile time:
 *   0 - errors and warnings
 *   1 - + info (release builds)
 *   2 - + debug
 *   3 - everything (default)
 */
#ifndef CLIMATE_LOG_LEVEL
    #define CLIMATE_LOG_LEVEL 3
#endif

#if CLIMATE_LOG_LEVEL < 3
    #undef LOG_VERBOSE
    #define LOG_VERBOSE(tag, fmt, ...) ((void)0)
#endif

#if CLIMATE_LOG_LEVEL < 2
    #undef LOG_DEBUG
    #define LOG_DEBUG(tag, fmt, ...) ((void)0)
#endif

#if CLIMATE_LOG_LEVEL < 1
    #undef LOG_INFO
    #define LOG_INFO(tag, fmt, ...) ((void)0)
#endif

// Warn about a Result an entity refused; needs utils/ErrorHandler.h at the call site
#define LOG_REJECTED(tag, entityId, what, result) \
    LOG_WARN(tag, "%s rejected %s: %s (%s)", (entityId), (what), \
             ErrorHandler::errorToString((result).error()), (result).message().c_str())

#endif // CLIMATE_LOGGING_MACROS_H
