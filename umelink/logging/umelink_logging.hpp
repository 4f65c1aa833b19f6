#pragma once

#include <iostream>
#include <sstream>

namespace umelink
{
namespace logging
{

enum class LogLevel
{
    Error   = 0,
    Warning = 1,
    Info    = 2,
    Debug   = 3,
    Trace   = 4
};

// Global log level variable
extern LogLevel current_log_level;

// Helper function to check if a log level should be printed
inline bool should_log(LogLevel level)
{
    return static_cast<int>(level) <= static_cast<int>(current_log_level);
}

// Helper function to get log level name
inline const char* get_log_level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Trace:
        return "TRACE";
    default:
        return "UNKNOWN";
    }
}

} // namespace logging
} // namespace umelink

// Macro to set the log level
#define UMELINK_SET_LOG_LEVEL(level) umelink::logging::current_log_level = umelink::logging::LogLevel::level

#define UMELINK_LOG_AT(level, message)                                                                                              \
    do                                                                                                                               \
    {                                                                                                                                \
        if (umelink::logging::should_log(umelink::logging::LogLevel::level))                                                         \
        {                                                                                                                            \
            std::ostringstream oss;                                                                                                  \
            oss << "[" << umelink::logging::get_log_level_name(umelink::logging::LogLevel::level) << "] " << __func__ << ": "       \
                << message << "\n";                                                                                                  \
            std::cout << oss.str();                                                                                                  \
        }                                                                                                                            \
    } while (0)

// Logging macros that accept stream expressions
#define UMELINK_LOG_ERROR(message)   UMELINK_LOG_AT(Error, message)
#define UMELINK_LOG_WARNING(message) UMELINK_LOG_AT(Warning, message)
#define UMELINK_LOG_INFO(message)    UMELINK_LOG_AT(Info, message)
#define UMELINK_LOG_DEBUG(message)   UMELINK_LOG_AT(Debug, message)
#define UMELINK_LOG_TRACE(message)   UMELINK_LOG_AT(Trace, message)
