#pragma once

/**
 * @file log.hpp
 * @brief Minimal diagnostic sink used throughout etch.
 *
 * Messages go to stderr as "etch <level>: <message>" unless a custom sink
 * is installed. Logging never changes drawing behavior.
 */

#include <functional>

namespace etch {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off
};

using LogSink = std::function<void(LogLevel, const char*)>;

/// @brief Set the minimum level that reaches the sink (default Warning).
void setLogLevel(LogLevel level);
LogLevel logLevel();

/// @brief Replace the sink. An empty function silences all output.
void setLogSink(LogSink sink);

/// @brief Restore the stderr sink.
void resetLogSink();

/// @brief True when a message at this level would be delivered.
bool logEnabled(LogLevel level);

/// printf-style; the message is dropped before formatting when filtered out.
void logDebug(const char* fmt, ...);
void logInfo(const char* fmt, ...);
void logWarning(const char* fmt, ...);
void logError(const char* fmt, ...);

}
