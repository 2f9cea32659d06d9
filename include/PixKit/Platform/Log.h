#pragma once

/**
 * @file Log.h
 * @brief Minimal leveled logging
 *
 * Provides:
 * - Global level filter (default: Warning)
 * - Replaceable sink (default: stderr)
 * - Stream-free formatting, one line per message
 *
 * Usage:
 * @code
 * Platform::LogWarning("Codec", "failed to decode image: " + reason);
 *
 * // Capture messages (e.g., in tests)
 * Platform::SetLogSink([](Platform::LogLevel level, const std::string& tag,
 *                         const std::string& message) { ... });
 * @endcode
 */

#include <PixKit/Core/Export.h>

#include <functional>
#include <string>

namespace Pix::Kit::Platform {

/**
 * @brief Log severity, ordered from most to least verbose
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off         ///< Suppress everything
};

using LogSink = std::function<void(LogLevel level, const std::string& tag,
                                   const std::string& message)>;

/// Short upper-case name ("DEBUG", "INFO", ...)
PIXKIT_API const char* LogLevelName(LogLevel level);

/**
 * @brief Set minimum level that reaches the sink
 */
PIXKIT_API void SetLogLevel(LogLevel level);

PIXKIT_API LogLevel GetLogLevel();

/**
 * @brief Replace the output sink
 * @param sink New sink; an empty function restores the stderr sink
 */
PIXKIT_API void SetLogSink(LogSink sink);

/**
 * @brief Emit a message if level passes the filter
 *
 * Thread-safe. Sink is invoked under a lock, so sinks must not log.
 */
PIXKIT_API void Log(LogLevel level, const std::string& tag, const std::string& message);

inline void LogDebug(const std::string& tag, const std::string& message) {
    Log(LogLevel::Debug, tag, message);
}

inline void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogLevel::Info, tag, message);
}

inline void LogWarning(const std::string& tag, const std::string& message) {
    Log(LogLevel::Warning, tag, message);
}

inline void LogError(const std::string& tag, const std::string& message) {
    Log(LogLevel::Error, tag, message);
}

} // namespace Pix::Kit::Platform
