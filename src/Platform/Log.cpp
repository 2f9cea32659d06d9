/**
 * @file Log.cpp
 * @brief Leveled logging implementation
 */

#include <PixKit/Platform/Log.h>

#include <atomic>
#include <cstdio>
#include <mutex>

namespace Pix::Kit::Platform {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warning};

std::mutex& SinkMutex() {
    static std::mutex mutex;
    return mutex;
}

LogSink& Sink() {
    static LogSink sink;
    return sink;
}

void WriteStderr(LogLevel level, const std::string& tag, const std::string& message) {
    std::fprintf(stderr, "[%s] %s: %s\n", LogLevelName(level), tag.c_str(), message.c_str());
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Off:     return "OFF";
    }
    return "UNKNOWN";
}

void SetLogLevel(LogLevel level) {
    g_level.store(level);
}

LogLevel GetLogLevel() {
    return g_level.load();
}

void SetLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(SinkMutex());
    Sink() = std::move(sink);
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (level == LogLevel::Off || level < g_level.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(SinkMutex());
    if (Sink()) {
        Sink()(level, tag, message);
    } else {
        WriteStderr(level, tag, message);
    }
}

} // namespace Pix::Kit::Platform
