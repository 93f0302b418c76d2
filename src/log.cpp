#include "etch/log.hpp"
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace etch {

namespace {

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Off: break;
    }
    return "";
}

void stderrSink(LogLevel level, const char* msg) {
    std::fprintf(stderr, "etch %s: %s\n", levelName(level), msg);
}

std::atomic<int> gLevel{static_cast<int>(LogLevel::Warning)};

std::mutex& sinkMutex() {
    static std::mutex m;
    return m;
}

LogSink& sinkSlot() {
    static LogSink sink = stderrSink;
    return sink;
}

void vlog(LogLevel level, const char* fmt, va_list args) {
    if (!logEnabled(level)) return;
    char buffer[1024];
    std::vsnprintf(buffer, sizeof(buffer), fmt, args);

    std::lock_guard<std::mutex> lock(sinkMutex());
    LogSink& sink = sinkSlot();
    if (sink) {
        sink(level, buffer);
    }
}

}

void setLogLevel(LogLevel level) {
    gLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel logLevel() {
    return static_cast<LogLevel>(gLevel.load(std::memory_order_relaxed));
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    sinkSlot() = std::move(sink);
}

void resetLogSink() {
    setLogSink(stderrSink);
}

bool logEnabled(LogLevel level) {
    return level != LogLevel::Off &&
           static_cast<int>(level) >= gLevel.load(std::memory_order_relaxed);
}

void logDebug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, fmt, args);
    va_end(args);
}

void logInfo(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, fmt, args);
    va_end(args);
}

void logWarning(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warning, fmt, args);
    va_end(args);
}

void logError(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, fmt, args);
    va_end(args);
}

}
