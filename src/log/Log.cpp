#include "printlink/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace printlink::log {

namespace {

void defaultSink(LogLevel level, std::string_view message) {
    auto& stream = (level >= LogLevel::Warning) ? std::cerr : std::cout;
    stream << message;
    stream.flush();
}

std::mutex sinkMutex;
LogHandler handler = defaultSink;
std::atomic<LogLevel> minimumLevel{LogLevel::Info};

} // namespace

void setLogHandler(LogHandler newHandler) {
    std::lock_guard lock(sinkMutex);
    handler = newHandler ? std::move(newHandler) : LogHandler(defaultSink);
}

void resetLogHandler() {
    std::lock_guard lock(sinkMutex);
    handler = defaultSink;
}

void setLogLevel(LogLevel level) {
    minimumLevel.store(level, std::memory_order_relaxed);
}

LogLevel logLevel() {
    return minimumLevel.load(std::memory_order_relaxed);
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "unknown";
}

void logMessage(LogLevel level, std::string_view message) {
    if (level < logLevel()) {
        return;
    }
    LogHandler current;
    {
        std::lock_guard lock(sinkMutex);
        current = handler;
    }
    // Run the sink outside the lock so it may log or swap handlers itself.
    if (current) {
        current(level, message);
    }
}

} // namespace printlink::log
