#include "romfetch/RuntimeLogging.hpp"

#include <iostream>
#include <mutex>

namespace romfetch {

namespace {

std::mutex &sinkMutex() {
    static std::mutex m;
    return m;
}

LogSink &currentSink() {
    static LogSink sink;
    return sink;
}

} // namespace

const char *logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Critical:
        return "CRIT";
    }
    return "UNKNOWN";
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lk(sinkMutex());
    currentSink() = std::move(sink);
}

void logMessage(LogLevel level, const std::string &message) {
    LogSink sink;
    {
        std::lock_guard<std::mutex> lk(sinkMutex());
        sink = currentSink();
    }
    if (sink) {
        sink(level, message);
        return;
    }
    std::cerr << "[" << logLevelName(level) << "] " << message << "\n";
}

} // namespace romfetch
