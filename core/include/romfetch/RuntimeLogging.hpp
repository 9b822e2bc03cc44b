// Runtime policy helpers for diagnostics/sensitive logging, plus the log sink
// the core writes through. The front-end replaces the default sink.
#pragma once

#include <cctype>
#include <cstdlib>
#include <functional>
#include <string>

namespace romfetch {

inline std::string normalizedEnv(const char *name) {
    if (!name)
        return {};
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    std::string out(raw);
    std::size_t start = 0;
    while (start < out.size() &&
           std::isspace(static_cast<unsigned char>(out[start]))) {
        ++start;
    }
    std::size_t end = out.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(out[end - 1]))) {
        --end;
    }
    out = out.substr(start, end - start);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("ROMFETCH_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("ROMFETCH_LOG_SENSITIVE");
}

enum class LogLevel { Debug, Info, Warning, Critical };

using LogSink = std::function<void(LogLevel, const std::string &)>;

const char *logLevelName(LogLevel level);

// Replaces the process-wide sink. An empty sink restores the stderr default.
void setLogSink(LogSink sink);

void logMessage(LogLevel level, const std::string &message);

} // namespace romfetch
