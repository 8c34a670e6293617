/**
 * @file Log.cpp
 * @brief Log level storage and sinks
 */

#include "fieldpatch/Log.hpp"
#include "fieldpatch/Errors.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>

namespace fieldpatch {

std::atomic<LogLevel> g_log_level{LogLevel::info};

namespace {

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

LogSink& active_sink() {
    static LogSink sink;
    return sink;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "off") return LogLevel::off;
    if (lower == "error") return LogLevel::error;
    if (lower == "warn" || lower == "warning") return LogLevel::warn;
    if (lower == "info") return LogLevel::info;
    if (lower == "debug") return LogLevel::debug;
    throw ConfigurationError("Unknown log level: '" + name +
                             "' (expected off, error, warn, info or debug)");
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::off: return "off";
        case LogLevel::error: return "error";
        case LogLevel::warn: return "warn";
        case LogLevel::info: return "info";
        case LogLevel::debug: return "debug";
    }
    return "unknown";
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    active_sink() = std::move(sink);
}

void log_write(LogLevel level, const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    if (active_sink()) {
        active_sink()(level, tag, message);
        return;
    }
    fmt::print(stderr, "[{}] {}: {}\n", tag, log_level_name(level), message);
}

} // namespace fieldpatch
