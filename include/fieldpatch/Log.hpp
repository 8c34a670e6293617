/**
 * @file Log.hpp
 * @brief Leveled logging for the engine
 *
 * A single global level gates every message. Messages are formatted with
 * {fmt} and handed to the active sink (stderr unless replaced).
 */

#ifndef FIELDPATCH_LOG_HPP
#define FIELDPATCH_LOG_HPP

#include <fmt/format.h>

#include <atomic>
#include <functional>
#include <string>

namespace fieldpatch {

enum class LogLevel : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

using LogSink = std::function<void(LogLevel, const std::string& tag, const std::string& message)>;

/// Global log level, defined in Log.cpp.
extern std::atomic<LogLevel> g_log_level;

inline void set_log_level(LogLevel level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline LogLevel get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(get_log_level());
}

/**
 * @brief Parse "off", "error", "warn", "info" or "debug" (case-insensitive)
 * @throws ConfigurationError for any other name
 */
LogLevel parse_log_level(const std::string& name);

const char* log_level_name(LogLevel level);

/**
 * @brief Replace the sink; an empty function restores the stderr sink
 */
void set_log_sink(LogSink sink);

/**
 * @brief Deliver one message to the active sink (no level check)
 */
void log_write(LogLevel level, const char* tag, const std::string& message);

} // namespace fieldpatch

#define FIELDPATCH_LOG(level, tag, ...) \
    do { \
        if (fieldpatch::log_enabled(level)) { \
            fieldpatch::log_write(level, tag, fmt::format(__VA_ARGS__)); \
        } \
    } while (0)

#define FIELDPATCH_LOG_ERROR(tag, ...) FIELDPATCH_LOG(fieldpatch::LogLevel::error, tag, __VA_ARGS__)
#define FIELDPATCH_LOG_WARN(tag, ...)  FIELDPATCH_LOG(fieldpatch::LogLevel::warn, tag, __VA_ARGS__)
#define FIELDPATCH_LOG_INFO(tag, ...)  FIELDPATCH_LOG(fieldpatch::LogLevel::info, tag, __VA_ARGS__)
#define FIELDPATCH_LOG_DEBUG(tag, ...) FIELDPATCH_LOG(fieldpatch::LogLevel::debug, tag, __VA_ARGS__)

#endif // FIELDPATCH_LOG_HPP
