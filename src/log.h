#pragma once
#include <string>
#include <cstdint>

namespace hid {

// Named ERR instead of ERROR to avoid the Windows ERROR macro
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    FATAL = 5,
    NONE = 6
};

// Log categories for filtering
enum class LogCategory : uint32_t {
    DIGEST  = 0x0001,
    IO      = 0x0002,
    CONFIG  = 0x0004,
    CLI     = 0x0008,
    ALL     = 0xFFFF
};

// Configuration
void log_set_level(LogLevel level);
void log_set_categories(uint32_t categories);
void log_enable_timestamps(bool enable);

LogLevel log_get_level();
uint32_t log_get_categories();

// "trace", "debug", "info", "warn", "error", "fatal", "none" (case-insensitive)
bool log_parse_level(const std::string& s, LogLevel& out);
const char* log_level_name(LogLevel level);

// Comma separated "digest", "io", "config", "cli" or "all" to a category mask
bool log_parse_categories(const std::string& s, uint32_t& out);

void log_debug(LogCategory cat, const std::string& s);
void log_warn(LogCategory cat, const std::string& s);
void log_error(LogCategory cat, const std::string& s);

void log_flush();

// Conditional logging (avoids string construction if level is disabled)
#define HASHID_LOG_DEBUG(cat, msg) do { \
    if (hid::log_get_level() <= hid::LogLevel::DEBUG && \
        (hid::log_get_categories() & static_cast<uint32_t>(cat))) { \
        hid::log_debug(cat, msg); \
    } \
} while(0)

}  // namespace hid
