// src/log.cpp
// Synchronous leveled logger. The library defaults to WARN so that normal
// operation is silent; tools raise the level from config or --verbose.
#include "log.h"
#include <mutex>
#include <atomic>
#include <iostream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstring>
#include <algorithm>
#include <cctype>
#include <exception>

namespace hid {

static std::atomic<LogLevel> g_log_level{LogLevel::WARN};
static std::atomic<uint32_t> g_log_categories{static_cast<uint32_t>(LogCategory::ALL)};
static std::atomic<bool> g_timestamps_enabled{false};

static std::mutex g_log_mutex;

static thread_local char g_timestamp_buf[32];
static thread_local int64_t g_last_timestamp_sec = 0;

static inline const char* format_timestamp() {
    using namespace std::chrono;
    const auto now_sec = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();

    // Only reformat if second changed
    if (now_sec != g_last_timestamp_sec) {
        g_last_timestamp_sec = now_sec;
        const std::time_t tt = static_cast<std::time_t>(now_sec);
        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &tt);
#else
        localtime_r(&tt, &tm);
#endif
        std::snprintf(g_timestamp_buf, sizeof(g_timestamp_buf),
                      "%04d-%02d-%02d %02d:%02d:%02d",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec);
    }
    return g_timestamp_buf;
}

static void write_line(const char* level, const std::string& msg) noexcept {
    try {
        std::lock_guard<std::mutex> lk(g_log_mutex);
        const bool to_err = std::strcmp(level, "ERROR") == 0 || std::strcmp(level, "WARN") == 0;
        std::ostream& os = to_err ? std::cerr : std::clog;
        if (g_timestamps_enabled.load(std::memory_order_relaxed)) {
            os << "[" << level << "][" << format_timestamp() << "] " << msg << '\n';
        } else {
            os << "[" << level << "] " << msg << '\n';
        }
    } catch (const std::exception&) {
        // Never let logging crash the process
    }
}

static inline bool enabled(LogLevel lvl, LogCategory cat) {
    return g_log_level.load(std::memory_order_relaxed) <= lvl &&
           (g_log_categories.load(std::memory_order_relaxed) & static_cast<uint32_t>(cat));
}

void log_debug(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::DEBUG, cat)) write_line("DEBUG", s);
}

void log_warn(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::WARN, cat)) write_line("WARN", s);
}

void log_error(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::ERR, cat)) write_line("ERROR", s);
}

void log_set_level(LogLevel level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

void log_set_categories(uint32_t categories) {
    g_log_categories.store(categories, std::memory_order_relaxed);
}

void log_enable_timestamps(bool enable) {
    g_timestamps_enabled.store(enable, std::memory_order_relaxed);
}

LogLevel log_get_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

uint32_t log_get_categories() {
    return g_log_categories.load(std::memory_order_relaxed);
}

bool log_parse_level(const std::string& s, LogLevel& out) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (v == "trace")                      out = LogLevel::TRACE;
    else if (v == "debug")                 out = LogLevel::DEBUG;
    else if (v == "info")                  out = LogLevel::INFO;
    else if (v == "warn" || v == "warning") out = LogLevel::WARN;
    else if (v == "error" || v == "err")   out = LogLevel::ERR;
    else if (v == "fatal")                 out = LogLevel::FATAL;
    else if (v == "none" || v == "off")    out = LogLevel::NONE;
    else return false;
    return true;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERR:   return "error";
        case LogLevel::FATAL: return "fatal";
        case LogLevel::NONE:  return "none";
    }
    return "unknown";
}

bool log_parse_categories(const std::string& s, uint32_t& out) {
    uint32_t mask = 0;
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find(',', start);
        if (end == std::string::npos) end = s.size();
        std::string v = s.substr(start, end - start);
        v.erase(0, v.find_first_not_of(" \t"));
        v.erase(v.find_last_not_of(" \t") + 1);
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (v == "digest")      mask |= static_cast<uint32_t>(LogCategory::DIGEST);
        else if (v == "io")     mask |= static_cast<uint32_t>(LogCategory::IO);
        else if (v == "config") mask |= static_cast<uint32_t>(LogCategory::CONFIG);
        else if (v == "cli")    mask |= static_cast<uint32_t>(LogCategory::CLI);
        else if (v == "all")    mask |= static_cast<uint32_t>(LogCategory::ALL);
        else return false;
        start = end + 1;
    }
    out = mask;
    return true;
}

void log_flush() {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::clog.flush();
    std::cerr.flush();
}

}  // namespace hid
