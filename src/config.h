#pragma once
#include "log.h"
#include <string>
#include <cstddef>
#include <cstdint>

namespace hid {

struct Config {
    bool        lowercase = true;               // hex letter case for printed ids
    size_t      read_chunk = 8192;              // stream read size in bytes (1 .. 1 MiB)
    LogLevel    log_level = LogLevel::WARN;
    bool        log_timestamps = false;
    uint32_t    log_categories = static_cast<uint32_t>(LogCategory::ALL);
};

// Simple key=value loader. Unknown keys and bad values are logged and skipped,
// leaving the previous value in place. Returns false if the file can't be opened.
bool load_config(const std::string& path, Config& out);

// Pushes the logging fields of cfg into the logger.
void apply_log_config(const Config& cfg);

}
