#include "config.h"
#include "log.h"
#include <fstream>
#include <algorithm>
#include <cctype>

using namespace hid;

static constexpr size_t MAX_READ_CHUNK = 1024 * 1024;

static inline std::string trim(const std::string& s){
    auto a = s.find_first_not_of(" \t\r\n");
    if(a==std::string::npos) return "";
    auto b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b-a+1);
}

static inline std::string lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool parse_bool(const std::string& v, bool& out, const std::string& key){
    const std::string l = lower(v);
    if(l=="1"||l=="true"||l=="yes"||l=="on")  { out = true;  return true; }
    if(l=="0"||l=="false"||l=="no"||l=="off") { out = false; return true; }
    log_error(LogCategory::CONFIG, "Config: Invalid " + key + " value '" + v + "'");
    return false;
}

static bool safe_parse_chunk(const std::string& v, size_t& out, const std::string& key){
    try {
        size_t pos = 0;
        unsigned long long val = std::stoull(v, &pos);
        if(pos != v.size() || val == 0 || val > MAX_READ_CHUNK){
            log_error(LogCategory::CONFIG, "Config: " + key + " value '" + v +
                      "' must be between 1 and " + std::to_string(MAX_READ_CHUNK));
            return false;
        }
        out = static_cast<size_t>(val);
        return true;
    } catch (const std::exception& e) {
        log_error(LogCategory::CONFIG, "Config: Invalid " + key + " value '" + v + "': " + e.what());
        return false;
    }
}

bool hid::load_config(const std::string& path, Config& out){
    std::ifstream f(path);
    if(!f.is_open()) return false;

    std::string line;
    int line_num = 0;
    while(std::getline(f, line)){
        ++line_num;
        line = trim(line);
        if(line.empty()) continue;
        if(line[0]=='#') continue;
        if(line.rfind("//",0)==0) continue;

        auto kpos = line.find('=');
        if(kpos==std::string::npos) {
            log_error(LogCategory::CONFIG, "Config line " + std::to_string(line_num) +
                      ": missing '=' in '" + line + "'");
            continue;
        }
        std::string k = lower(trim(line.substr(0,kpos)));
        std::string v = trim(line.substr(kpos+1));

        if(k=="lowercase") parse_bool(v, out.lowercase, k);
        else if(k=="uppercase") {
            bool up = false;
            if(parse_bool(v, up, k)) out.lowercase = !up;
        }
        else if(k=="read_chunk") safe_parse_chunk(v, out.read_chunk, k);
        else if(k=="log_level") {
            if(!log_parse_level(v, out.log_level))
                log_error(LogCategory::CONFIG, "Config: Invalid log_level value '" + v + "'");
        }
        else if(k=="log_timestamps") parse_bool(v, out.log_timestamps, k);
        else if(k=="log_categories") {
            if(!log_parse_categories(v, out.log_categories))
                log_error(LogCategory::CONFIG, "Config: Invalid log_categories value '" + v + "'");
        }
        else log_warn(LogCategory::CONFIG, "Config line " + std::to_string(line_num) +
                      ": unknown key '" + k + "'");
    }
    return true;
}

void hid::apply_log_config(const Config& cfg){
    log_set_level(cfg.log_level);
    log_enable_timestamps(cfg.log_timestamps);
    log_set_categories(cfg.log_categories);
}
