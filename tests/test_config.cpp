// Test key=value config loading
#include "../src/config.h"
#include "../src/log.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#define TEST_CHECK(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s\n", msg); \
        return 1; \
    } \
} while(0)

static std::string write_conf(const char* name, const std::string& body) {
    auto p = (std::filesystem::temp_directory_path() / name).string();
    std::ofstream o(p);
    o << body;
    return p;
}

int main() {
    printf("Testing config...\n");
    // Keep expected config diagnostics out of the test output
    hid::log_set_level(hid::LogLevel::NONE);

    // Test 1: defaults
    {
        hid::Config c;
        TEST_CHECK(c.lowercase, "lowercase by default");
        TEST_CHECK(c.read_chunk == 8192, "8 KiB read chunk by default");
        TEST_CHECK(c.log_level == hid::LogLevel::WARN, "warn level by default");
        TEST_CHECK(!c.log_timestamps, "no timestamps by default");
        printf("  [PASS] Defaults\n");
    }

    // Test 2: all keys, comments, case-insensitive keys
    {
        auto p = write_conf("hashid_test_ok.conf",
            "# hashid settings\n"
            "// another comment\n"
            "\n"
            "  LowerCase = false  \n"
            "read_chunk=4096\n"
            "LOG_LEVEL = Debug\n"
            "log_timestamps=yes\n"
            "log_categories = io, cli\n");
        hid::Config c;
        TEST_CHECK(hid::load_config(p, c), "existing file loads");
        TEST_CHECK(!c.lowercase, "lowercase=false");
        TEST_CHECK(c.read_chunk == 4096, "read_chunk=4096");
        TEST_CHECK(c.log_level == hid::LogLevel::DEBUG, "log_level=Debug");
        TEST_CHECK(c.log_timestamps, "log_timestamps=yes");
        TEST_CHECK(c.log_categories == (static_cast<uint32_t>(hid::LogCategory::IO) |
                                        static_cast<uint32_t>(hid::LogCategory::CLI)),
                   "log_categories=io, cli");
        std::filesystem::remove(p);
        printf("  [PASS] Keys\n");
    }

    // Test 3: bad values keep previous values, bad lines are skipped
    {
        auto p = write_conf("hashid_test_bad.conf",
            "lowercase=maybe\n"
            "read_chunk=0\n"
            "read_chunk=abc\n"
            "read_chunk=99999999999\n"
            "log_level=loud\n"
            "log_categories=network\n"
            "this line has no equals\n"
            "unknown_key=1\n"
            "uppercase=1\n");
        hid::Config c;
        TEST_CHECK(hid::load_config(p, c), "file with bad lines still loads");
        TEST_CHECK(c.read_chunk == 8192, "invalid read_chunk keeps default");
        TEST_CHECK(c.log_level == hid::LogLevel::WARN, "invalid log_level keeps default");
        TEST_CHECK(c.log_categories == static_cast<uint32_t>(hid::LogCategory::ALL),
                   "invalid log_categories keeps default");
        TEST_CHECK(!c.lowercase, "uppercase=1 turns lowercase off");
        std::filesystem::remove(p);
        printf("  [PASS] Bad values\n");
    }

    // Test 4: missing file
    {
        hid::Config c;
        auto p = (std::filesystem::temp_directory_path() / "hashid_no_such.conf").string();
        std::filesystem::remove(p);
        TEST_CHECK(!hid::load_config(p, c), "missing file returns false");
        TEST_CHECK(c.lowercase && c.read_chunk == 8192, "missing file leaves defaults");
        printf("  [PASS] Missing file\n");
    }

    // Test 5: log level names and apply
    {
        hid::LogLevel l;
        TEST_CHECK(hid::log_parse_level("ERROR", l) && l == hid::LogLevel::ERR, "parse error");
        TEST_CHECK(hid::log_parse_level("off", l) && l == hid::LogLevel::NONE, "parse off");
        TEST_CHECK(!hid::log_parse_level("chatty", l), "reject unknown level");
        TEST_CHECK(std::string(hid::log_level_name(hid::LogLevel::TRACE)) == "trace", "level name");

        hid::Config c;
        c.log_level = hid::LogLevel::FATAL;
        hid::apply_log_config(c);
        TEST_CHECK(hid::log_get_level() == hid::LogLevel::FATAL, "apply_log_config sets level");
        printf("  [PASS] Log level\n");
    }

    printf("All config tests passed!\n");
    return 0;
}
