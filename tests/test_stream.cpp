// Test MD5 over byte sources: chunking, close-on-exit and read failures
#include "../src/hash_id.h"
#include "../src/md5.h"
#include "../src/errors.h"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#define TEST_CHECK(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s\n", msg); \
        return 1; \
    } \
} while(0)

#define TEST_THROWS(expr, k, msg) do { \
    bool caught_ = false; \
    try { (void)(expr); } \
    catch (const hid::HashIdError& e_) { caught_ = (e_.kind() == (k)); } \
    TEST_CHECK(caught_, msg); \
} while(0)

static const char* BUGGER_ALL_MD5 = "7478d5b72648205d8585020deeb4b06e";

// Serves `data` in pieces of at most `step` bytes, then optionally fails.
class ScriptedSource : public hid::ByteSource {
public:
    ScriptedSource(std::string data, size_t step, bool fail_at_end = false, bool foreign_error = false)
        : data_(std::move(data)), step_(step), fail_(fail_at_end), foreign_(foreign_error) {}

    size_t read(uint8_t* buf, size_t n) override {
        ++reads;
        if (closes) throw hid::HashIdError(hid::ErrorKind::IoError, "read after close");
        if (off_ == data_.size()) {
            if (fail_ && foreign_) throw std::runtime_error("device went away");
            if (fail_) throw hid::HashIdError(hid::ErrorKind::IoError, "simulated read error");
            return 0;
        }
        size_t k = std::min(std::min(n, step_), data_.size() - off_);
        std::memcpy(buf, data_.data() + off_, k);
        off_ += k;
        return k;
    }

    void close() override { ++closes; }

    int reads = 0;
    int closes = 0;

private:
    std::string data_;
    size_t off_ = 0;
    size_t step_;
    bool fail_;
    bool foreign_;
};

static std::string temp_path(const char* name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

int main() {
    using hid::HashId;
    using hid::ErrorKind;
    printf("Testing stream digests...\n");

    // Test 1: known vector over a std::istream
    {
        std::istringstream in("Bugger all");
        hid::IstreamSource src(in);
        TEST_CHECK(HashId::md5_of_stream(src).str() == BUGGER_ALL_MD5, "md5 of \"Bugger all\" stream");
        TEST_CHECK(!src.closed(), "source must stay open when close is not requested");
        printf("  [PASS] istream digest\n");
    }

    // Test 2: close == true closes exactly once; close == false never closes
    {
        ScriptedSource s1("Bugger all", 10);
        TEST_CHECK(HashId::md5_of_stream(s1, true, true).str() == BUGGER_ALL_MD5, "digest with close");
        TEST_CHECK(s1.closes == 1, "close requested: exactly one close");

        ScriptedSource s2("Bugger all", 10);
        TEST_CHECK(HashId::md5_of_stream(s2, true, false).str() == BUGGER_ALL_MD5, "digest without close");
        TEST_CHECK(s2.closes == 0, "close not requested: no close");
        printf("  [PASS] Close on success\n");
    }

    // Test 3: read failure mid-digest surfaces as IoError and still closes
    {
        ScriptedSource s1("Bugger all", 4, true);
        TEST_THROWS(HashId::md5_of_stream(s1, true, true), ErrorKind::IoError, "read failure is IoError");
        TEST_CHECK(s1.closes == 1, "close requested: closed once on failure");

        ScriptedSource s2("Bugger all", 4, true);
        TEST_THROWS(HashId::md5_of_stream(s2, true, false), ErrorKind::IoError, "read failure is IoError");
        TEST_CHECK(s2.closes == 0, "close not requested: not closed on failure");

        ScriptedSource s3("Bugger all", 4, true, true);
        TEST_THROWS(HashId::md5_of_stream(s3, true, true), ErrorKind::IoError,
                    "foreign read exception is reported as IoError");
        TEST_CHECK(s3.closes == 1, "closed once on foreign failure");
        printf("  [PASS] Close on failure\n");
    }

    // Test 4: digest independent of chunk size and short reads
    {
        std::string big;
        for (int i = 0; i < 5000; ++i) big += "chunk-" + std::to_string(i) + ";";
        const HashId want = HashId::md5_of_string(big);
        const size_t chunks[] = {1, 3, 64, 8192, 65536};
        for (size_t c : chunks) {
            std::istringstream in(big);
            hid::IstreamSource src(in);
            TEST_CHECK(HashId::md5_of_stream(src, true, false, c) == want, "chunk size must not matter");
        }
        ScriptedSource trickle(big, 7);
        TEST_CHECK(HashId::md5_of_stream(trickle) == want, "short reads must not end the digest");
        TEST_CHECK(trickle.reads > 1, "source read more than once");
        ScriptedSource zero_chunk("Bugger all", 10);
        TEST_CHECK(HashId::md5_of_stream(zero_chunk, true, false, 0).str() == BUGGER_ALL_MD5,
                   "chunk 0 falls back to the default");
        printf("  [PASS] Chunking\n");
    }

    // Test 5: empty stream and case flag
    {
        std::istringstream in("");
        hid::IstreamSource src(in);
        TEST_CHECK(HashId::md5_of_stream(src).str() == "d41d8cd98f00b204e9800998ecf8427e", "md5 of empty stream");
        ScriptedSource s("Bugger all", 10);
        TEST_CHECK(HashId::md5_of_stream(s, false).str() == "7478D5B72648205D8585020DEEB4B06E",
                   "uppercase preference");
        printf("  [PASS] Empty stream and case\n");
    }

    // Test 6: ifstream closes through IstreamSource
    {
        const std::string p = temp_path("hashid_test_ifstream.txt");
        { std::ofstream o(p, std::ios::binary); o << "Bugger all"; }
        std::ifstream f(p, std::ios::binary);
        hid::IstreamSource src(f);
        TEST_CHECK(HashId::md5_of_stream(src, true, true).str() == BUGGER_ALL_MD5, "ifstream digest");
        TEST_CHECK(src.closed() && !f.is_open(), "ifstream closed on request");
        std::filesystem::remove(p);
        printf("  [PASS] ifstream close\n");
    }

    // Test 7: files through FileSource
    {
        const std::string p = temp_path("hashid_test_file.bin");
        std::string body;
        for (int i = 0; i < 20000; ++i) body.push_back(static_cast<char>(i & 0xff));
        { std::ofstream o(p, std::ios::binary); o.write(body.data(), (std::streamsize)body.size()); }

        TEST_CHECK(HashId::md5_of_file(p) == HashId::md5_of_string(body), "file digest matches content");
        TEST_CHECK(HashId::md5_of_file(p, true, 100) == HashId::md5_of_string(body), "small chunks on file");

        hid::FileSource fs(p);
        TEST_CHECK(fs.is_open(), "FileSource opens");
        (void)HashId::md5_of_stream(fs, true, true);
        TEST_CHECK(!fs.is_open(), "FileSource closed on request");
        TEST_THROWS(fs.read(nullptr, 0), ErrorKind::IoError, "read after close is IoError");

        std::filesystem::remove(p);
        TEST_THROWS(HashId::md5_of_file(p), ErrorKind::IoError, "missing file is IoError");
        TEST_THROWS(hid::FileSource(temp_path("hashid_no_such_dir/x")), ErrorKind::IoError,
                    "open failure is IoError");
        printf("  [PASS] File digest\n");
    }

    // Test 8: incremental Md5 matches one-shot, and is reusable after final()
    {
        hid::Md5 h;
        h.update("I'm a ");
        h.update("banana");
        TEST_CHECK(h.bytes_hashed() == 12, "byte counter");
        auto d = h.final();
        TEST_CHECK(d == hid::md5("I'm a banana"), "incremental equals one-shot");
        TEST_CHECK(h.bytes_hashed() == 0, "final resets the counter");
        h.update("Bugger all");
        TEST_CHECK(HashId::from_bytes(d.data(), d.size()).str() == "0af797fcfb5878029a003b65960d1d30",
                   "digest bytes render");
        auto d2 = h.final();
        TEST_CHECK(HashId::from_bytes(d2.data(), d2.size()).str() == BUGGER_ALL_MD5, "reuse after final");
        printf("  [PASS] Md5 context\n");
    }

    printf("All stream digest tests passed!\n");
    return 0;
}
