#include "hash_id.h"
#include "hex.h"
#include "errors.h"
#include "log.h"

#include <algorithm>

namespace hid {

HashId HashId::from_bytes(const uint8_t* p, size_t n, bool lowercase) {
    if (n != SIZE) {
        throw HashIdError(ErrorKind::InvalidLength,
                          "hash id needs 16 bytes, got " + std::to_string(n));
    }
    std::array<uint8_t, SIZE> raw{};
    std::copy(p, p + SIZE, raw.begin());
    return HashId(raw, lowercase);
}

HashId HashId::from_bytes(const std::vector<uint8_t>& v, bool lowercase) {
    return from_bytes(v.data(), v.size(), lowercase);
}

HashId HashId::from_hex(const std::string& hex) {
    if (hex.size() != HEX_SIZE) {
        throw HashIdError(ErrorKind::InvalidLength,
                          "hash id needs 32 hex digits, got " + std::to_string(hex.size()));
    }
    return from_bytes(decode_hex(hex), true);
}

std::optional<HashId> HashId::parse_hex(const std::string& hex, std::string* err) {
    try {
        return from_hex(hex);
    } catch (const HashIdError& e) {
        if (err) *err = std::string(error_kind_name(e.kind())) + ": " + e.what();
        return std::nullopt;
    }
}

HashId HashId::md5_of_string(const std::string& s, bool lowercase) {
    return HashId(md5(s), lowercase);
}

// Anything a source throws while reading is reported as IoError.
static size_t read_some(ByteSource& src, uint8_t* buf, size_t n) {
    try {
        return src.read(buf, n);
    } catch (const HashIdError&) {
        throw;
    } catch (const std::exception& e) {
        throw HashIdError(ErrorKind::IoError, std::string("read failed: ") + e.what());
    }
}

HashId HashId::md5_of_stream(ByteSource& src, bool lowercase, bool close, size_t chunk) {
    SourceCloser closer(src, close);
    if (chunk == 0) chunk = DEFAULT_READ_CHUNK;

    std::vector<uint8_t> buf(chunk);
    Md5 h;
    try {
        for (;;) {
            const size_t got = read_some(src, buf.data(), buf.size());
            if (got == 0) break;
            h.update(buf.data(), got);
        }
    } catch (const HashIdError& e) {
        HASHID_LOG_DEBUG(LogCategory::IO, "md5 stream aborted after " +
                         std::to_string(h.bytes_hashed()) + " bytes: " + e.what());
        throw;
    }

    const uint64_t total = h.bytes_hashed();
    HashId id(h.final(), lowercase);
    closer.close_now();
    HASHID_LOG_DEBUG(LogCategory::DIGEST, "md5 stream " + std::to_string(total) +
                     " bytes -> " + id.str());
    return id;
}

HashId HashId::md5_of_file(const std::string& path, bool lowercase, size_t chunk) {
    FileSource f(path);
    return md5_of_stream(f, lowercase, true, chunk);
}

std::string HashId::str(bool lowercase) const {
    return encode_hex(raw_.data(), raw_.size(), lowercase);
}

size_t HashId::hash() const {
    // FNV-1a over the raw bytes
    uint64_t h = 1469598103934665603ULL;
    for (uint8_t b : raw_) {
        h ^= b;
        h *= 1099511628211ULL;
    }
    return static_cast<size_t>(h);
}

}
