#include "hex.h"
#include "errors.h"
#include <string>

namespace hid {

static constexpr char LUT_LOWER[] = "0123456789abcdef";
static constexpr char LUT_UPPER[] = "0123456789ABCDEF";

static inline int unhex_nibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<int>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<int>(10 + (c - 'a'));
    if (c >= 'A' && c <= 'F') return static_cast<int>(10 + (c - 'A'));
    return -1;
}

int parse_hex_digit(char c) {
    const int v = unhex_nibble(c);
    if (v < 0) {
        throw HashIdError(ErrorKind::InvalidFormat,
                          std::string("invalid hex digit '") + c + "'");
    }
    return v;
}

char render_hex_digit(int v, bool lowercase) {
    if (v < 0 || v > 15) {
        throw HashIdError(ErrorKind::InvalidFormat,
                          "nibble out of range: " + std::to_string(v));
    }
    return lowercase ? LUT_LOWER[v] : LUT_UPPER[v];
}

std::vector<uint8_t> decode_hex(const std::string& h) {
    const size_t n = h.size();
    if (n % 2 != 0) {
        throw HashIdError(ErrorKind::InvalidFormat,
                          "hex string has odd length " + std::to_string(n));
    }
    std::vector<uint8_t> out(n / 2);
    for (size_t i = 0, j = 0; i < n; i += 2, ++j) {
        const int hi = parse_hex_digit(h[i]);
        const int lo = parse_hex_digit(h[i + 1]);
        out[j] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

std::string encode_hex(const uint8_t* p, size_t n, bool lowercase) {
    const char* lut = lowercase ? LUT_LOWER : LUT_UPPER;
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; ++i) {
        // uint8_t keeps 0x80..0xff positive
        const uint8_t b = p[i];
        out[2 * i]     = lut[b >> 4];
        out[2 * i + 1] = lut[b & 0x0F];
    }
    return out;
}

std::string encode_hex(const std::vector<uint8_t>& v, bool lowercase) {
    return encode_hex(v.data(), v.size(), lowercase);
}

bool is_hex_string(const std::string& h) {
    if (h.size() % 2 != 0) return false;
    for (char c : h) {
        if (unhex_nibble(c) < 0) return false;
    }
    return true;
}

} // namespace hid
