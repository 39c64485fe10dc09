#pragma once
#include "md5.h"
#include "byte_source.h"

#include <array>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace hid {

// =============================================================================
// HashId: immutable 128-bit identifier, rendered as a 32 digit hex string.
//
// Every factory either returns a fully valid value or throws HashIdError.
// The value owns a private copy of its 16 bytes; bytes() hands out copies.
// Equality, ordering and hashing are over the raw bytes only; the letter case
// chosen at construction only affects str()/to_string() without arguments.
// Safe to use as a key in std::map, std::set and the unordered containers.
// =============================================================================
class HashId {
public:
    static constexpr size_t SIZE = 16;
    static constexpr size_t HEX_SIZE = 32;
    static constexpr size_t DEFAULT_READ_CHUNK = 8192;

    // Throws InvalidLength unless exactly 16 bytes.
    static HashId from_bytes(const std::vector<uint8_t>& v, bool lowercase = true);
    static HashId from_bytes(const uint8_t* p, size_t n, bool lowercase = true);

    // Throws InvalidLength unless 32 characters, InvalidFormat on a non-hex digit.
    // Any input case is accepted; rendering defaults to lowercase.
    static HashId from_hex(const std::string& hex);

    // Non-throwing variant of from_hex. On failure err (if given) is set.
    static std::optional<HashId> parse_hex(const std::string& hex, std::string* err = nullptr);

    // MD5 of the bytes of s (UTF-8 text is hashed as its encoded bytes).
    static HashId md5_of_string(const std::string& s, bool lowercase = true);

    // MD5 of everything readable from src, read in chunks of `chunk` bytes.
    // With close == true the source is closed exactly once, on success and on
    // failure alike. Read failures surface as HashIdError(IoError).
    static HashId md5_of_stream(ByteSource& src, bool lowercase = true, bool close = false,
                                size_t chunk = DEFAULT_READ_CHUNK);

    // Opens, digests and always closes the file at path.
    static HashId md5_of_file(const std::string& path, bool lowercase = true,
                              size_t chunk = DEFAULT_READ_CHUNK);

    // MD5 of the value's operator<< text.
    template <typename T>
    static HashId md5_of_value(const T& value, bool lowercase = true) {
        std::ostringstream o;
        o << value;
        return md5_of_string(o.str(), lowercase);
    }

    // Copying accessor: callers may modify the result freely.
    std::vector<uint8_t> bytes() const { return std::vector<uint8_t>(raw_.begin(), raw_.end()); }
    // Read-only view of the internal bytes, valid while this id lives.
    // Use bytes() when a mutable copy is needed.
    const std::array<uint8_t, SIZE>& data() const { return raw_; }

    std::string str() const { return str(lower_); }
    std::string str(bool lowercase) const;
    std::string to_string() const { return str(); }

    bool lowercase() const { return lower_; }
    size_t hash() const;

    friend bool operator==(const HashId& a, const HashId& b) { return a.raw_ == b.raw_; }
    friend bool operator!=(const HashId& a, const HashId& b) { return a.raw_ != b.raw_; }
    friend bool operator<(const HashId& a, const HashId& b)  { return a.raw_ < b.raw_; }

private:
    HashId(const std::array<uint8_t, SIZE>& raw, bool lowercase) : raw_(raw), lower_(lowercase) {}

    std::array<uint8_t, SIZE> raw_;
    bool lower_;
};

inline std::string to_string(const HashId& id) { return id.to_string(); }

inline std::ostream& operator<<(std::ostream& os, const HashId& id) {
    return os << id.str();
}

}

namespace std {
template <>
struct hash<hid::HashId> {
    size_t operator()(const hid::HashId& id) const noexcept { return id.hash(); }
};
}
