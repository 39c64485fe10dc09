#pragma once
#include <stdexcept>
#include <string>

namespace hid {

enum class ErrorKind : int {
    InvalidLength = 1,  // byte input != 16, hex input != 32
    InvalidFormat = 2,  // character outside [0-9a-fA-F], odd hex length
    IoError       = 3   // source read/open failed
};

const char* error_kind_name(ErrorKind k);

class HashIdError : public std::runtime_error {
public:
    HashIdError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}
