#include "errors.h"

namespace hid {

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::InvalidLength: return "InvalidLength";
        case ErrorKind::InvalidFormat: return "InvalidFormat";
        case ErrorKind::IoError:       return "IoError";
    }
    return "Unknown";
}

}
