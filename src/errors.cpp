#include "podshuttle/errors.hpp"

namespace podshuttle {

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::NotFound:
        return "not found";
    case ErrorKind::DeviceNotFound:
        return "device not found";
    case ErrorKind::NetworkError:
        return "network error";
    case ErrorKind::InsufficientSpace:
        return "insufficient space";
    case ErrorKind::IoError:
        return "I/O error";
    case ErrorKind::Generic:
        break;
    }
    return "error";
}

} // namespace podshuttle
