#pragma once

#include <stdexcept>
#include <string>

namespace podshuttle {

enum class ErrorKind {
    NotFound,
    DeviceNotFound,
    NetworkError,
    InsufficientSpace,
    IoError,
    Generic,
};

[[nodiscard]] const char* errorKindName(ErrorKind kind) noexcept;

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace podshuttle
