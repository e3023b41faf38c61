#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    Conflict,
    NotFound,
    CapacityExceeded,
    AddressSpaceExhausted,
    ProvisioningError,
    BackendUnreachable
};

const char* to_string(ErrorKind p_kind);

class TunnelError : public std::runtime_error {
public:
    TunnelError(ErrorKind p_kind, const std::string& p_message)
        : std::runtime_error(p_message), kind_(p_kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
