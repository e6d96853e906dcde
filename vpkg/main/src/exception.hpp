#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    Network,
    NotFound,
    Integrity,
    Structural,
    Provisioning,
    Hook,
    NotInstalled,
    Activation,
    Config,
    Locked,
    Io
};

class VpkgException : public std::runtime_error {
public:
    VpkgException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

const char* error_kind_name(ErrorKind kind);
