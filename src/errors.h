#pragma once

#include <stdexcept>
#include <string>

namespace contestrun {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Config error: " + message) {}
};

class IdentityError : public std::runtime_error {
public:
    explicit IdentityError(const std::string& message)
        : std::runtime_error("Identity error: " + message) {}
};

class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error("Sandbox error: " + message) {}
};

// Docker Engine API failure; status is 0 for transport errors
class ContainerRuntimeError : public std::runtime_error {
public:
    ContainerRuntimeError(const std::string& message, long status = 0)
        : std::runtime_error("Container runtime error: " + message), status_(status) {}

    long status() const { return status_; }

private:
    long status_;
};

// Queue / registry / result sink failure; status is 0 for transport errors
class ApiError : public std::runtime_error {
public:
    ApiError(const std::string& message, long status = 0)
        : std::runtime_error("API error: " + message), status_(status) {}

    long status() const { return status_; }

private:
    long status_;
};

} // namespace contestrun
