#pragma once
#include <stdexcept>
#include <string>

// Root of every error the sandbox layer raises on purpose.
class EvalboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing image, missing binary or an unusable option value.
class ConfigurationError : public EvalboxError {
public:
    using EvalboxError::EvalboxError;
};

// Container could not be launched for a reason other than a missing image.
class ResourceCreationError : public EvalboxError {
public:
    ResourceCreationError(const std::string& what, std::string raw_error)
        : EvalboxError(what), raw_error_(std::move(raw_error)) {}

    const std::string& raw_error() const noexcept { return raw_error_; }

private:
    std::string raw_error_;
};

// Upload key resolves outside of the working directory.
class PathSecurityError : public EvalboxError {
public:
    explicit PathSecurityError(std::string key)
        : EvalboxError("Path traversal detected: " + key), key_(std::move(key)) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

// The shell or the exec client could not be spawned.
class ExecError : public EvalboxError {
public:
    using EvalboxError::EvalboxError;
};
