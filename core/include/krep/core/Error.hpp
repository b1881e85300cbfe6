#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace krep {

// ---------------------------------------------------------------------------
// Error taxonomy. Read paths catch these and degrade to defaults; write paths
// let them propagate so an operation never reports success after losing data.
// ---------------------------------------------------------------------------
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what)
        : std::runtime_error(what) {}

    // True when repeating the same call later may succeed.
    virtual bool retryable() const noexcept { return false; }
};

class IoError : public Error {
public:
    IoError(const std::string& what, int err);

    int code() const noexcept { return errno_; }
    bool retryable() const noexcept override;

private:
    int errno_;
};

class SerializationError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

class CatalogValidationError : public Error {
public:
    explicit CatalogValidationError(std::vector<std::string> problems);

    const std::vector<std::string>& problems() const noexcept { return problems_; }

private:
    std::vector<std::string> problems_;
};

class PrescriptionError : public Error {
public:
    using Error::Error;
};

// Lock acquisition timed out. Another process holds the file.
class LockError : public Error {
public:
    using Error::Error;

    bool retryable() const noexcept override { return true; }
};

} // namespace krep
