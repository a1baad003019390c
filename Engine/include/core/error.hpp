/**
 * @file error.hpp
 * @brief Error taxonomy for the engine
 *
 * Every failure raised inside the engine is an Annex::Error carrying an
 * ErrorKind. The C interop layer maps kinds onto annex_status_t values.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Annex {

enum class ErrorKind : int {
    Config    = 1,  // Unknown field, bad enum value, out-of-range parameter
    Resource  = 2,  // Allocation or environment failure
    Handle    = 3,  // Unknown, zero or freed index handle
    Dimension = 4,  // Shape, element type or id mismatch
    Io        = 5,  // Index/dataset file read or write failure
    Cancelled = 6,  // Search stopped through a CancellationToken
    Internal  = 7
};

const char* to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(ErrorKind::Config, message) {}
};

class ResourceError : public Error {
public:
    explicit ResourceError(const std::string& message) : Error(ErrorKind::Resource, message) {}
};

class HandleError : public Error {
public:
    explicit HandleError(const std::string& message) : Error(ErrorKind::Handle, message) {}
};

class DimensionError : public Error {
public:
    explicit DimensionError(const std::string& message) : Error(ErrorKind::Dimension, message) {}
};

class IoError : public Error {
public:
    explicit IoError(const std::string& message) : Error(ErrorKind::Io, message) {}
};

class CancelledError : public Error {
public:
    explicit CancelledError(const std::string& message) : Error(ErrorKind::Cancelled, message) {}
};

} // namespace Annex
