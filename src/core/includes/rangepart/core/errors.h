#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace rangepart {

/**
 * Failure categories surfaced to callers and recorded in run outcomes.
 */
enum class ErrorKind {
    None,
    InvalidInput,
    NotFound,
    AccessDenied,
    TransientIO,
    PublishFailure,
    Cancelled,
    Internal
};

std::string_view
to_string(ErrorKind kind);

// Base exception for all rangepart errors
class RangepartError : public std::runtime_error
{
public:
    RangepartError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind)
    {
    }

    ErrorKind
    kind() const
    {
        return kind_;
    }

private:
    ErrorKind kind_;
};

// Bad request shape or an object that cannot be partitioned
class InvalidInputError : public RangepartError
{
public:
    explicit InvalidInputError(const std::string& msg)
        : RangepartError(ErrorKind::InvalidInput, msg)
    {
    }
};

// Object storage failure; kind is NotFound, AccessDenied or TransientIO
class StorageError : public RangepartError
{
public:
    StorageError(ErrorKind kind, const std::string& msg)
        : RangepartError(kind, msg)
    {
    }

    bool
    retryable() const
    {
        return kind() == ErrorKind::TransientIO;
    }
};

// A message the broker client refused to accept
class BrokerError : public RangepartError
{
public:
    explicit BrokerError(const std::string& msg)
        : RangepartError(ErrorKind::PublishFailure, msg)
    {
    }
};

// Invalid configuration value
class ConfigError : public RangepartError
{
public:
    explicit ConfigError(const std::string& msg)
        : RangepartError(ErrorKind::InvalidInput, msg)
    {
    }
};

}  // namespace rangepart
