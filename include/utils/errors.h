#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace strata {

/// Base class of every error raised by strata
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// The acting user has no right to see or act on an entity.
/// Never retried; always raised before any statement is built.
class PermissionError : public Error {
public:
    PermissionError(std::string doctype, const std::string& message)
        : Error(message), doctype_(std::move(doctype)) {}

    const std::string& doctype() const { return doctype_; }

private:
    std::string doctype_;
};

/// Malformed or disallowed filter/field/order/group expression
class DataError : public Error {
public:
    explicit DataError(const std::string& message) : Error(message) {}
};

/// Invalid argument value (unknown operator, unknown queue, ...)
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message) : Error(message) {}
};

/// The table backing a doctype does not exist
class TableMissingError : public Error {
public:
    explicit TableMissingError(const std::string& table)
        : Error("Table missing: " + table), table_(table) {}

    const std::string& table() const { return table_; }

private:
    std::string table_;
};

/// Lock contention reported by the datastore while a job runs
class TransientStorageError : public Error {
public:
    enum class Kind { Deadlock, LockWaitTimeout, Other };

    TransientStorageError(Kind kind, const std::string& message)
        : Error(message), kind_(kind) {}

    Kind kind() const { return kind_; }
    bool isRetryable() const { return kind_ != Kind::Other; }

private:
    Kind kind_;
};

/// Raised by a job body to ask for another attempt
class RetryJobError : public Error {
public:
    explicit RetryJobError(const std::string& message) : Error(message) {}
};

/// The message broker cannot be reached
class BrokerUnavailableError : public Error {
public:
    explicit BrokerUnavailableError(const std::string& message) : Error(message) {}
};

/// Unknown job id or unregistered job method
class JobNotFoundError : public Error {
public:
    explicit JobNotFoundError(const std::string& message) : Error(message) {}
};

} // namespace strata
