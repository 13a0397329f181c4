#pragma once
#include <stdexcept>
#include <string>

namespace sqlsession {

// Base of every failure raised by a session repository.
class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& what) : std::runtime_error(what) {}
};

// A create hit an identity that already exists.
class DuplicateEntityError : public SessionError {
public:
    explicit DuplicateEntityError(const std::string& what) : SessionError(what) {}
};

// The target entity, or a required parent, does not exist.
class NotFoundError : public SessionError {
public:
    explicit NotFoundError(const std::string& what) : SessionError(what) {}
};

// Unexpected engine, encode or decode failure. Carries the operation
// context plus the underlying cause.
class StorageError : public SessionError {
public:
    StorageError(const std::string& operation, const std::string& cause)
        : SessionError("Failed to " + operation + ": " + cause),
          operation_(operation) {}

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

} // namespace sqlsession
