#pragma once
#include <stdexcept>
#include <string>

// Typed failures surfaced by the store, session and sync layers.
// The scheduler itself never throws.
enum class ErrorKind {
    NOT_FOUND,
    CONFLICT,
    AUTH_REQUIRED,
    VALIDATION,
    TRANSIENT
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NOT_FOUND: return "NotFound";
    case ErrorKind::CONFLICT: return "Conflict";
    case ErrorKind::AUTH_REQUIRED: return "AuthRequired";
    case ErrorKind::VALIDATION: return "ValidationError";
    case ErrorKind::TRANSIENT: return "Transient";
    }
    return "Unknown";
}

class SrsError : public std::runtime_error {
public:
    SrsError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), error_kind(kind) {}

    ErrorKind kind() const noexcept { return error_kind; }

private:
    ErrorKind error_kind;
};

class NotFoundError : public SrsError {
public:
    explicit NotFoundError(const std::string& message)
        : SrsError(ErrorKind::NOT_FOUND, message) {}
};

// Another grade on the same record is in flight; reload and retry.
class ConflictError : public SrsError {
public:
    explicit ConflictError(const std::string& message)
        : SrsError(ErrorKind::CONFLICT, message) {}
};

class AuthRequiredError : public SrsError {
public:
    explicit AuthRequiredError(const std::string& message)
        : SrsError(ErrorKind::AUTH_REQUIRED, message) {}
};

class ValidationError : public SrsError {
public:
    explicit ValidationError(const std::string& message)
        : SrsError(ErrorKind::VALIDATION, message) {}
};

// I/O failure (storage or remote); the whole operation may be re-invoked.
class TransientError : public SrsError {
public:
    explicit TransientError(const std::string& message)
        : SrsError(ErrorKind::TRANSIENT, message) {}
};
