#ifndef RESEARCHFLOW_TYPES_ERRORS_H
#define RESEARCHFLOW_TYPES_ERRORS_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace researchflow {

enum class ErrorClass : uint8_t {
    TRANSIENT,
    PERMANENT
};

inline const char* to_string(ErrorClass c) {
    return c == ErrorClass::TRANSIENT ? "transient" : "permanent";
}

// Base for every failure raised by a collaborator service.
class ServiceError : public std::runtime_error {
public:
    explicit ServiceError(const std::string& message, std::optional<int> status = std::nullopt)
        : std::runtime_error(message), status_(status) {}

    std::optional<int> status() const { return status_; }

private:
    std::optional<int> status_;
};

// --- Remote-call failures (transient by message/status, see error_classifier) ---

class TimeoutError : public ServiceError {
public:
    explicit TimeoutError(const std::string& what)
        : ServiceError("timeout: " + what) {}
};

class ConnectionError : public ServiceError {
public:
    explicit ConnectionError(const std::string& what)
        : ServiceError("connection error: " + what) {}
};

class RateLimitError : public ServiceError {
public:
    explicit RateLimitError(const std::string& what)
        : ServiceError("rate limit exceeded (429): " + what, 429) {}
};

class UnavailableError : public ServiceError {
public:
    explicit UnavailableError(const std::string& what, int status = 503)
        : ServiceError("service unavailable (" + std::to_string(status) + "): " + what, status) {}
};

// --- Permanent by type ---

class InvalidInputError : public ServiceError {
public:
    using ServiceError::ServiceError;
};

class AuthenticationError : public ServiceError {
public:
    explicit AuthenticationError(const std::string& what)
        : ServiceError("authentication failed: " + what, 401) {}
};

class PermissionDeniedError : public ServiceError {
public:
    explicit PermissionDeniedError(const std::string& what)
        : ServiceError("permission denied: " + what, 403) {}
};

// Collaborator answered, but not in the shape we expected.
class ResponseShapeError : public ServiceError {
public:
    using ServiceError::ServiceError;
};

// Raised when the run's stop signal is observed. Never retried.
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& what = "run cancelled")
        : std::runtime_error(what) {}
};

// --- Engine-internal ---

class StateMergeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unusable configuration file.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace researchflow

#endif // RESEARCHFLOW_TYPES_ERRORS_H
