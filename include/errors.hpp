#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base of every error the dispatch center raises on purpose.
 *
 * Each subclass maps to exactly one caller-visible outcome at the HTTP edge
 * (see ApiHandler). Anything else that escapes is treated as an internal error.
 */
class DispatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed request or empty prompt. Nothing was mutated.
class ValidationError : public DispatchError {
public:
    using DispatchError::DispatchError;
};

// Signature mismatch on an inbound payment notification.
class AuthenticationError : public DispatchError {
public:
    using DispatchError::DispatchError;
};

class NotFoundError : public DispatchError {
public:
    explicit NotFoundError(const std::string& jobId)
        : DispatchError("Job not found: " + jobId), jobId_(jobId) {}

    const std::string& jobId() const { return jobId_; }

private:
    std::string jobId_;
};

// Requested status is not a legal successor of the current one.
class InvalidTransitionError : public DispatchError {
public:
    using DispatchError::DispatchError;
};

// Outbound message could not be delivered. Never crosses the dispatcher.
class TransientDeliveryError : public DispatchError {
public:
    using DispatchError::DispatchError;
};

// Missing or invalid configuration. Raised only during startup.
class ConfigError : public DispatchError {
public:
    using DispatchError::DispatchError;
};
