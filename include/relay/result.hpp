#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace relay {

// Error codes for routing and dispatch
enum class ErrorCode {
    OK = 0,
    INVALID_ARGUMENT,        // Bad configuration or API misuse
    IO_ERROR,
    INTERNAL_ERROR,
    // Routing outcomes
    NO_PROVIDERS_AVAILABLE,  // No eligible provider at selection time
    CIRCUIT_BREAKER_OPEN,    // A provider's breaker rejected the call
    MAX_RETRIES_EXCEEDED,    // All attempts failed with transient errors
    COST_BUDGET_EXCEEDED,    // Hourly budget would be exceeded
    OVERLOADED,              // Admission limit reached
    // Provider outcomes
    RATE_LIMITED,            // HTTP 429 - too many requests
    TIMEOUT,                 // Per-call deadline expired
    PROVIDER_ERROR,          // 5xx or malformed provider response
    NETWORK_ERROR,           // Connection failures
    INVALID_REQUEST,         // Rejected as malformed, locally or by the provider
    AUTH_ERROR               // Invalid API key or authentication failure
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::NO_PROVIDERS_AVAILABLE: return "NO_PROVIDERS_AVAILABLE";
        case ErrorCode::CIRCUIT_BREAKER_OPEN: return "CIRCUIT_BREAKER_OPEN";
        case ErrorCode::MAX_RETRIES_EXCEEDED: return "MAX_RETRIES_EXCEEDED";
        case ErrorCode::COST_BUDGET_EXCEEDED: return "COST_BUDGET_EXCEEDED";
        case ErrorCode::OVERLOADED: return "OVERLOADED";
        case ErrorCode::RATE_LIMITED: return "RATE_LIMITED";
        case ErrorCode::TIMEOUT: return "TIMEOUT";
        case ErrorCode::PROVIDER_ERROR: return "PROVIDER_ERROR";
        case ErrorCode::NETWORK_ERROR: return "NETWORK_ERROR";
        case ErrorCode::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorCode::AUTH_ERROR: return "AUTH_ERROR";
    }
    return "UNKNOWN";
}

/**
 * Transient errors may succeed when retried against the same or another
 * provider. Everything else is final for the request.
 */
inline bool is_transient(ErrorCode code) {
    switch (code) {
        case ErrorCode::RATE_LIMITED:
        case ErrorCode::TIMEOUT:
        case ErrorCode::PROVIDER_ERROR:
        case ErrorCode::NETWORK_ERROR:
            return true;
        default:
            return false;
    }
}

// Error with code and message, e.g. "RATE_LIMITED: HTTP 429"
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }

    std::string to_string() const {
        std::string text = error_code_name(code_);
        if (!message_.empty()) {
            text += ": " + message_;
        }
        return text;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// Either a value or the Error that prevented producing it
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : data_(Error(code, std::move(message))) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    // Value access throws std::runtime_error on an error result
    T& value() & {
        check();
        return std::get<T>(data_);
    }

    const T& value() const& {
        check();
        return std::get<T>(data_);
    }

    T&& value() && {
        check();
        return std::move(std::get<T>(data_));
    }

    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result has no error");
        }
        return std::get<Error>(data_);
    }

    ErrorCode error_code() const {
        return ok() ? ErrorCode::OK : std::get<Error>(data_).code();
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

private:
    std::variant<T, Error> data_;

    void check() const {
        if (!ok()) {
            throw std::runtime_error(std::get<Error>(data_).to_string());
        }
    }
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : error_(Error(code, std::move(message))) {}

    bool ok() const { return error_.ok(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code(); }

private:
    Error error_;
};

inline Result<void> Ok() { return Result<void>(); }

}  // namespace relay
