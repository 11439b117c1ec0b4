#pragma once

#include <dsexport/core/types.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace dsexport {

// Kinds of failure surfaced by the export pipeline
enum class ExportError {
    Configuration,
    AuthExpired,
    Api,
    Network,
    Io,
    InvalidArgument,
    Unknown
};

inline const char* exportErrorToString(ExportError error) {
    switch (error) {
        case ExportError::Configuration: return "Configuration error";
        case ExportError::AuthExpired: return "Authentication expired";
        case ExportError::Api: return "API error";
        case ExportError::Network: return "Network error";
        case ExportError::Io: return "I/O error";
        case ExportError::InvalidArgument: return "Invalid argument";
        case ExportError::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Base exception for the export pipeline
class ExportException : public std::runtime_error {
public:
    ExportException(ExportError error, const std::string& message)
        : std::runtime_error(message), error_(error) {}

    [[nodiscard]] ExportError getError() const noexcept { return error_; }

    [[nodiscard]] const char* errorString() const noexcept { return exportErrorToString(error_); }

private:
    ExportError error_;
};

// Invalid or incomplete session setup; never retried
class ConfigurationError : public ExportException {
public:
    ConfigurationError(std::string field, const std::string& message)
        : ExportException(ExportError::Configuration, message), field_(std::move(field)) {}

    // Name of the first field that failed validation
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

// 401 from the remote API; fatal to the whole session
class AuthExpiredError : public ExportException {
public:
    AuthExpiredError()
        : ExportException(ExportError::AuthExpired,
                          "Token expired. Please refresh your authentication token.") {}
};

// Non-auth HTTP failure (after retries, or not retryable)
class ApiError : public ExportException {
public:
    ApiError(std::optional<int> status, std::string apiMessage)
        : ExportException(ExportError::Api, format(status, apiMessage)), status_(status),
          apiMessage_(std::move(apiMessage)) {}

    [[nodiscard]] std::optional<int> status() const noexcept { return status_; }
    [[nodiscard]] const std::string& apiMessage() const noexcept { return apiMessage_; }

private:
    static std::string format(std::optional<int> status, const std::string& msg) {
        std::string out = "API error: " + msg;
        if (status) {
            out += " (status " + std::to_string(*status) + ")";
        }
        return out;
    }

    std::optional<int> status_;
    std::string apiMessage_;
};

// Transport-level failure without an HTTP status
class NetworkError : public ExportException {
public:
    explicit NetworkError(const std::string& message)
        : ExportException(ExportError::Network, "Network error: " + message) {}
};

} // namespace dsexport
