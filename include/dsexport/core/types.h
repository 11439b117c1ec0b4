#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace dsexport {

using ByteSpan = std::span<const std::byte>;

// Error codes produced by the transport layer (HTTP client, file sink).
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    HttpStatus,
    MalformedResponse,
    IoError,
    Cancelled,
    Unknown
};

constexpr const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::HttpStatus: return "HTTP error status";
        case ErrorCode::MalformedResponse: return "Malformed response";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<int> httpStatus{}; // set when the server answered with a status >= 400

    Error() = default;
    Error(ErrorCode c, std::string msg, std::optional<int> status = std::nullopt)
        : code(c), message(std::move(msg)), httpStatus(status) {}
    explicit Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
};

/**
 * Minimal Expected<T> for the transport layer (no exceptions).
 * If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    explicit operator bool() const noexcept { return _ok; }

    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    explicit operator bool() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

} // namespace dsexport

// fmt support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<dsexport::ErrorCode> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(dsexport::ErrorCode code, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(dsexport::errorCodeToString(code), ctx);
    }
};
