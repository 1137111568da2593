#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace marketlink {

/// Error codes for marketlink operations
enum class ErrorCode {
    Ok = 0,
    NetworkError,        // transport failure, the request may not have reached the exchange
    HttpError,           // exchange answered with a non-2xx status
    ParseError,
    SigningError,
    InvalidRequest,
    ConnectionExhausted, // streaming handshake budget exceeded
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "ok";
        case ErrorCode::NetworkError:
            return "network_error";
        case ErrorCode::HttpError:
            return "http_error";
        case ErrorCode::ParseError:
            return "parse_error";
        case ErrorCode::SigningError:
            return "signing_error";
        case ErrorCode::InvalidRequest:
            return "invalid_request";
        case ErrorCode::ConnectionExhausted:
            return "connection_exhausted";
        case ErrorCode::Unknown:
            return "unknown";
    }
    return "unknown";
}

/// Error information returned by marketlink operations
struct Error {
    ErrorCode code;
    std::string message;
    int http_status{0};
    std::string body; // response body for HttpError, verbatim

    [[nodiscard]] static Error network(std::string msg) {
        return {ErrorCode::NetworkError, std::move(msg)};
    }

    [[nodiscard]] static Error http(int status, std::string response_body) {
        return {ErrorCode::HttpError, "HTTP " + std::to_string(status), status,
                std::move(response_body)};
    }

    [[nodiscard]] static Error parse(std::string msg) {
        return {ErrorCode::ParseError, std::move(msg)};
    }

    [[nodiscard]] static Error signing(std::string msg) {
        return {ErrorCode::SigningError, std::move(msg)};
    }

    [[nodiscard]] static Error invalid(std::string msg) {
        return {ErrorCode::InvalidRequest, std::move(msg)};
    }

    [[nodiscard]] static Error exhausted(std::string msg) {
        return {ErrorCode::ConnectionExhausted, std::move(msg)};
    }
};

/// Result type for marketlink operations
template <typename T>
using Result = std::expected<T, Error>;

} // namespace marketlink
