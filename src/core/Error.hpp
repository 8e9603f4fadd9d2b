// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace webchat
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    TransportError,
    ProtocolError,
    TimeoutError,
    NotFoundError,
    ExecutionError,
};

/// @brief Returns a short human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IoError: return "io";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::TransportError: return "transport";
        case ErrorCode::ProtocolError: return "protocol";
        case ErrorCode::TimeoutError: return "timeout";
        case ErrorCode::NotFoundError: return "not-found";
        case ErrorCode::ExecutionError: return "execution";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
///
/// The optional payload carries structured detail, e.g. the JSON-RPC error
/// object a tool provider answered with.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    nlohmann::json payload {};
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message), {} });
}

/// @brief Creates an unexpected Error value carrying a structured payload.
/// @param code The error code.
/// @param message A descriptive error message.
/// @param payload Structured detail attached to the error.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message, nlohmann::json payload)
    -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message), std::move(payload) });
}

} // namespace webchat

template <>
struct std::formatter<webchat::Error>: std::formatter<std::string>
{
    auto format(const webchat::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", webchat::errorCodeName(error.code), error.message), ctx);
    }
};
