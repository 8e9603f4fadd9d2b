// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace webchat::jsonrpc
{

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Kind of an inbound JSON-RPC message.
enum class MessageKind
{
    Response,
    Notification,
    Request,
};

/// @brief Represents a parsed JSON-RPC 2.0 message received from a provider.
struct Response
{
    MessageKind kind = MessageKind::Response;
    nlohmann::json id;
    std::optional<std::string> method;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }

    /// @brief Returns the numeric request id, if the message carries one.
    [[nodiscard]] auto numericId() const -> std::optional<int64_t>
    {
        if (id.is_number_integer())
            return id.get<int64_t>();
        return std::nullopt;
    }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Serializes a message for a newline-delimited stream.
/// @param message The JSON-RPC message.
/// @return The compact JSON text followed by a single newline.
[[nodiscard]] auto encode(const nlohmann::json& message) -> std::string;

/// @brief Parses an inbound JSON-RPC 2.0 message.
/// @param message The JSON message to parse.
/// @return The parsed message or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Converts an RPC error into the application error model.
///
/// The provider's original error object is kept as the error payload.
/// @param error The RPC error.
/// @param method The method that failed, for the message text.
[[nodiscard]] auto toError(const RpcError& error, std::string_view method) -> Error;

} // namespace webchat::jsonrpc
