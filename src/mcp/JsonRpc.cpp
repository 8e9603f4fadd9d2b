// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace webchat::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto encode(const nlohmann::json& message) -> std::string
{
    // Invalid UTF-8 in tool output must not take the stream down.
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (err.is_object())
        {
            response.error = RpcError {
                .code = json::getIntOr(err, "code", 0),
                .message = json::getStringOr(err, "message", "Unknown error"),
                .data = err.contains("data") ? err["data"] : nlohmann::json {},
            };
        }
        else
        {
            response.error = RpcError {
                .code = 0,
                .message = err.is_string() ? err.get<std::string>() : err.dump(),
                .data = err,
            };
        }
    }
    else if (message.contains("method") && message["method"].is_string())
    {
        response.method = message["method"].get<std::string>();
        response.kind = response.id.is_null() ? MessageKind::Notification : MessageKind::Request;
    }
    else
    {
        // It's neither a valid response nor a notification
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto toError(const RpcError& error, std::string_view method) -> Error
{
    auto payload = nlohmann::json {
        { "code", error.code },
        { "message", error.message },
    };
    if (!error.data.is_null())
        payload["data"] = error.data;

    return Error {
        .code = ErrorCode::ExecutionError,
        .message = std::format("{} failed with RPC error {}: {}", method, error.code, error.message),
        .payload = std::move(payload),
    };
}

} // namespace webchat::jsonrpc
