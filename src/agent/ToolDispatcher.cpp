// SPDX-License-Identifier: Apache-2.0
#include "ToolDispatcher.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ArgumentRepair.hpp>

#include <algorithm>
#include <format>
#include <future>

namespace webchat
{

auto flattenToolContent(const nlohmann::json& payload) -> std::string
{
    auto text = std::string {};
    if (payload.is_object() && payload.contains("content") && payload["content"].is_array())
    {
        for (const auto& item: payload["content"])
        {
            if (json::getStringOr(item, "type", "") != "text")
                continue;
            if (!text.empty())
                text += "\n";
            text += json::getStringOr(item, "text", "");
        }
    }

    if (text.empty())
        return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return text;
}

auto toolCallsFromJson(const nlohmann::json& document) -> Result<std::vector<ToolCall>>
{
    auto const items = document.is_array() ? document : nlohmann::json::array({ document });

    auto calls = std::vector<ToolCall> {};
    for (size_t index = 0; index < items.size(); ++index)
    {
        auto const& item = items[index];
        if (!item.is_object())
            return makeError(ErrorCode::InvalidArgument, std::format("Tool call #{} is not an object", index));

        auto const& body = item.contains("function") && item["function"].is_object() ? item["function"] : item;
        auto name = json::getStringOr(body, "name", "");
        if (name.empty())
            return makeError(ErrorCode::InvalidArgument, std::format("Tool call #{} has no name", index));

        calls.push_back(ToolCall {
            .id = json::getStringOr(item, "id", std::format("call-{}", index)),
            .name = std::move(name),
            .arguments = body.contains("arguments") ? body["arguments"] : nlohmann::json {},
        });
    }
    return calls;
}

auto toJson(const ToolResult& result) -> nlohmann::json
{
    auto obj = nlohmann::json {
        { "tool_call_id", result.callId },
        { "content", result.content },
        { "isError", result.isError },
    };
    if (!result.providerId.empty())
        obj["serverId"] = result.providerId;
    if (!result.payload.is_null())
        obj["result"] = result.payload;
    return obj;
}

ToolDispatcher::ToolDispatcher(ConnectionManager& manager): _manager(manager)
{
}

auto ToolDispatcher::plan(const std::vector<ToolCall>& calls, const ExecutionPolicy& policy) -> DispatchPlan
{
    auto result = DispatchPlan {};
    for (const auto& call: calls)
    {
        auto const allowed =
            !policy.requireConfirmationForAll && std::ranges::find(policy.autoExecuteTools, call.name)
                                                     != policy.autoExecuteTools.end();
        if (allowed)
            result.autoExecute.push_back(call);
        else
            result.needsConfirmation.push_back(call);
    }

    log::debug("Tool calls: {} auto-executable, {} need confirmation",
               result.autoExecute.size(),
               result.needsConfirmation.size());
    return result;
}

auto ToolDispatcher::executeOne(const ToolCall& call) -> Result<ToolResult>
{
    auto const providerId = _manager.findProviderForTool(call.name);
    if (!providerId)
        return makeError(ErrorCode::NotFoundError,
                         std::format("Tool {} not found on any connected server", call.name));

    auto arguments = normalizeToolArguments(call.arguments);
    if (!arguments)
        return std::unexpected(arguments.error());

    auto resolved = ToolCall { .id = call.id, .name = call.name, .arguments = std::move(*arguments) };
    return _manager.executeTool(*providerId, resolved).transform([&](nlohmann::json payload) {
        auto const isError = json::getBoolOr(payload, "isError", false);
        auto content = flattenToolContent(payload);
        return ToolResult {
            .callId = call.id,
            .providerId = *providerId,
            .payload = std::move(payload),
            .content = std::move(content),
            .isError = isError,
        };
    });
}

auto ToolDispatcher::execute(const std::vector<ToolCall>& calls) -> std::vector<ToolResult>
{
    log::info("Executing {} tool call(s)", calls.size());

    auto pending = std::vector<std::future<Result<ToolResult>>> {};
    pending.reserve(calls.size());
    for (const auto& call: calls)
        pending.push_back(std::async(std::launch::async, [this, &call] { return executeOne(call); }));

    auto results = std::vector<ToolResult> {};
    results.reserve(calls.size());
    for (size_t i = 0; i < calls.size(); ++i)
    {
        auto outcome = pending[i].get();
        if (outcome)
        {
            results.push_back(std::move(*outcome));
            continue;
        }

        log::error("Tool call {} ({}) failed: {}", calls[i].id, calls[i].name, outcome.error().message);
        results.push_back(ToolResult {
            .callId = calls[i].id,
            .providerId = {},
            .payload = { { "error", outcome.error().message } },
            .content = std::format("Error: {}", outcome.error().message),
            .isError = true,
        });
    }

    return results;
}

} // namespace webchat
