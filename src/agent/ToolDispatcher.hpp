// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ConnectionManager.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace webchat
{

/// @brief Which tool calls may run without asking the user first.
struct ExecutionPolicy
{
    std::vector<std::string> autoExecuteTools;
    bool requireConfirmationForAll = false;
};

/// @brief Tool calls split by whether they need user confirmation.
struct DispatchPlan
{
    std::vector<ToolCall> autoExecute;
    std::vector<ToolCall> needsConfirmation;
};

/// @brief Joins the text items of a tools/call result.
///
/// Falls back to the compact JSON of the whole payload when it carries no text content.
[[nodiscard]] auto flattenToolContent(const nlohmann::json& payload) -> std::string;

/// @brief Reads tool calls from JSON.
///
/// Accepts a single call or an array of calls, each either flat
/// ({"id", "name", "arguments"}) or in function-call form
/// ({"id", "function": {"name", "arguments"}}). Missing ids become "call-<index>".
[[nodiscard]] auto toolCallsFromJson(const nlohmann::json& document) -> Result<std::vector<ToolCall>>;

/// @brief Serializes a tool result as the chat engine consumes it.
[[nodiscard]] auto toJson(const ToolResult& result) -> nlohmann::json;

/// @brief Executes tool calls requested by the language model against the connected providers.
///
/// Each call is routed to the first connected provider offering the tool.
/// Calls of one batch run concurrently; results keep the order of the calls.
class ToolDispatcher
{
  public:
    /// @brief Constructs a ToolDispatcher.
    /// @param manager The connection manager; must outlive the dispatcher.
    explicit ToolDispatcher(ConnectionManager& manager);

    /// @brief Splits @p calls according to @p policy.
    [[nodiscard]] static auto plan(const std::vector<ToolCall>& calls, const ExecutionPolicy& policy)
        -> DispatchPlan;

    /// @brief Executes a batch of tool calls.
    /// @return One result per call; failures are results with isError set.
    [[nodiscard]] auto execute(const std::vector<ToolCall>& calls) -> std::vector<ToolResult>;

    /// @brief Executes a single tool call.
    [[nodiscard]] auto executeOne(const ToolCall& call) -> Result<ToolResult>;

  private:
    ConnectionManager& _manager;
};

} // namespace webchat
