// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace webchat
{

/// @brief Represents a tool call request from the LLM.
///
/// Arguments are normally a JSON object; some function-call encodings deliver
/// them as JSON text, in which case `arguments` holds a string.
struct ToolCall
{
    std::string id;
    std::string name;
    nlohmann::json arguments;
};

/// @brief Represents the result of executing a tool call.
struct ToolResult
{
    std::string callId;
    std::string providerId;
    nlohmann::json payload;
    std::string content;
    bool isError = false;
};

/// @brief Defines a tool that the LLM can invoke.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief A tool together with the provider that offers it.
struct ProviderTool
{
    std::string providerId;
    ToolDefinition tool;
};

/// @brief A resource advertised by a tool provider.
struct ResourceDefinition
{
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
};

/// @brief Returns the default input schema for tools that do not declare one.
[[nodiscard]] inline auto emptyObjectSchema() -> nlohmann::json
{
    return nlohmann::json {
        { "type", "object" },
        { "properties", nlohmann::json::object() },
        { "required", nlohmann::json::array() },
    };
}

/// @brief Serializes a tool definition to its wire shape.
[[nodiscard]] inline auto toJson(const ToolDefinition& tool) -> nlohmann::json
{
    return nlohmann::json {
        { "name", tool.name },
        { "description", tool.description },
        { "inputSchema", tool.inputSchema },
    };
}

/// @brief Serializes a resource definition to its wire shape.
[[nodiscard]] inline auto toJson(const ResourceDefinition& resource) -> nlohmann::json
{
    auto obj = nlohmann::json {
        { "uri", resource.uri },
        { "name", resource.name },
    };
    if (resource.description)
        obj["description"] = *resource.description;
    if (resource.mimeType)
        obj["mimeType"] = *resource.mimeType;
    return obj;
}

} // namespace webchat
