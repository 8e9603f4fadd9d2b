// SPDX-License-Identifier: Apache-2.0
#include "ProviderConfig.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <fstream>
#include <sstream>

namespace webchat
{

namespace
{

    auto parseToolList(const nlohmann::json& definition) -> std::vector<ToolDefinition>
    {
        auto tools = std::vector<ToolDefinition> {};
        if (!definition.contains("tools") || !definition["tools"].is_array())
            return tools;

        for (const auto& toolJson: definition["tools"])
        {
            auto name = json::getStringOr(toolJson, "name", "");
            if (name.empty())
                continue;

            auto schema = toolJson.contains("inputSchema") && toolJson["inputSchema"].is_object()
                              ? toolJson["inputSchema"]
                              : emptyObjectSchema();

            tools.push_back(ToolDefinition {
                .name = std::move(name),
                .description = json::getStringOr(toolJson, "description", ""),
                .inputSchema = std::move(schema),
            });
        }
        return tools;
    }

    auto parseResourceList(const nlohmann::json& definition) -> std::vector<ResourceDefinition>
    {
        auto resources = std::vector<ResourceDefinition> {};
        if (!definition.contains("resources") || !definition["resources"].is_array())
            return resources;

        for (const auto& item: definition["resources"])
        {
            auto uri = json::getStringOr(item, "uri", "");
            if (uri.empty())
                continue;

            auto resource = ResourceDefinition { .uri = uri, .name = json::getStringOr(item, "name", uri) };
            if (item.contains("description") && item["description"].is_string())
                resource.description = item["description"].get<std::string>();
            if (item.contains("mimeType") && item["mimeType"].is_string())
                resource.mimeType = item["mimeType"].get<std::string>();
            resources.push_back(std::move(resource));
        }
        return resources;
    }

    auto stringSchemaProperty(std::string_view type, std::string_view description) -> nlohmann::json
    {
        return nlohmann::json {
            { "type", type },
            { "description", description },
        };
    }

} // namespace

auto transportKindFromString(std::string_view name) -> Result<TransportKind>
{
    if (name == "stdio")
        return TransportKind::Stdio;
    if (name == "websocket" || name == "socket" || name == "tcp")
        return TransportKind::Socket;
    return makeError(ErrorCode::ConfigError, std::format("Unsupported transport: {}", name));
}

auto parseProviderEntry(const std::string& id, const nlohmann::json& definition) -> Result<ProviderConfig>
{
    if (id.empty())
        return makeError(ErrorCode::ConfigError, "Provider id must not be empty");
    if (!definition.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Provider '{}' must be a JSON object", id));

    auto transport = transportKindFromString(json::getStringOr(definition, "transport", "stdio"));
    if (!transport)
        return makeError(ErrorCode::ConfigError, std::format("Provider '{}': {}", id, transport.error().message));

    auto config = ProviderConfig {
        .id = id,
        .name = json::getStringOr(definition, "name", ""),
        .transport = *transport,
        .url = json::getStringOr(definition, "url", ""),
        .command = json::getStringOr(definition, "command", ""),
        .args = json::getStringArray(definition, "args"),
        .env = json::getStringMap(definition, "env"),
        .disabled = json::getBoolOr(definition, "disabled", false),
        .tools = parseToolList(definition),
        .resources = parseResourceList(definition),
    };

    if (config.name.empty())
        config.name = id;
    if (config.url.empty())
        config.url = std::format("stdio://{}", id);

    // Makes the provider visible before discovery has run.
    if (config.tools.empty() && !config.command.empty())
    {
        config.tools.push_back(ToolDefinition {
            .name = std::format("{}_tool", id),
            .description = std::format("Tool from {}", config.name),
            .inputSchema = emptyObjectSchema(),
        });
    }

    return config;
}

auto parseProviderDocument(const nlohmann::json& document) -> std::vector<ProviderConfig>
{
    auto providers = std::vector<ProviderConfig> {};

    auto const accept = [&providers](const std::string& id, const nlohmann::json& definition) {
        auto parsed = parseProviderEntry(id, definition);
        if (!parsed)
        {
            log::warning("Skipping MCP server '{}': {}", id, parsed.error().message);
            return;
        }
        for (const auto& existing: providers)
        {
            if (existing.id == parsed->id)
            {
                log::warning("Skipping duplicate MCP server id '{}'", id);
                return;
            }
        }
        providers.push_back(std::move(*parsed));
    };

    if (document.is_object() && document.contains("mcpServers") && document["mcpServers"].is_object())
    {
        for (const auto& [id, definition]: document["mcpServers"].items())
            accept(id, definition);
    }
    else if (document.is_array())
    {
        for (size_t index = 0; index < document.size(); ++index)
        {
            auto const& definition = document[index];
            auto const id = json::getStringOr(definition, "id", std::format("server-{}", index));
            accept(id, definition);
        }
    }

    return providers;
}

auto builtinProviders() -> std::vector<ProviderConfig>
{
    auto filesystem = ProviderConfig {
        .id = "filesystem",
        .name = "File System Tools",
        .transport = TransportKind::Stdio,
        .url = "stdio://filesystem",
    };
    filesystem.tools = {
        ToolDefinition {
            .name = "read_file",
            .description = "Read the contents of a file",
            .inputSchema = {
                { "type", "object" },
                { "properties", { { "path", stringSchemaProperty("string", "Path to the file") } } },
                { "required", nlohmann::json::array({ "path" }) },
            },
        },
        ToolDefinition {
            .name = "write_file",
            .description = "Write content to a file",
            .inputSchema = {
                { "type", "object" },
                { "properties",
                  {
                      { "path", stringSchemaProperty("string", "Path to the file") },
                      { "content", stringSchemaProperty("string", "Content to write") },
                  } },
                { "required", nlohmann::json::array({ "path", "content" }) },
            },
        },
    };

    auto webSearch = ProviderConfig {
        .id = "web-search",
        .name = "Web Search Tools",
        .transport = TransportKind::Stdio,
        .url = "stdio://web-search",
    };
    webSearch.tools = {
        ToolDefinition {
            .name = "search_web",
            .description = "Search the web for information",
            .inputSchema = {
                { "type", "object" },
                { "properties",
                  {
                      { "query", stringSchemaProperty("string", "Search query") },
                      { "limit", stringSchemaProperty("number", "Maximum number of results") },
                  } },
                { "required", nlohmann::json::array({ "query" }) },
            },
        },
    };

    return { std::move(filesystem), std::move(webSearch) };
}

auto readProviderDocument(const std::filesystem::path& path) -> Result<nlohmann::json>
{
    auto file = std::ifstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open MCP config file: {}", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto document = json::parse(ss.str());
    if (!document)
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid MCP config file {}: {}", path.string(), document.error().message));
    return document;
}

auto countProviderEntries(const nlohmann::json& document) -> size_t
{
    if (document.is_object() && document.contains("mcpServers") && document["mcpServers"].is_object())
        return document["mcpServers"].size();
    if (document.is_array())
        return document.size();
    return 0;
}

auto toJson(const ProviderConfig& config) -> nlohmann::json
{
    auto tools = nlohmann::json::array();
    for (const auto& tool: config.tools)
        tools.push_back(toJson(tool));

    auto resources = nlohmann::json::array();
    for (const auto& resource: config.resources)
        resources.push_back(toJson(resource));

    auto obj = nlohmann::json {
        { "id", config.id },
        { "name", config.name },
        { "transport", transportKindName(config.transport) },
        { "url", config.url },
        { "disabled", config.disabled },
        { "tools", std::move(tools) },
        { "resources", std::move(resources) },
    };
    if (!config.command.empty())
    {
        obj["command"] = config.command;
        obj["args"] = config.args;
    }
    if (!config.env.empty())
        obj["env"] = config.env;
    return obj;
}

} // namespace webchat
