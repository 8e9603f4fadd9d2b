// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace webchat
{

/// @brief How a tool provider is reached.
enum class TransportKind
{
    Stdio,  ///< Spawned local process speaking over its stdin/stdout.
    Socket, ///< Persistent outbound socket (tcp:// or ws://).
};

[[nodiscard]] constexpr auto transportKindName(TransportKind kind) -> std::string_view
{
    switch (kind)
    {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Socket: return "websocket";
    }
    return "stdio";
}

/// @brief Parses a transport name from the provider document.
///
/// Accepts "stdio", and "websocket", "socket" or "tcp" for socket providers.
/// @return The transport kind, or a ConfigError naming the unsupported value.
[[nodiscard]] auto transportKindFromString(std::string_view name) -> Result<TransportKind>;

/// @brief Static description of one tool provider.
struct ProviderConfig
{
    std::string id;
    std::string name;
    TransportKind transport = TransportKind::Stdio;
    std::string url;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool disabled = false;

    /// Declared tools and resources; live discovery replaces them once connected.
    std::vector<ToolDefinition> tools;
    std::vector<ResourceDefinition> resources;
};

/// @brief Parses a single provider definition.
///
/// Missing fields fall back to: name = id, url = "stdio://<id>", transport = "stdio".
/// A provider with a command but no declared tools gets a placeholder tool
/// named "<id>_tool" so it is visible before discovery.
/// @param id The provider id.
/// @param definition The JSON object describing the provider.
/// @return The parsed config, or a ConfigError if the entry is unusable.
[[nodiscard]] auto parseProviderEntry(const std::string& id, const nlohmann::json& definition)
    -> Result<ProviderConfig>;

/// @brief Parses a provider document.
///
/// Accepts {"mcpServers": {id: definition, ...}} or a bare array of
/// definitions, where each may carry an "id" (fallback "server-<index>").
/// Invalid entries are logged and skipped.
/// @param document The parsed document.
/// @return The valid providers in document order.
[[nodiscard]] auto parseProviderDocument(const nlohmann::json& document) -> std::vector<ProviderConfig>;

/// @brief The example providers used when no usable configuration exists.
[[nodiscard]] auto builtinProviders() -> std::vector<ProviderConfig>;

/// @brief Reads and parses a provider document from disk.
/// @param path The document path.
/// @return The JSON document, IoError if unreadable, ConfigError if not valid JSON.
[[nodiscard]] auto readProviderDocument(const std::filesystem::path& path) -> Result<nlohmann::json>;

/// @brief Number of providers a document declares, counting both accepted shapes.
[[nodiscard]] auto countProviderEntries(const nlohmann::json& document) -> size_t;

/// @brief Serializes a provider config for display.
[[nodiscard]] auto toJson(const ProviderConfig& config) -> nlohmann::json;

} // namespace webchat
