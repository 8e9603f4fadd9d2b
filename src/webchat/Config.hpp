// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <mcp/ConnectionManager.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace webchat
{

/// @brief Top-level application configuration.
struct AppConfig
{
    /// @brief Provider document (the "mcpServers" file).
    std::filesystem::path mcpConfigPath;

    /// @brief User settings file (activated servers, auto-execute policy).
    std::filesystem::path settingsPath;

    log::Level logLevel = log::Level::Info;

    /// @brief Whether activated providers are connected on startup.
    bool autoStart = true;

    std::chrono::milliseconds autoStartDelay { 1000 };
    std::chrono::milliseconds requestTimeout { std::chrono::seconds(120) };
};

/// @brief Name of the environment variable overriding the provider document path.
constexpr auto McpConfigPathEnvironmentVariable = std::string_view { "MCP_SERVERS_CONFIG_PATH" };

/// @brief Returns the provider document path: $MCP_SERVERS_CONFIG_PATH, else ./mcp-servers.json.
[[nodiscard]] auto defaultMcpConfigPath() -> std::filesystem::path;

/// @brief Returns the settings file path: ./webchat-settings.json.
[[nodiscard]] auto defaultSettingsPath() -> std::filesystem::path;

/// @brief Returns a configuration with every path resolved to its default.
[[nodiscard]] auto defaultAppConfig() -> AppConfig;

/// @brief Checks option values that the command line parser cannot.
[[nodiscard]] auto validateAppConfig(const AppConfig& config) -> VoidResult;

/// @brief Derives the connection manager options from the application configuration.
[[nodiscard]] auto connectionManagerOptions(const AppConfig& config) -> ConnectionManagerOptions;

} // namespace webchat
