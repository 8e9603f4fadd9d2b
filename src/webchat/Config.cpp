// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <cstdlib>
#include <format>

namespace webchat
{

auto defaultMcpConfigPath() -> std::filesystem::path
{
    auto const* const fromEnv = std::getenv(std::string(McpConfigPathEnvironmentVariable).c_str());
    if (fromEnv && *fromEnv)
        return fromEnv;
    return "./mcp-servers.json";
}

auto defaultSettingsPath() -> std::filesystem::path
{
    auto ec = std::error_code {};
    auto cwd = std::filesystem::current_path(ec);
    if (ec)
        return "webchat-settings.json";
    return cwd / "webchat-settings.json";
}

auto defaultAppConfig() -> AppConfig
{
    return AppConfig {
        .mcpConfigPath = defaultMcpConfigPath(),
        .settingsPath = defaultSettingsPath(),
    };
}

auto validateAppConfig(const AppConfig& config) -> VoidResult
{
    if (config.mcpConfigPath.empty())
        return makeError(ErrorCode::ConfigError, "MCP config path must not be empty");
    if (config.settingsPath.empty())
        return makeError(ErrorCode::ConfigError, "Settings path must not be empty");
    if (config.requestTimeout.count() <= 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("Request timeout must be positive, got {}ms", config.requestTimeout.count()));
    if (config.autoStartDelay.count() < 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("Auto-start delay must not be negative, got {}ms", config.autoStartDelay.count()));
    return {};
}

auto connectionManagerOptions(const AppConfig& config) -> ConnectionManagerOptions
{
    auto options = ConnectionManagerOptions {
        .configPath = config.mcpConfigPath,
        .autoStartDelay = config.autoStartDelay,
    };
    options.session.requestTimeout = config.requestTimeout;
    return options;
}

} // namespace webchat
