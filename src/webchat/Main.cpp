// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <webchat/App.hpp>
#include <webchat/Config.hpp>

#include <CLI/CLI.hpp>

#include <chrono>
#include <string>

int main(int argc, char** argv)
{
    auto app = CLI::App { "webchat-mcp - MCP tool server connection manager" };

    auto config = webchat::defaultAppConfig();

    auto configPath = std::string {};
    auto settingsPath = std::string {};
    auto logLevel = std::string {};
    auto verbose = false;
    auto noAutoStart = false;
    auto autoStartDelayMs = static_cast<int>(config.autoStartDelay.count());
    auto timeoutSeconds =
        static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(config.requestTimeout).count());

    app.add_option("-c,--config",
                   configPath,
                   "Path to the MCP servers file (default: $MCP_SERVERS_CONFIG_PATH or ./mcp-servers.json)");
    app.add_option("-s,--settings", settingsPath, "Path to the settings file (default: ./webchat-settings.json)");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--no-auto-start", noAutoStart, "Do not connect activated servers on startup");
    app.add_option("--auto-start-delay", autoStartDelayMs, "Delay between auto-started servers in milliseconds");
    app.add_option("--timeout", timeoutSeconds, "Request timeout in seconds");

    CLI11_PARSE(app, argc, argv);

    if (!configPath.empty())
        config.mcpConfigPath = configPath;
    if (!settingsPath.empty())
        config.settingsPath = settingsPath;
    if (verbose)
        config.logLevel = webchat::log::Level::Debug;
    if (!logLevel.empty())
    {
        auto const level = webchat::log::levelFromString(logLevel);
        if (!level)
        {
            webchat::log::error("Unknown log level: {}", logLevel);
            return 1;
        }
        config.logLevel = *level;
    }
    config.autoStart = !noAutoStart;
    config.autoStartDelay = std::chrono::milliseconds(autoStartDelayMs);
    config.requestTimeout = std::chrono::seconds(timeoutSeconds);

    auto application = webchat::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        webchat::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
