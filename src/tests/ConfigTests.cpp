// SPDX-License-Identifier: Apache-2.0
#include <webchat/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <optional>
#include <string>

using namespace webchat;

namespace
{

/// Sets an environment variable for the lifetime of the object.
class ScopedEnvironment
{
  public:
    ScopedEnvironment(std::string name, const char* value): _name(std::move(name))
    {
        if (auto const* previous = std::getenv(_name.c_str()))
            _previous = previous;
        if (value)
            ::setenv(_name.c_str(), value, 1);
        else
            ::unsetenv(_name.c_str());
    }

    ~ScopedEnvironment()
    {
        if (_previous)
            ::setenv(_name.c_str(), _previous->c_str(), 1);
        else
            ::unsetenv(_name.c_str());
    }

  private:
    std::string _name;
    std::optional<std::string> _previous;
};

} // namespace

TEST_CASE("defaultMcpConfigPath honors MCP_SERVERS_CONFIG_PATH", "[config]")
{
    SECTION("variable set")
    {
        auto const env = ScopedEnvironment(std::string(McpConfigPathEnvironmentVariable), "/etc/webchat/servers.json");
        CHECK(defaultMcpConfigPath() == "/etc/webchat/servers.json");
    }

    SECTION("variable unset")
    {
        auto const env = ScopedEnvironment(std::string(McpConfigPathEnvironmentVariable), nullptr);
        CHECK(defaultMcpConfigPath() == "./mcp-servers.json");
    }

    SECTION("variable empty")
    {
        auto const env = ScopedEnvironment(std::string(McpConfigPathEnvironmentVariable), "");
        CHECK(defaultMcpConfigPath() == "./mcp-servers.json");
    }
}

TEST_CASE("defaultSettingsPath names the settings file", "[config]")
{
    auto const path = defaultSettingsPath();
    CHECK(path.filename() == "webchat-settings.json");
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = defaultAppConfig();
    CHECK(!config.mcpConfigPath.empty());
    CHECK(!config.settingsPath.empty());
    CHECK(config.logLevel == log::Level::Info);
    CHECK(config.autoStart);
    CHECK(config.autoStartDelay == std::chrono::milliseconds(1000));
    CHECK(config.requestTimeout == std::chrono::seconds(120));
    CHECK(validateAppConfig(config).has_value());
}

TEST_CASE("validateAppConfig rejects unusable values", "[config]")
{
    auto config = defaultAppConfig();

    SECTION("empty provider document path")
    {
        config.mcpConfigPath.clear();
    }

    SECTION("empty settings path")
    {
        config.settingsPath.clear();
    }

    SECTION("non-positive timeout")
    {
        config.requestTimeout = std::chrono::milliseconds(0);
    }

    SECTION("negative auto-start delay")
    {
        config.autoStartDelay = std::chrono::milliseconds(-5);
    }

    auto const valid = validateAppConfig(config);
    REQUIRE(!valid.has_value());
    CHECK(valid.error().code == ErrorCode::ConfigError);
}

TEST_CASE("connectionManagerOptions carries paths and timings", "[config]")
{
    auto config = defaultAppConfig();
    config.mcpConfigPath = "/srv/mcp.json";
    config.autoStartDelay = std::chrono::milliseconds(250);
    config.requestTimeout = std::chrono::seconds(30);

    auto const options = connectionManagerOptions(config);
    CHECK(options.configPath == "/srv/mcp.json");
    CHECK(options.autoStartDelay == std::chrono::milliseconds(250));
    CHECK(options.session.requestTimeout == std::chrono::seconds(30));
    CHECK(options.session.clientName == "webchat-ui");
}
