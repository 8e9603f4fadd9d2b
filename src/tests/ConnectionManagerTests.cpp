// SPDX-License-Identifier: Apache-2.0
#include <mcp/ConnectionManager.hpp>

#include <catch2/catch_test_macros.hpp>

#include "GatedTransport.hpp"
#include "MockProvider.hpp"
#include "TempDirectory.hpp"

#include <chrono>
#include <fstream>
#include <future>
#include <mutex>
#include <utility>
#include <vector>

using namespace webchat;
using webchat::test::MockProvider;
using webchat::test::OpenGate;
using webchat::test::TempDirectory;

namespace
{

constexpr auto WaitTimeout = std::chrono::seconds(5);

/// Settings kept in memory.
class MemorySettingsStore: public SettingsStore
{
  public:
    explicit MemorySettingsStore(std::vector<std::string> activated): _activated(std::move(activated)) {}

    auto activatedProviderIds() -> Result<std::vector<std::string>> override
    {
        auto const lock = std::lock_guard(_mutex);
        if (_broken)
            return makeError(ErrorCode::ConfigError, "settings unreadable");
        return _activated;
    }

    auto setActivatedProviderIds(std::vector<std::string> ids) -> VoidResult override
    {
        auto const lock = std::lock_guard(_mutex);
        _activated = std::move(ids);
        ++_writes;
        return {};
    }

    void setBroken(bool broken)
    {
        auto const lock = std::lock_guard(_mutex);
        _broken = broken;
    }

    [[nodiscard]] auto writes() const -> int
    {
        auto const lock = std::lock_guard(_mutex);
        return _writes;
    }

  private:
    mutable std::mutex _mutex;
    std::vector<std::string> _activated;
    bool _broken = false;
    int _writes = 0;
};

void writeFile(const std::filesystem::path& path, std::string_view content)
{
    auto file = std::ofstream(path);
    file << content;
}

auto optionsFor(const std::filesystem::path& configPath) -> ConnectionManagerOptions
{
    return ConnectionManagerOptions {
        .configPath = configPath,
        .autoStartDelay = std::chrono::milliseconds(1),
    };
}

auto mockTools() -> nlohmann::json
{
    return nlohmann::json::array({
        { { "name", "read_file" }, { "description", "Read a file" } },
        { { "name", "write_file" }, { "description", "Write a file" } },
    });
}

auto twoProviderDocument() -> nlohmann::json
{
    return nlohmann::json::parse(R"({
        "mcpServers": {
            "fs": { "name": "FS", "command": "mock-fs" },
            "search": { "name": "Search", "command": "mock-search", "disabled": true }
        }
    })");
}

} // namespace

TEST_CASE("ConnectionManager connects a configured process provider", "[manager]")
{
    auto const dir = TempDirectory {};
    writeFile(dir / "mcp-servers.json", R"({"mcpServers":{"fs":{"name":"FS","command":"echo","args":[]}}})");

    auto mutex = std::mutex {};
    auto seen = std::vector<std::pair<std::string, SessionStatus>> {};
    auto settings = std::make_shared<MemorySettingsStore>(std::vector<std::string> {});
    auto manager = ConnectionManager(optionsFor(dir / "mcp-servers.json"), settings);
    REQUIRE(manager.loadConfiguration() == 1);

    manager.setStatusListener([&](const std::string& providerId, SessionStatus status) {
        auto const lock = std::lock_guard(mutex);
        seen.emplace_back(providerId, status);
    });

    REQUIRE(manager.serverStatus("fs") == SessionStatus::Disconnected);

    auto status = manager.connect("fs");
    REQUIRE(status.has_value());
    CHECK(*status == SessionStatus::Connected);

    {
        auto const lock = std::lock_guard(mutex);
        REQUIRE(seen.size() >= 2);
        CHECK(seen[0].first == "fs");
        CHECK(seen[0].second == SessionStatus::Connecting);
        CHECK(seen[1].second == SessionStatus::Connected);
    }

    auto const servers = manager.listServers();
    REQUIRE(servers.size() == 1);
    CHECK(servers[0].config.id == "fs");
    CHECK(servers[0].config.name == "FS");

    manager.disconnectAll();
    CHECK(manager.serverStatus("fs") == SessionStatus::Disconnected);
}

TEST_CASE("ConnectionManager auto-starts providers activated by display name", "[manager]")
{
    auto provider = MockProvider::standard(mockTools());
    auto settings = std::make_shared<MemorySettingsStore>(std::vector<std::string> { "FS" });
    auto manager = ConnectionManager(optionsFor("unused.json"), settings, provider->factory());
    REQUIRE(manager.applyConfiguration(twoProviderDocument()) == 2);

    CHECK(manager.autoStart() == 1);
    CHECK(manager.serverStatus("fs") == SessionStatus::Connected);
    CHECK(manager.serverStatus("search") == SessionStatus::Disconnected);

    auto const activated = settings->activatedProviderIds();
    REQUIRE(activated.has_value());
    CHECK(*activated == std::vector<std::string> { "fs" });
    CHECK(settings->writes() == 1);

    // The rewritten entry matches by id now; nothing is written again.
    manager.disconnectAll();
    CHECK(manager.autoStart() == 1);
    CHECK(settings->writes() == 1);
}

TEST_CASE("ConnectionManager auto-start skips disabled and inactive providers", "[manager]")
{
    auto provider = MockProvider::standard(mockTools());
    auto settings = std::make_shared<MemorySettingsStore>(std::vector<std::string> { "search" });
    auto manager = ConnectionManager(optionsFor("unused.json"), settings, provider->factory());
    manager.applyConfiguration(twoProviderDocument());

    CHECK(manager.autoStart() == 0);
    CHECK(provider->openCount() == 0);

    settings->setBroken(true);
    CHECK(manager.autoStart() == 0);
    CHECK(provider->openCount() == 0);
}

TEST_CASE("ConnectionManager auto-start stops when interrupted", "[manager]")
{
    auto provider = MockProvider::standard(mockTools());
    auto settings = std::make_shared<MemorySettingsStore>(std::vector<std::string> { "a", "b" });
    auto options = optionsFor("unused.json");
    options.autoStartDelay = std::chrono::minutes(10);
    auto manager = ConnectionManager(options, settings, provider->factory());
    manager.applyConfiguration(nlohmann::json::parse(R"({"mcpServers":{"a":{"command":"x"},"b":{"command":"y"}}})"));

    auto source = std::stop_source {};
    source.request_stop();
    CHECK(manager.autoStart(source.get_token()) == 1);
    CHECK(manager.serverStatus("a") == SessionStatus::Connected);
    CHECK(manager.serverStatus("b") == SessionStatus::Disconnected);
}

TEST_CASE("ConnectionManager reports unknown or disconnected providers without I/O", "[manager]")
{
    auto provider = MockProvider::standard(mockTools());
    auto manager = ConnectionManager(optionsFor("unused.json"), nullptr, provider->factory());
    manager.applyConfiguration(twoProviderDocument());

    auto connected = manager.connect("nope");
    REQUIRE(!connected.has_value());
    CHECK(connected.error().code == ErrorCode::NotFoundError);
    CHECK(connected.error().message == "Server nope not found");

    CHECK(manager.disconnect("nope").error().code == ErrorCode::NotFoundError);
    CHECK(manager.serverStatus("nope").error().code == ErrorCode::NotFoundError);

    auto const call = ToolCall { .id = "1", .name = "read_file", .arguments = nlohmann::json::object() };
    auto result = manager.executeTool("fs", call);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::NotFoundError);
    CHECK(result.error().message == "Server fs is not connected");
    CHECK(provider->openCount() == 0);
}

TEST_CASE("ConnectionManager executes tools on connected providers", "[manager]")
{
    auto provider = MockProvider::standard(mockTools());
    auto manager = ConnectionManager(optionsFor("unused.json"), nullptr, provider->factory());
    manager.applyConfiguration(twoProviderDocument());

    REQUIRE(manager.connect("fs").has_value());
    REQUIRE(manager.session("fs")->waitUntilInitialized(WaitTimeout));

    auto const tools = manager.listTools();
    REQUIRE(tools.size() == 2);
    CHECK(tools[0].providerId == "fs");
    CHECK(tools[0].tool.name == "read_file");
    CHECK(manager.findProviderForTool("write_file") == "fs");
    CHECK(!manager.findProviderForTool("search_web").has_value());

    auto result = manager.executeTool(
        "fs", ToolCall { .id = "1", .name = "read_file", .arguments = { { "path", "/tmp/a" } } });
    REQUIRE(result.has_value());
    CHECK((*result)["content"][0]["text"] == R"(read_file: {"path":"/tmp/a"})");

    auto const sentBefore = provider->sent().size();
    auto unknownTool =
        manager.executeTool("fs", ToolCall { .id = "2", .name = "rm_rf", .arguments = nlohmann::json::object() });
    REQUIRE(!unknownTool.has_value());
    CHECK(unknownTool.error().code == ErrorCode::NotFoundError);
    CHECK(unknownTool.error().message == "Tool rm_rf not found on server fs");

    auto badArguments = manager.executeTool("fs", ToolCall { .id = "3", .name = "read_file", .arguments = 5 });
    REQUIRE(!badArguments.has_value());
    CHECK(badArguments.error().code == ErrorCode::InvalidArgument);
    CHECK(provider->sent().size() == sentBefore);
}

TEST_CASE("ConnectionManager snapshots do not wait for a provider that is still connecting", "[manager]")
{
    auto provider = MockProvider::standard(mockTools());
    auto gate = OpenGate::create();
    auto const factory = [local = provider->factory(), remote = gate->factory()](const ProviderConfig& config) {
        return config.id == "remote" ? remote(config) : local(config);
    };
    auto manager = ConnectionManager(optionsFor("unused.json"), nullptr, factory);
    manager.applyConfiguration(nlohmann::json::parse(R"({
        "mcpServers": {
            "fs": { "command": "mock-fs" },
            "remote": { "transport": "websocket", "url": "ws://10.255.255.1:9000/" }
        }
    })"));

    REQUIRE(manager.connect("fs").has_value());
    REQUIRE(manager.session("fs")->waitUntilInitialized(WaitTimeout));

    auto connecting = std::async(std::launch::async, [&manager] { return manager.connect("remote"); });
    REQUIRE(gate->waitUntilEntered(WaitTimeout));

    auto const started = std::chrono::steady_clock::now();
    auto const tools = manager.listTools();
    auto const servers = manager.listServers();
    CHECK(manager.findProviderForTool("read_file") == "fs");
    CHECK(manager.serverStatus("remote") == SessionStatus::Connecting);
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(1));

    CHECK(tools.size() == 2);
    CHECK(servers.size() == 2);

    gate->release(false);
    auto result = connecting.get();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
    CHECK(manager.serverStatus("remote") == SessionStatus::Error);
}

TEST_CASE("ConnectionManager falls back to the built-in providers", "[manager]")
{
    auto const dir = TempDirectory {};

    SECTION("missing file")
    {
        auto manager = ConnectionManager(optionsFor(dir / "missing.json"), nullptr);
        CHECK(manager.loadConfiguration() == 2);

        auto const servers = manager.listServers();
        REQUIRE(servers.size() == 2);
        CHECK(servers[0].config.id == "filesystem");
        CHECK(servers[1].config.id == "web-search");
    }

    SECTION("document without usable entries")
    {
        writeFile(dir / "empty.json", R"({"mcpServers":{}})");
        auto manager = ConnectionManager(optionsFor(dir / "empty.json"), nullptr);
        CHECK(manager.loadConfiguration() == 2);
    }
}

TEST_CASE("ConnectionManager keeps sessions across configuration changes", "[manager]")
{
    auto provider = MockProvider::standard(mockTools());
    auto manager = ConnectionManager(optionsFor("unused.json"), nullptr, provider->factory());
    manager.applyConfiguration(twoProviderDocument());

    REQUIRE(manager.connect("fs").has_value());
    auto const before = manager.session("fs");

    manager.applyConfiguration(
        nlohmann::json::parse(R"({"mcpServers":{"fs":{"name":"Files","command":"mock-fs"}}})"));

    CHECK(manager.session("fs") == before);
    CHECK(manager.session("fs")->config().name == "Files");
    CHECK(manager.serverStatus("fs") == SessionStatus::Connected);
    CHECK(manager.listServers().size() == 2);
}

TEST_CASE("ConnectionManager updateConfiguration persists and applies the document", "[manager]")
{
    auto const dir = TempDirectory {};
    auto const configPath = dir / "nested/config/mcp-servers.json";
    auto manager = ConnectionManager(optionsFor(configPath), nullptr);

    auto invalid = manager.updateConfiguration("{ nope");
    REQUIRE(!invalid.has_value());
    CHECK(invalid.error().code == ErrorCode::ConfigError);
    CHECK(!std::filesystem::exists(configPath));

    auto const text = std::string(R"({"mcpServers":{"fs":{"name":"FS","command":"echo"}}})");
    REQUIRE(manager.updateConfiguration(text).has_value());
    CHECK(std::filesystem::exists(configPath));
    REQUIRE(manager.session("fs") != nullptr);

    auto info = manager.configurationInfo();
    REQUIRE(info.has_value());
    CHECK(info->serverCount == 1);
    CHECK(info->fileSize == text.size());
    CHECK(info->config["mcpServers"].contains("fs"));
    CHECK(info->configPath.is_absolute());
    CHECK(info->lastModified.ends_with("Z"));

    auto const obj = toJson(*info);
    CHECK(obj["serverCount"] == 1);
    CHECK(obj.contains("lastModified"));
}

TEST_CASE("ConnectionManager configurationInfo describes a missing file", "[manager]")
{
    auto const dir = TempDirectory {};
    auto manager = ConnectionManager(optionsFor(dir / "absent.json"), nullptr);

    auto info = manager.configurationInfo();
    REQUIRE(info.has_value());
    CHECK(info->config == nlohmann::json { { "mcpServers", nlohmann::json::object() } });
    CHECK(info->fileSize == 0);
    CHECK(info->serverCount == 0);
}
