// SPDX-License-Identifier: Apache-2.0
#include "ConnectionManager.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/SocketTransport.hpp>
#include <mcp/StdioTransport.hpp>

#include <algorithm>
#include <condition_variable>
#include <format>
#include <fstream>
#include <future>

namespace webchat
{

namespace
{

    auto isoTimestamp(std::chrono::system_clock::time_point time) -> std::string
    {
        return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::milliseconds>(time));
    }

    /// Sleeps for @p duration unless @p stopToken fires first; returns false when stopped.
    auto sleepFor(std::chrono::milliseconds duration, const std::stop_token& stopToken) -> bool
    {
        auto mutex = std::mutex {};
        auto cv = std::condition_variable_any {};
        auto lock = std::unique_lock(mutex);
        return !cv.wait_for(lock, stopToken, duration, [] { return false; }) && !stopToken.stop_requested();
    }

} // namespace

auto defaultTransportFactory() -> TransportFactory
{
    return [](const ProviderConfig& config) -> std::unique_ptr<Transport> {
        switch (config.transport)
        {
            case TransportKind::Socket: return std::make_unique<SocketTransport>(config.url);
            case TransportKind::Stdio: break;
        }
        return std::make_unique<StdioTransport>(StdioTransportConfig {
            .command = config.command,
            .args = config.args,
            .env = config.env,
        });
    };
}

auto toJson(const ServerSnapshot& snapshot) -> nlohmann::json
{
    auto obj = toJson(snapshot.config);
    obj["status"] = sessionStatusName(snapshot.status);

    obj["tools"] = nlohmann::json::array();
    for (const auto& tool: snapshot.tools)
        obj["tools"].push_back(toJson(tool));

    obj["resources"] = nlohmann::json::array();
    for (const auto& resource: snapshot.resources)
        obj["resources"].push_back(toJson(resource));

    if (!snapshot.serverInfo.name.empty())
    {
        obj["serverInfo"] = {
            { "name", snapshot.serverInfo.name },
            { "version", snapshot.serverInfo.version },
        };
    }
    return obj;
}

auto toJson(const ConfigurationInfo& info) -> nlohmann::json
{
    return nlohmann::json {
        { "config", info.config },
        { "configPath", info.configPath.string() },
        { "fileSize", info.fileSize },
        { "lastModified", info.lastModified },
        { "serverCount", info.serverCount },
    };
}

ConnectionManager::ConnectionManager(ConnectionManagerOptions options,
                                     std::shared_ptr<SettingsStore> settings,
                                     TransportFactory factory):
    _options(std::move(options)), _settings(std::move(settings)), _factory(std::move(factory))
{
}

ConnectionManager::~ConnectionManager()
{
    disconnectAll();
}

auto ConnectionManager::loadConfiguration() -> size_t
{
    auto document = readProviderDocument(_options.configPath);
    if (!document)
    {
        log::info("Could not load MCP config from {}, using default servers: {}",
                  _options.configPath.string(),
                  document.error().message);
        replaceProviders(builtinProviders());
        return snapshotSessions().size();
    }

    applyConfiguration(*document);
    log::info("Loaded MCP configuration from: {}", _options.configPath.string());
    return snapshotSessions().size();
}

auto ConnectionManager::applyConfiguration(const nlohmann::json& document) -> size_t
{
    auto providers = parseProviderDocument(document);
    if (providers.empty())
    {
        log::info("No valid servers found in MCP config, using default servers");
        replaceProviders(builtinProviders());
        return 0;
    }

    auto const count = providers.size();
    replaceProviders(std::move(providers));
    log::info("Loaded {} MCP server(s) from configuration", count);
    return count;
}

void ConnectionManager::replaceProviders(std::vector<ProviderConfig> providers)
{
    auto const lock = std::lock_guard(_mutex);

    for (auto& config: providers)
    {
        auto const it = std::ranges::find_if(_sessions, [&config](const std::shared_ptr<ServerSession>& s) {
            return s->id() == config.id;
        });

        if (it != _sessions.end())
        {
            // A live connection keeps running; the new definition applies on the next connect.
            (*it)->updateConfig(std::move(config));
            continue;
        }

        auto session = std::make_shared<ServerSession>(std::move(config), _factory, _options.session);
        if (_statusListener)
            session->setStatusListener(_statusListener);
        _sessions.push_back(std::move(session));
    }
}

auto ConnectionManager::snapshotSessions() const -> std::vector<std::shared_ptr<ServerSession>>
{
    auto const lock = std::lock_guard(_mutex);
    return _sessions;
}

auto ConnectionManager::session(const std::string& providerId) const -> std::shared_ptr<ServerSession>
{
    auto const lock = std::lock_guard(_mutex);
    auto const it = std::ranges::find_if(
        _sessions, [&providerId](const std::shared_ptr<ServerSession>& s) { return s->id() == providerId; });
    return it != _sessions.end() ? *it : nullptr;
}

auto ConnectionManager::connect(const std::string& providerId) -> Result<SessionStatus>
{
    auto target = session(providerId);
    if (!target)
        return makeError(ErrorCode::NotFoundError, std::format("Server {} not found", providerId));
    return target->connect();
}

auto ConnectionManager::disconnect(const std::string& providerId) -> VoidResult
{
    auto target = session(providerId);
    if (!target)
        return makeError(ErrorCode::NotFoundError, std::format("Server {} not found", providerId));
    target->disconnect();
    return {};
}

void ConnectionManager::disconnectAll()
{
    auto tasks = std::vector<std::future<void>> {};
    for (auto& target: snapshotSessions())
        tasks.push_back(std::async(std::launch::async, [target] { target->disconnect(); }));
    for (auto& task: tasks)
        task.get();
}

auto ConnectionManager::executeTool(const std::string& providerId, const ToolCall& call) -> Result<nlohmann::json>
{
    auto target = session(providerId);
    if (!target || target->status() != SessionStatus::Connected)
        return makeError(ErrorCode::NotFoundError, std::format("Server {} is not connected", providerId));

    if (!target->hasTool(call.name))
        return makeError(ErrorCode::NotFoundError,
                         std::format("Tool {} not found on server {}", call.name, providerId));

    auto arguments = call.arguments.is_null() ? nlohmann::json::object() : call.arguments;
    if (!arguments.is_object())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Arguments for tool {} must be a JSON object", call.name));

    log::info("Executing tool '{}' on server '{}'", call.name, providerId);
    log::debug("Arguments: {}", json::preview(arguments.dump(), 500));

    auto const started = std::chrono::steady_clock::now();
    auto result = target->callTool(call.name, std::move(arguments));
    auto const elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    if (!result)
        log::error("Tool '{}' on '{}' failed after {}ms: {}", call.name, providerId, elapsed.count(), result.error());
    else
        log::info("Tool '{}' on '{}' completed in {}ms", call.name, providerId, elapsed.count());

    return result;
}

auto ConnectionManager::listServers() const -> std::vector<ServerSnapshot>
{
    auto servers = std::vector<ServerSnapshot> {};
    for (const auto& target: snapshotSessions())
    {
        servers.push_back(ServerSnapshot {
            .config = target->config(),
            .status = target->status(),
            .tools = target->tools(),
            .resources = target->resources(),
            .serverInfo = target->serverInfo(),
        });
    }
    return servers;
}

auto ConnectionManager::listTools() const -> std::vector<ProviderTool>
{
    auto tools = std::vector<ProviderTool> {};
    for (const auto& target: snapshotSessions())
    {
        if (target->status() != SessionStatus::Connected)
            continue;

        auto const providerId = target->id();
        for (auto& tool: target->tools())
            tools.push_back(ProviderTool { .providerId = providerId, .tool = std::move(tool) });
    }
    return tools;
}

auto ConnectionManager::serverStatus(const std::string& providerId) const -> Result<SessionStatus>
{
    auto target = session(providerId);
    if (!target)
        return makeError(ErrorCode::NotFoundError, std::format("Server {} not found", providerId));
    return target->status();
}

auto ConnectionManager::findProviderForTool(std::string_view toolName) const -> std::optional<std::string>
{
    for (const auto& target: snapshotSessions())
    {
        if (target->status() == SessionStatus::Connected && target->hasTool(toolName))
            return target->id();
    }
    return std::nullopt;
}

auto ConnectionManager::shouldAutoStart(const ProviderConfig& config) -> bool
{
    if (config.disabled)
    {
        log::debug("Skipping auto-start of disabled server '{}'", config.id);
        return false;
    }

    if (!_settings)
        return false;

    auto activated = _settings->activatedProviderIds();
    if (!activated)
    {
        log::error("Error loading settings for auto-start check: {}", activated.error().message);
        return false;
    }

    auto const byId = std::ranges::find(*activated, config.id) != activated->end();
    auto const byName = std::ranges::find(*activated, config.name) != activated->end();

    if (!byId && !byName)
    {
        log::debug("Skipping auto-start for non-activated server '{}' ({})", config.name, config.id);
        return false;
    }

    if (byName && !byId)
    {
        log::info("Updating settings to use server id '{}' instead of name '{}'", config.id, config.name);
        auto updated = std::vector<std::string> {};
        for (auto& entry: *activated)
        {
            if (entry != config.name)
                updated.push_back(std::move(entry));
        }
        updated.push_back(config.id);

        if (auto stored = _settings->setActivatedProviderIds(std::move(updated)); !stored)
            log::warning("Failed to update activated servers: {}", stored.error().message);
    }

    return true;
}

auto ConnectionManager::autoStart(std::stop_token stopToken) -> size_t
{
    auto toStart = std::vector<std::string> {};
    for (const auto& target: snapshotSessions())
    {
        auto config = target->config();
        if (shouldAutoStart(config))
            toStart.push_back(config.id);
    }

    if (toStart.empty())
    {
        log::info("No MCP servers configured for auto-start");
        return 0;
    }

    log::info("Auto-starting {} MCP server(s)", toStart.size());

    auto started = size_t { 0 };
    for (size_t i = 0; i < toStart.size(); ++i)
    {
        if (auto status = connect(toStart[i]); status)
        {
            log::info("Auto-started MCP server: {}", toStart[i]);
            ++started;
        }
        else
        {
            log::warning("Failed to auto-start MCP server {}: {}", toStart[i], status.error().message);
        }

        if (i + 1 < toStart.size() && !sleepFor(_options.autoStartDelay, stopToken))
            break;
    }

    return started;
}

auto ConnectionManager::updateConfiguration(std::string_view documentText) -> VoidResult
{
    auto document = json::parse(documentText);
    if (!document)
        return makeError(ErrorCode::ConfigError, std::format("Failed to update config: {}", document.error().message));

    auto const dir = _options.configPath.parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    {
        auto file = std::ofstream(_options.configPath, std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::IoError,
                             std::format("Cannot write MCP config file: {}", _options.configPath.string()));
        file << documentText;
        if (!file)
            return makeError(ErrorCode::IoError,
                             std::format("Failed writing MCP config file: {}", _options.configPath.string()));
    }

    applyConfiguration(*document);
    log::info("MCP configuration updated and reloaded from: {}", _options.configPath.string());
    return {};
}

auto ConnectionManager::configurationInfo() const -> Result<ConfigurationInfo>
{
    auto ec = std::error_code {};
    auto absolutePath = std::filesystem::absolute(_options.configPath, ec);
    if (ec)
        absolutePath = _options.configPath;

    if (!std::filesystem::exists(_options.configPath, ec))
    {
        return ConfigurationInfo {
            .config = { { "mcpServers", nlohmann::json::object() } },
            .configPath = absolutePath,
            .fileSize = 0,
            .lastModified = isoTimestamp(std::chrono::system_clock::now()),
            .serverCount = 0,
        };
    }

    auto document = readProviderDocument(_options.configPath);
    if (!document)
        return std::unexpected(document.error());

    auto const size = std::filesystem::file_size(_options.configPath, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Failed to get config: {}", ec.message()));

    auto const modified = std::filesystem::last_write_time(_options.configPath, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Failed to get config: {}", ec.message()));

    auto const serverCount = countProviderEntries(*document);
    return ConfigurationInfo {
        .config = std::move(*document),
        .configPath = absolutePath,
        .fileSize = size,
        .lastModified = isoTimestamp(std::chrono::file_clock::to_sys(modified)),
        .serverCount = serverCount,
    };
}

void ConnectionManager::setStatusListener(StatusListener listener)
{
    auto const lock = std::lock_guard(_mutex);
    _statusListener = std::move(listener);
    for (auto& target: _sessions)
        target->setStatusListener(_statusListener);
}

} // namespace webchat
