// SPDX-License-Identifier: Apache-2.0
#include "ServerSession.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/FrameCodec.hpp>
#include <mcp/JsonRpc.hpp>

#include <algorithm>
#include <format>

namespace webchat
{

namespace
{

    auto parseDiscoveredTools(const nlohmann::json& list, const std::string& providerName)
        -> std::vector<ToolDefinition>
    {
        auto tools = std::vector<ToolDefinition> {};
        for (const auto& toolJson: list)
        {
            auto name = json::getStringOr(toolJson, "name", "");
            if (name.empty())
                continue;

            auto description = json::getStringOr(toolJson, "description", "");
            if (description.empty())
                description = std::format("Tool {} from {}", name, providerName);

            auto schema = toolJson.contains("inputSchema") && toolJson["inputSchema"].is_object()
                              ? toolJson["inputSchema"]
                              : emptyObjectSchema();

            tools.push_back(ToolDefinition {
                .name = std::move(name),
                .description = std::move(description),
                .inputSchema = std::move(schema),
            });
        }
        return tools;
    }

    auto parseDiscoveredResources(const nlohmann::json& list) -> std::vector<ResourceDefinition>
    {
        auto resources = std::vector<ResourceDefinition> {};
        for (const auto& item: list)
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

} // namespace

ServerSession::ServerSession(ProviderConfig config, TransportFactory factory, SessionOptions options):
    _config(std::move(config)), _factory(std::move(factory)), _options(std::move(options))
{
    _tools = _config.tools;
    _resources = _config.resources;
}

ServerSession::~ServerSession()
{
    disconnect();
}

auto ServerSession::connect() -> Result<SessionStatus>
{
    auto stale = std::shared_ptr<Transport> {};
    auto config = ProviderConfig {};
    auto generation = uint64_t { 0 };
    {
        auto const lock = std::lock_guard(_mutex);
        if (_status == SessionStatus::Connecting || _status == SessionStatus::Connected)
            return _status;

        stale = std::move(_transport);
        generation = ++_generation;
        config = _config;
        _tools = _config.tools;
        _resources = _config.resources;
        _serverInfo = {};
        _initialized = false;
        _sequenceFinished = false;
        setStatus(SessionStatus::Connecting);
    }

    // The previous connection ended on its own; its reader may still be unwinding.
    if (stale)
        stale->close();
    stopWorker();

    log::info("Connecting to MCP server '{}' ({})", config.name, config.id);

    auto transport = std::shared_ptr<Transport>(_factory ? _factory(config) : nullptr);
    if (!transport)
    {
        auto const lock = std::lock_guard(_mutex);
        if (_generation == generation)
            setStatus(SessionStatus::Error);
        return makeError(ErrorCode::TransportError,
                         std::format("No transport available for MCP server '{}'", config.id));
    }

    auto codec = std::make_shared<FrameCodec>();
    auto events = TransportEvents {
        .onData =
            [this, generation, codec, id = config.id](std::string_view chunk) {
                if (_generation != generation)
                    return;
                for (auto const& message: codec->feed(chunk))
                {
                    try
                    {
                        handleMessage(message);
                    }
                    catch (const nlohmann::json::exception& e)
                    {
                        log::warning("Dropping malformed message from '{}': {}", id, e.what());
                    }
                }
            },
        .onClosed = [this, generation]() { handleTransportEnded(generation, nullptr); },
        .onError = [this, generation](const Error& error) { handleTransportEnded(generation, &error); },
    };

    // Opening may block (process spawn, socket connect); the session stays observable meanwhile.
    auto opened = transport->open(std::move(events));

    auto const interrupted = [&] {
        return makeError(ErrorCode::TransportError,
                         std::format("Connect to '{}' was interrupted by a disconnect", config.id));
    };

    if (!opened)
    {
        log::error("Failed to connect to MCP server '{}': {}", config.name, opened.error().message);
        auto const lock = std::lock_guard(_mutex);
        if (_generation != generation)
            return interrupted();
        setStatus(SessionStatus::Error);
        return std::unexpected(opened.error());
    }

    auto current = false;
    auto status = SessionStatus::Connected;
    {
        auto const lock = std::lock_guard(_mutex);
        current = _generation == generation;
        if (current)
        {
            _transport = transport;
            // The provider may have gone away before open() returned; that end was reported already.
            if (_status == SessionStatus::Connecting)
                setStatus(SessionStatus::Connected);
            status = _status;
        }
    }

    if (!current)
    {
        transport->close();
        return interrupted();
    }
    if (status != SessionStatus::Connected)
        return status;

    {
        auto const workerLock = std::lock_guard(_workerMutex);
        _worker = std::jthread([this, generation](const std::stop_token& stopToken) {
            initializeSequence(generation, stopToken);
        });
    }

    return SessionStatus::Connected;
}

void ServerSession::disconnect()
{
    auto transport = std::shared_ptr<Transport> {};
    {
        auto const lock = std::lock_guard(_mutex);
        transport = std::move(_transport);
        ++_generation;
        if (_status != SessionStatus::Disconnected)
            setStatus(SessionStatus::Disconnected);
        _initializedChanged.notify_all();
    }

    if (transport)
    {
        transport->close();
        log::info("Disconnected from MCP server '{}'", id());
    }

    auto const rejected =
        _pending.rejectAll(Error { ErrorCode::TransportError, std::format("MCP server '{}' disconnected", id()) });
    if (rejected > 0)
        log::debug("Rejected {} outstanding call(s) of '{}'", rejected, id());

    stopWorker();
}

auto ServerSession::call(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    return request(method, std::move(params), std::nullopt);
}

auto ServerSession::notify(std::string_view method, nlohmann::json params) -> VoidResult
{
    return sendNotification(method, std::move(params), std::nullopt);
}

auto ServerSession::callTool(std::string_view name, nlohmann::json arguments) -> Result<nlohmann::json>
{
    if (arguments.is_null())
        arguments = nlohmann::json::object();

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", std::move(arguments) },
    };
    return call("tools/call", std::move(params));
}

auto ServerSession::request(std::string_view method, nlohmann::json params, std::optional<uint64_t> generation)
    -> Result<nlohmann::json>
{
    auto transport = std::shared_ptr<Transport> {};
    auto currentGeneration = uint64_t { 0 };
    {
        auto const lock = std::lock_guard(_mutex);
        currentGeneration = _generation;
        if (_status != SessionStatus::Connected || !_transport
            || (generation && *generation != currentGeneration))
            return makeError(ErrorCode::TransportError, std::format("MCP server '{}' is not connected", _config.id));
        transport = _transport;
    }

    auto const requestId = _nextId++;
    auto const deadline = PendingCalls::Clock::now() + _options.requestTimeout;
    auto future = _pending.registerCall(requestId, std::string(method), deadline);
    if (!future)
        return std::unexpected(future.error());

    // A disconnect may have swept the registry between the check above and registration.
    if (_generation != currentGeneration)
    {
        _pending.resolve(requestId,
                         makeError(ErrorCode::TransportError, std::format("MCP server '{}' disconnected", id())));
    }
    else
    {
        log::debug("-> {} {} (id {})", id(), method, requestId);
        if (auto sent = transport->send(jsonrpc::encode(jsonrpc::makeRequest(requestId, method, std::move(params))));
            !sent)
            _pending.resolve(requestId, std::unexpected(sent.error()));
    }

    if (future->wait_until(deadline) == std::future_status::timeout)
        _pending.expireDue(PendingCalls::Clock::now());

    return future->get();
}

auto ServerSession::sendNotification(std::string_view method, nlohmann::json params,
                                     std::optional<uint64_t> generation) -> VoidResult
{
    auto transport = std::shared_ptr<Transport> {};
    {
        auto const lock = std::lock_guard(_mutex);
        if (_status != SessionStatus::Connected || !_transport || (generation && *generation != _generation))
            return makeError(ErrorCode::TransportError, std::format("MCP server '{}' is not connected", _config.id));
        transport = _transport;
    }

    log::debug("-> {} {} (notification)", id(), method);
    return transport->send(jsonrpc::encode(jsonrpc::makeNotification(method, std::move(params))));
}

void ServerSession::initializeSequence(uint64_t generation, const std::stop_token& stopToken)
{
    auto const providerName = config().name;

    auto initParams = nlohmann::json {
        { "protocolVersion", McpProtocolVersion },
        { "capabilities",
          {
              { "tools", nlohmann::json::object() },
              { "resources", nlohmann::json::object() },
          } },
        { "clientInfo",
          {
              { "name", _options.clientName },
              { "version", _options.clientVersion },
          } },
    };

    auto initResult = request("initialize", std::move(initParams), generation);
    if (!initResult)
    {
        log::error("Failed to initialize MCP server '{}': {}", providerName, initResult.error().message);
        finishInitialization(generation);
        return;
    }

    if (!initResult->is_object())
        *initResult = nlohmann::json::object();

    auto const serverInfoJson =
        initResult->contains("serverInfo") ? (*initResult)["serverInfo"] : nlohmann::json::object();
    auto info = ServerInfo {
        .name = json::getStringOr(serverInfoJson, "name", "unknown"),
        .version = json::getStringOr(serverInfoJson, "version", "unknown"),
        .protocolVersion = json::getStringOr(*initResult, "protocolVersion", ""),
        .capabilities = initResult->contains("capabilities") && (*initResult)["capabilities"].is_object()
                            ? (*initResult)["capabilities"]
                            : nlohmann::json::object(),
    };
    log::info("MCP server '{}' initialized: {} v{}", providerName, info.name, info.version);

    {
        auto const lock = std::lock_guard(_mutex);
        if (_generation != generation)
            return;
        _serverInfo = std::move(info);
        _initialized = true;
    }

    if (auto sent = sendNotification("notifications/initialized", nullptr, generation); !sent)
        log::warning("Failed to send initialized notification to '{}': {}", providerName, sent.error().message);

    if (stopToken.stop_requested())
        return;

    auto toolsResult = request("tools/list", nlohmann::json::object(), generation);
    if (!toolsResult)
    {
        log::warning("Tool discovery failed for '{}', keeping declared tools: {}",
                     providerName,
                     toolsResult.error().message);
    }
    else if (!toolsResult->contains("tools") || !(*toolsResult)["tools"].is_array())
    {
        log::info("No tools discovered from '{}', keeping declared tools", providerName);
    }
    else
    {
        auto discovered = parseDiscoveredTools((*toolsResult)["tools"], providerName);
        for (auto const& tool: discovered)
            log::debug("Tool discovered from '{}': {}", providerName, tool.name);
        log::info("Discovered {} tool(s) from '{}'", discovered.size(), providerName);

        auto const lock = std::lock_guard(_mutex);
        if (_generation == generation)
            _tools = std::move(discovered);
    }

    if (stopToken.stop_requested())
        return;

    // Resources are optional; many providers do not implement them.
    auto resourcesResult = request("resources/list", nlohmann::json::object(), generation);
    if (!resourcesResult)
    {
        log::debug("'{}' does not support resource discovery: {}", providerName, resourcesResult.error().message);
    }
    else if (resourcesResult->contains("resources") && (*resourcesResult)["resources"].is_array())
    {
        auto discovered = parseDiscoveredResources((*resourcesResult)["resources"]);
        log::info("Discovered {} resource(s) from '{}'", discovered.size(), providerName);

        auto const lock = std::lock_guard(_mutex);
        if (_generation == generation)
            _resources = std::move(discovered);
    }

    finishInitialization(generation);
}

void ServerSession::finishInitialization(uint64_t generation)
{
    auto const lock = std::lock_guard(_mutex);
    if (_generation != generation)
        return;
    _sequenceFinished = true;
    _initializedChanged.notify_all();
}

void ServerSession::handleMessage(const nlohmann::json& message)
{
    auto parsed = jsonrpc::parseResponse(message);
    if (!parsed)
    {
        log::debug("Ignoring malformed message from '{}': {}", id(), parsed.error().message);
        return;
    }

    if (parsed->kind != jsonrpc::MessageKind::Response)
    {
        log::debug("Ignoring {} '{}' from '{}'",
                   parsed->kind == jsonrpc::MessageKind::Request ? "request" : "notification",
                   parsed->method.value_or(""),
                   id());
        return;
    }

    auto const requestId = parsed->numericId();
    if (!requestId)
    {
        log::debug("Ignoring response without numeric id from '{}': {}", id(), json::preview(message.dump()));
        return;
    }

    log::debug("<- {} response (id {})", id(), *requestId);

    if (parsed->error)
        _pending.resolve(*requestId, std::unexpected(jsonrpc::toError(*parsed->error, _pending.methodOf(*requestId))));
    else
        _pending.resolve(*requestId, std::move(*parsed->result));
}

void ServerSession::handleTransportEnded(uint64_t generation, const Error* error)
{
    {
        auto const lock = std::lock_guard(_mutex);
        if (_generation != generation)
            return;

        // The transport object stays until the next connect or disconnect: this runs on its own thread.
        if (error)
        {
            log::error("MCP server '{}' failed: {}", _config.name, error->message);
            setStatus(SessionStatus::Error);
        }
        else
        {
            log::info("MCP server '{}' closed the connection", _config.name);
            setStatus(SessionStatus::Disconnected);
        }
        _initializedChanged.notify_all();
    }

    _pending.rejectAll(error ? *error
                             : Error { ErrorCode::TransportError,
                                       std::format("MCP server '{}' closed the connection", id()) });
}

void ServerSession::setStatus(SessionStatus status)
{
    _status = status;
    log::debug("MCP server '{}' is now {}", _config.id, sessionStatusName(status));
    if (_statusListener)
        _statusListener(_config.id, status);
}

void ServerSession::stopWorker()
{
    auto const lock = std::lock_guard(_workerMutex);
    if (!_worker.joinable())
        return;

    _worker.request_stop();
    if (_worker.get_id() == std::this_thread::get_id())
        _worker.detach();
    else
        _worker.join();
}

auto ServerSession::waitUntilInitialized(std::chrono::milliseconds timeout) -> bool
{
    auto lock = std::unique_lock(_mutex);
    _initializedChanged.wait_for(lock, timeout, [this] {
        return _sequenceFinished
               || (_status != SessionStatus::Connecting && _status != SessionStatus::Connected);
    });
    return _sequenceFinished && _status == SessionStatus::Connected;
}

void ServerSession::setStatusListener(StatusListener listener)
{
    auto const lock = std::lock_guard(_mutex);
    _statusListener = std::move(listener);
}

void ServerSession::updateConfig(ProviderConfig config)
{
    auto const lock = std::lock_guard(_mutex);
    _config = std::move(config);
    if (_status != SessionStatus::Connected)
    {
        _tools = _config.tools;
        _resources = _config.resources;
    }
}

auto ServerSession::id() const -> std::string
{
    auto const lock = std::lock_guard(_mutex);
    return _config.id;
}

auto ServerSession::config() const -> ProviderConfig
{
    auto const lock = std::lock_guard(_mutex);
    return _config;
}

auto ServerSession::status() const -> SessionStatus
{
    auto const lock = std::lock_guard(_mutex);
    return _status;
}

auto ServerSession::tools() const -> std::vector<ToolDefinition>
{
    auto const lock = std::lock_guard(_mutex);
    return _tools;
}

auto ServerSession::resources() const -> std::vector<ResourceDefinition>
{
    auto const lock = std::lock_guard(_mutex);
    return _resources;
}

auto ServerSession::serverInfo() const -> ServerInfo
{
    auto const lock = std::lock_guard(_mutex);
    return _serverInfo;
}

auto ServerSession::isInitialized() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _initialized;
}

auto ServerSession::hasTool(std::string_view name) const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return std::ranges::any_of(_tools, [name](const ToolDefinition& tool) { return tool.name == name; });
}

} // namespace webchat
