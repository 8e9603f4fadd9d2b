// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/PendingCalls.hpp>
#include <mcp/ProviderConfig.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace webchat
{

/// @brief Connection state of a tool provider session.
enum class SessionStatus
{
    Disconnected,
    Connecting,
    Connected,
    Error,
};

[[nodiscard]] constexpr auto sessionStatusName(SessionStatus status) -> std::string_view
{
    switch (status)
    {
        case SessionStatus::Disconnected: return "disconnected";
        case SessionStatus::Connecting: return "connecting";
        case SessionStatus::Connected: return "connected";
        case SessionStatus::Error: return "error";
    }
    return "disconnected";
}

/// @brief Creates the transport for a provider.
using TransportFactory = std::function<std::unique_ptr<Transport>(const ProviderConfig& config)>;

/// @brief Receives every status transition of a session.
///
/// Invoked with the session lock held: it must not call back into the session.
using StatusListener = std::function<void(const std::string& providerId, SessionStatus status)>;

/// @brief Server identity reported in the initialize response.
struct ServerInfo
{
    std::string name;
    std::string version;
    std::string protocolVersion;
    nlohmann::json capabilities = nlohmann::json::object();
};

/// @brief Tunables of a session.
struct SessionOptions
{
    std::chrono::milliseconds requestTimeout { std::chrono::seconds(120) };
    std::string clientName = "webchat-ui";
    std::string clientVersion = "1.0.0";
};

/// @brief The MCP protocol revision announced in the initialize request.
constexpr auto McpProtocolVersion = std::string_view { "2024-11-05" };

/// @brief One live (or potential) connection to a tool provider.
///
/// Owns the transport, the framing state and the outstanding calls of the
/// provider. connect() returns once the transport is open; the initialize
/// handshake and tool discovery continue on a worker thread.
///
/// Transport callbacks are tagged with the connection generation they were
/// created for, so events from a replaced or closed transport are ignored.
class ServerSession
{
  public:
    ServerSession(ProviderConfig config, TransportFactory factory, SessionOptions options = {});
    ~ServerSession();

    ServerSession(const ServerSession&) = delete;
    ServerSession& operator=(const ServerSession&) = delete;

    /// @brief Opens the transport and starts the initialize sequence.
    ///
    /// A no-op returning the current status while connecting or connected.
    /// @return The status after the call, or the TransportError that prevented opening.
    [[nodiscard]] auto connect() -> Result<SessionStatus>;

    /// @brief Closes the transport and rejects all outstanding calls. Idempotent.
    void disconnect();

    /// @brief Sends a request and blocks until its response, timeout or disconnect.
    /// @param method The JSON-RPC method.
    /// @param params The request parameters (omitted when null).
    /// @return The result payload, ExecutionError for an RPC error response,
    ///         TimeoutError after the request timeout, or TransportError.
    [[nodiscard]] auto call(std::string_view method, nlohmann::json params = nullptr) -> Result<nlohmann::json>;

    /// @brief Sends a notification (no response expected).
    [[nodiscard]] auto notify(std::string_view method, nlohmann::json params = nullptr) -> VoidResult;

    /// @brief Invokes tools/call and returns the raw result payload.
    [[nodiscard]] auto callTool(std::string_view name, nlohmann::json arguments) -> Result<nlohmann::json>;

    /// @brief Blocks until the initialize sequence of the current connection has run to its end,
    /// successfully or not.
    /// @return false if it did not finish within @p timeout or the connection ended first.
    auto waitUntilInitialized(std::chrono::milliseconds timeout) -> bool;

    void setStatusListener(StatusListener listener);

    /// @brief Replaces the provider config; takes effect on the next connect.
    void updateConfig(ProviderConfig config);

    [[nodiscard]] auto id() const -> std::string;
    [[nodiscard]] auto config() const -> ProviderConfig;
    [[nodiscard]] auto status() const -> SessionStatus;
    [[nodiscard]] auto tools() const -> std::vector<ToolDefinition>;
    [[nodiscard]] auto resources() const -> std::vector<ResourceDefinition>;
    [[nodiscard]] auto serverInfo() const -> ServerInfo;
    [[nodiscard]] auto isInitialized() const -> bool;
    [[nodiscard]] auto hasTool(std::string_view name) const -> bool;
    [[nodiscard]] auto pendingCallCount() const -> size_t { return _pending.size(); }

  private:
    [[nodiscard]] auto request(std::string_view method, nlohmann::json params, std::optional<uint64_t> generation)
        -> Result<nlohmann::json>;
    [[nodiscard]] auto sendNotification(std::string_view method, nlohmann::json params,
                                        std::optional<uint64_t> generation) -> VoidResult;

    void initializeSequence(uint64_t generation, const std::stop_token& stopToken);
    void handleMessage(const nlohmann::json& message);
    void handleTransportEnded(uint64_t generation, const Error* error);
    void setStatus(SessionStatus status);
    void finishInitialization(uint64_t generation);
    void stopWorker();

    mutable std::mutex _mutex;
    ProviderConfig _config;
    TransportFactory _factory;
    SessionOptions _options;
    SessionStatus _status = SessionStatus::Disconnected;
    std::shared_ptr<Transport> _transport;
    std::atomic<uint64_t> _generation { 0 };
    std::vector<ToolDefinition> _tools;
    std::vector<ResourceDefinition> _resources;
    ServerInfo _serverInfo;
    bool _initialized = false;
    bool _sequenceFinished = false;
    std::condition_variable _initializedChanged;
    StatusListener _statusListener;

    std::atomic<int64_t> _nextId { 1 };
    PendingCalls _pending;

    std::mutex _workerMutex;
    std::jthread _worker;
};

} // namespace webchat
