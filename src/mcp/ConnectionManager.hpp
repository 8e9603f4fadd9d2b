// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ProviderConfig.hpp>
#include <mcp/ServerSession.hpp>
#include <mcp/SettingsStore.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace webchat
{

/// @brief Creates a StdioTransport or SocketTransport according to the provider config.
[[nodiscard]] auto defaultTransportFactory() -> TransportFactory;

/// @brief Options for the connection manager.
struct ConnectionManagerOptions
{
    /// Location of the provider document.
    std::filesystem::path configPath = "./mcp-servers.json";

    /// Pause between two providers started by autoStart().
    std::chrono::milliseconds autoStartDelay { 1000 };

    SessionOptions session;
};

/// @brief Point-in-time view of one provider.
struct ServerSnapshot
{
    ProviderConfig config;
    SessionStatus status = SessionStatus::Disconnected;
    std::vector<ToolDefinition> tools;
    std::vector<ResourceDefinition> resources;
    ServerInfo serverInfo;
};

/// @brief Description of the provider document on disk.
struct ConfigurationInfo
{
    nlohmann::json config;
    std::filesystem::path configPath;
    std::uintmax_t fileSize = 0;
    std::string lastModified; ///< ISO 8601, UTC.
    size_t serverCount = 0;
};

[[nodiscard]] auto toJson(const ServerSnapshot& snapshot) -> nlohmann::json;
[[nodiscard]] auto toJson(const ConfigurationInfo& info) -> nlohmann::json;

/// @brief Owns one ServerSession per configured provider and routes tool calls to them.
///
/// The provider table lock is only held to look sessions up; connecting,
/// calling and disconnecting run on the sessions without serializing providers.
class ConnectionManager
{
  public:
    ConnectionManager(ConnectionManagerOptions options,
                      std::shared_ptr<SettingsStore> settings,
                      TransportFactory factory = defaultTransportFactory());
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// @brief Loads the provider document from the configured path.
    ///
    /// An unreadable or invalid document, or one without usable entries,
    /// is logged and replaced by the built-in example providers.
    /// @return Number of providers known afterwards.
    auto loadConfiguration() -> size_t;

    /// @brief Replaces the provider table from a parsed document.
    /// @return Number of providers taken from the document (built-ins when zero).
    auto applyConfiguration(const nlohmann::json& document) -> size_t;

    /// @brief Connects a provider. See ServerSession::connect().
    [[nodiscard]] auto connect(const std::string& providerId) -> Result<SessionStatus>;

    /// @brief Disconnects a provider, rejecting its outstanding calls.
    [[nodiscard]] auto disconnect(const std::string& providerId) -> VoidResult;

    /// @brief Disconnects every provider concurrently.
    void disconnectAll();

    /// @brief Executes a tool on a connected provider.
    /// @return The raw tools/call result payload; NotFoundError without any I/O if the
    ///         provider is unknown, not connected, or does not offer the tool.
    [[nodiscard]] auto executeTool(const std::string& providerId, const ToolCall& call) -> Result<nlohmann::json>;

    [[nodiscard]] auto listServers() const -> std::vector<ServerSnapshot>;

    /// @brief Tools of all connected providers, tagged with their provider id.
    [[nodiscard]] auto listTools() const -> std::vector<ProviderTool>;

    [[nodiscard]] auto serverStatus(const std::string& providerId) const -> Result<SessionStatus>;

    /// @brief Returns the id of the first connected provider offering @p toolName.
    [[nodiscard]] auto findProviderForTool(std::string_view toolName) const -> std::optional<std::string>;

    /// @brief Returns the session of a provider, or nullptr.
    [[nodiscard]] auto session(const std::string& providerId) const -> std::shared_ptr<ServerSession>;

    /// @brief Connects the providers the user activated, one after another.
    ///
    /// Entries are matched by id, or by display name as written by older settings;
    /// a name match rewrites the stored entry to the id. Disabled providers are skipped.
    /// @param stopToken Interrupts the delay between starts.
    /// @return Number of providers connected.
    auto autoStart(std::stop_token stopToken = {}) -> size_t;

    /// @brief Validates, persists and applies a new provider document.
    [[nodiscard]] auto updateConfiguration(std::string_view documentText) -> VoidResult;

    /// @brief Describes the provider document on disk.
    [[nodiscard]] auto configurationInfo() const -> Result<ConfigurationInfo>;

    /// @brief Installs a listener on every current and future session.
    void setStatusListener(StatusListener listener);

    [[nodiscard]] auto configPath() const -> const std::filesystem::path& { return _options.configPath; }

  private:
    [[nodiscard]] auto shouldAutoStart(const ProviderConfig& config) -> bool;
    [[nodiscard]] auto snapshotSessions() const -> std::vector<std::shared_ptr<ServerSession>>;
    void replaceProviders(std::vector<ProviderConfig> providers);

    ConnectionManagerOptions _options;
    std::shared_ptr<SettingsStore> _settings;
    TransportFactory _factory;

    mutable std::mutex _mutex;
    std::vector<std::shared_ptr<ServerSession>> _sessions;
    StatusListener _statusListener;
};

} // namespace webchat
