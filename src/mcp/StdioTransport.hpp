// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace webchat
{

/// @brief Configuration for spawning a tool provider process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// @brief Time granted after SIGTERM before the process is killed.
    std::chrono::milliseconds terminateGracePeriod { 2000 };
};

/// @brief Builds the environment for a provider process.
///
/// Starts from @p hostEnv, fills in defaults for PATH, HOME, SHELL and USER
/// where the host leaves them unset, then applies @p overlay on top.
/// @param hostEnv The parent process environment.
/// @param overlay Variables configured for the provider.
/// @return The merged environment.
[[nodiscard]] auto buildChildEnvironment(const std::map<std::string, std::string>& hostEnv,
                                         const std::map<std::string, std::string>& overlay)
    -> std::map<std::string, std::string>;

/// @brief Returns the current process environment as a map.
[[nodiscard]] auto hostEnvironment() -> std::map<std::string, std::string>;

/// @brief Transport that communicates with a tool provider via stdio pipes.
///
/// Spawns a child process and communicates via its stdin/stdout. A reader
/// thread forwards stdout chunks and reports the exit of the process.
class StdioTransport: public Transport
{
  public:
    explicit StdioTransport(StdioTransportConfig config);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] auto open(TransportEvents events) -> VoidResult override;
    [[nodiscard]] auto send(std::string_view data) -> VoidResult override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto describe() const -> std::string override;

    /// @brief Returns the child's process id, or -1 when not running.
    [[nodiscard]] auto processId() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace webchat
