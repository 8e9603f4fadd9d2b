// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace webchat
{

/// @brief A parsed socket target address.
struct SocketAddress
{
    enum class Scheme
    {
        Tcp,       ///< tcp://host:port, newline-delimited JSON over a raw stream.
        WebSocket, ///< ws://host:port/path, one JSON message per text frame.
    };

    Scheme scheme = Scheme::Tcp;
    std::string host;
    std::string port;
    std::string path = "/";
};

/// @brief Parses a socket URL of the form tcp://host:port or ws://host:port[/path].
/// @param url The URL to parse.
/// @return The parsed address or a TransportError.
[[nodiscard]] auto parseSocketAddress(std::string_view url) -> Result<SocketAddress>;

/// @brief Upper bound for resolving, connecting and the WebSocket handshake.
constexpr auto DefaultSocketConnectTimeout = std::chrono::milliseconds { std::chrono::seconds(10) };

/// @brief Transport that keeps a persistent outbound socket to a tool provider.
///
/// Connects synchronously in open(), giving up after the connect timeout; afterwards an I/O thread runs the read
/// loop and drains a write queue, so send() never blocks on the network.
class SocketTransport: public Transport
{
  public:
    explicit SocketTransport(std::string url,
                             std::chrono::milliseconds connectTimeout = DefaultSocketConnectTimeout);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    [[nodiscard]] auto open(TransportEvents events) -> VoidResult override;
    [[nodiscard]] auto send(std::string_view data) -> VoidResult override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto describe() const -> std::string override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace webchat
