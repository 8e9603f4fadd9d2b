// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace webchat
{

/// @brief Lifecycle and data callbacks raised by a transport.
///
/// Callbacks run on the transport's own I/O thread, one at a time, in stream order.
struct TransportEvents
{
    /// @brief Called for every inbound chunk of bytes.
    std::function<void(std::string_view chunk)> onData;

    /// @brief Called once when the peer ends the stream (process exit, socket close).
    std::function<void()> onClosed;

    /// @brief Called once when the stream fails abnormally.
    std::function<void(const Error& error)> onError;
};

/// @brief Abstract interface for a byte stream to a tool provider.
///
/// Implementations exist for a spawned local process and for an outbound socket.
/// Nothing above this interface distinguishes between them.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Establishes the stream (spawns the process or connects the socket).
    ///
    /// Returns once the stream is ready for send(); inbound data is delivered
    /// through @p events from then on.
    /// @param events Callbacks for inbound data and lifecycle changes.
    /// @return Success or a TransportError.
    [[nodiscard]] virtual auto open(TransportEvents events) -> VoidResult = 0;

    /// @brief Sends raw bytes to the provider.
    /// @param data The bytes to send.
    /// @return Success or a TransportError if the stream is not open.
    [[nodiscard]] virtual auto send(std::string_view data) -> VoidResult = 0;

    /// @brief Closes the stream. Idempotent; raises no lifecycle events.
    virtual void close() = 0;

    /// @brief Returns true while the stream is open.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Returns a short label for diagnostics (command line or address).
    [[nodiscard]] virtual auto describe() const -> std::string = 0;
};

} // namespace webchat
