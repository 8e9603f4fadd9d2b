// SPDX-License-Identifier: Apache-2.0
#include "SocketTransport.hpp"

#include <core/Log.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <format>
#include <mutex>
#include <optional>
#include <thread>

namespace webchat
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

auto parseSocketAddress(std::string_view url) -> Result<SocketAddress>
{
    auto address = SocketAddress {};

    auto const schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos)
        return makeError(ErrorCode::TransportError, std::format("Socket URL has no scheme: {}", url));

    auto const scheme = url.substr(0, schemeEnd);
    if (scheme == "tcp")
        address.scheme = SocketAddress::Scheme::Tcp;
    else if (scheme == "ws")
        address.scheme = SocketAddress::Scheme::WebSocket;
    else if (scheme == "wss")
        return makeError(ErrorCode::TransportError, std::format("TLS sockets are not supported: {}", url));
    else
        return makeError(ErrorCode::TransportError, std::format("Unsupported socket scheme '{}'", scheme));

    auto rest = url.substr(schemeEnd + 3);
    auto const pathStart = rest.find('/');
    if (pathStart != std::string_view::npos)
    {
        address.path = std::string(rest.substr(pathStart));
        rest = rest.substr(0, pathStart);
    }

    // [v6-address]:port or host:port
    auto portSeparator = std::string_view::npos;
    if (rest.starts_with('['))
    {
        auto const closing = rest.find(']');
        if (closing == std::string_view::npos)
            return makeError(ErrorCode::TransportError, std::format("Malformed IPv6 address in {}", url));
        address.host = std::string(rest.substr(1, closing - 1));
        if (closing + 1 < rest.size() && rest[closing + 1] == ':')
            portSeparator = closing + 1;
    }
    else
    {
        portSeparator = rest.rfind(':');
        address.host = std::string(rest.substr(0, portSeparator));
    }

    if (portSeparator != std::string_view::npos)
        address.port = std::string(rest.substr(portSeparator + 1));

    if (address.host.empty())
        return makeError(ErrorCode::TransportError, std::format("Socket URL has no host: {}", url));
    if (address.port.empty())
    {
        if (address.scheme == SocketAddress::Scheme::Tcp)
            return makeError(ErrorCode::TransportError, std::format("Socket URL has no port: {}", url));
        address.port = "80";
    }

    return address;
}

struct SocketTransport::Impl
{
    std::string url;
    std::chrono::milliseconds connectTimeout { DefaultSocketConnectTimeout };
    SocketAddress address;
    TransportEvents events;

    std::unique_ptr<asio::io_context> io;
    std::mutex lifecycleMutex;
    std::optional<tcp::socket> stream;
    std::optional<websocket::stream<tcp::socket>> ws;
    std::array<char, 4096> readChunk {};
    beast::flat_buffer frameBuffer;
    std::deque<std::string> writeQueue;

    std::atomic<bool> connected { false };
    std::atomic<bool> closing { false };
    std::atomic<bool> lifecycleRaised { false };
    std::jthread ioThread;

    [[nodiscard]] auto isWebSocket() const -> bool { return address.scheme == SocketAddress::Scheme::WebSocket; }

    void raiseClosed()
    {
        connected = false;
        if (closing || lifecycleRaised.exchange(true))
            return;
        log::info("Socket to {} closed by peer", url);
        if (events.onClosed)
            events.onClosed();
    }

    void raiseError(const beast::error_code& ec, std::string_view operation)
    {
        connected = false;
        if (closing || lifecycleRaised.exchange(true))
            return;
        auto const error = Error {
            ErrorCode::TransportError,
            std::format("Socket {} to {} failed: {}", operation, url, ec.message()),
        };
        log::warning("{}", error.message);
        if (events.onError)
            events.onError(error);
    }

    void handleReadError(const beast::error_code& ec)
    {
        if (ec == asio::error::operation_aborted)
            return;
        if (ec == asio::error::eof || ec == websocket::error::closed)
            raiseClosed();
        else
            raiseError(ec, "read");
    }

    void startRead()
    {
        if (isWebSocket())
        {
            ws->async_read(frameBuffer, [this](const beast::error_code& ec, size_t) {
                if (ec)
                    return handleReadError(ec);

                // Frame boundaries are message boundaries; the codec expects newlines.
                auto text = beast::buffers_to_string(frameBuffer.data());
                frameBuffer.consume(frameBuffer.size());
                if (text.empty() || text.back() != '\n')
                    text.push_back('\n');
                if (events.onData)
                    events.onData(text);
                startRead();
            });
            return;
        }

        stream->async_read_some(asio::buffer(readChunk), [this](const beast::error_code& ec, size_t bytesRead) {
            if (ec)
                return handleReadError(ec);
            if (events.onData)
                events.onData(std::string_view(readChunk.data(), bytesRead));
            startRead();
        });
    }

    void startWrite()
    {
        auto const onWritten = [this](const beast::error_code& ec, size_t) {
            if (ec)
            {
                if (ec != asio::error::operation_aborted)
                    raiseError(ec, "write");
                writeQueue.clear();
                return;
            }
            writeQueue.pop_front();
            if (!writeQueue.empty())
                startWrite();
        };

        if (isWebSocket())
            ws->async_write(asio::buffer(writeQueue.front()), onWritten);
        else
            asio::async_write(*stream, asio::buffer(writeQueue.front()), onWritten);
    }

    /// @brief Closes the underlying socket; must run on the I/O thread once it exists.
    void shutdownSocket()
    {
        auto ec = beast::error_code {};
        auto& socket = isWebSocket() ? ws->next_layer() : *stream;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }
};

SocketTransport::SocketTransport(std::string url, std::chrono::milliseconds connectTimeout):
    _impl(std::make_unique<Impl>())
{
    _impl->url = std::move(url);
    _impl->connectTimeout = connectTimeout;
}

SocketTransport::~SocketTransport()
{
    close();
}

auto SocketTransport::open(TransportEvents events) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    auto address = parseSocketAddress(_impl->url);
    if (!address)
        return std::unexpected(address.error());

    close();

    auto const lock = std::lock_guard(_impl->lifecycleMutex);
    _impl->address = std::move(*address);
    // Fresh context per connection: nothing queued for an old socket can leak in.
    _impl->io = std::make_unique<asio::io_context>();

    if (_impl->isWebSocket())
    {
        _impl->ws.emplace(*_impl->io);
        _impl->ws->set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) { req.set(beast::http::field::user_agent, "webchat-ui"); }));
    }
    else
    {
        _impl->stream.emplace(*_impl->io);
    }

    // Resolve, connect and handshake run on this thread, bounded by the connect timeout.
    auto resolver = tcp::resolver(*_impl->io);
    auto outcome = std::optional<beast::error_code> {};
    auto& socket = _impl->isWebSocket() ? _impl->ws->next_layer() : *_impl->stream;
    auto const hostHeader = std::format("{}:{}", _impl->address.host, _impl->address.port);

    resolver.async_resolve(
        _impl->address.host,
        _impl->address.port,
        [&](const beast::error_code& resolveError, const tcp::resolver::results_type& endpoints) {
            if (resolveError)
            {
                outcome = resolveError;
                return;
            }
            asio::async_connect(socket, endpoints, [&](const beast::error_code& connectError, const tcp::endpoint&) {
                if (connectError || !_impl->isWebSocket())
                {
                    outcome = connectError;
                    return;
                }
                _impl->ws->async_handshake(hostHeader,
                                           _impl->address.path,
                                           [&](const beast::error_code& handshakeError) { outcome = handshakeError; });
            });
        });

    _impl->io->run_for(_impl->connectTimeout);
    if (!outcome)
    {
        auto ec = beast::error_code {};
        resolver.cancel();
        socket.close(ec);
        _impl->io->restart();
        _impl->io->run();
        outcome = beast::error_code(asio::error::timed_out);
    }
    _impl->io->restart();

    if (*outcome)
    {
        _impl->ws.reset();
        _impl->stream.reset();
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to connect to {}: {}", _impl->url, outcome->message()));
    }

    if (_impl->isWebSocket())
        _impl->ws->text(true);

    _impl->events = std::move(events);
    _impl->closing = false;
    _impl->lifecycleRaised = false;
    _impl->connected = true;

    _impl->startRead();
    _impl->ioThread = std::jthread([impl = _impl.get()] { impl->io->run(); });

    log::info("Connected to socket MCP server: {}", _impl->url);
    return {};
}

auto SocketTransport::send(std::string_view data) -> VoidResult
{
    auto const lock = std::lock_guard(_impl->lifecycleMutex);
    if (!_impl->connected || !_impl->io)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto payload = std::string(data);
    if (_impl->isWebSocket() && !payload.empty() && payload.back() == '\n')
        payload.pop_back();

    asio::post(*_impl->io, [impl = _impl.get(), payload = std::move(payload)]() mutable {
        if (impl->closing)
            return;
        impl->writeQueue.push_back(std::move(payload));
        if (impl->writeQueue.size() == 1)
            impl->startWrite();
    });

    return {};
}

void SocketTransport::close()
{
    _impl->connected = false;

    // From an event callback: stop the socket, leave teardown to the owner.
    if (_impl->ioThread.joinable() && _impl->ioThread.get_id() == std::this_thread::get_id())
    {
        _impl->closing = true;
        _impl->shutdownSocket();
        return;
    }

    auto const lock = std::lock_guard(_impl->lifecycleMutex);
    if (!_impl->ws && !_impl->stream)
        return;

    _impl->closing = true;

    if (_impl->ioThread.joinable())
    {
        asio::post(*_impl->io, [impl = _impl.get()] { impl->shutdownSocket(); });
        _impl->ioThread.join();
    }
    else
    {
        _impl->shutdownSocket();
    }

    _impl->writeQueue.clear();
    _impl->frameBuffer.clear();
    _impl->ws.reset();
    _impl->stream.reset();
    log::debug("Socket transport closed: {}", _impl->url);
}

auto SocketTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto SocketTransport::describe() const -> std::string
{
    return _impl->url;
}

} // namespace webchat
