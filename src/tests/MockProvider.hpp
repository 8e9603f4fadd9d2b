// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/JsonRpc.hpp>
#include <mcp/ServerSession.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace webchat::test
{

/// @brief In-process tool provider that answers requests from a handler.
///
/// Every transport created through factory() talks to the same provider, so a
/// test can inspect what was sent and inject responses or lifecycle events.
class MockProvider: public std::enable_shared_from_this<MockProvider>
{
  public:
    /// Returns the complete response message for a request, or nullopt to leave it unanswered.
    using Handler = std::function<std::optional<nlohmann::json>(const nlohmann::json& request)>;

    static auto create(Handler handler) -> std::shared_ptr<MockProvider>
    {
        return std::shared_ptr<MockProvider>(new MockProvider(std::move(handler)));
    }

    /// @brief A provider that implements initialize, tools/list and tools/call.
    ///
    /// tools/call answers with a text item "<tool>: <arguments>"; resources/list
    /// is answered with "method not found".
    static auto standard(nlohmann::json tools) -> std::shared_ptr<MockProvider>
    {
        return create([tools = std::move(tools)](const nlohmann::json& request) -> std::optional<nlohmann::json> {
            auto const method = request.value("method", "");
            if (method == "initialize")
            {
                return resultFor(request,
                                 {
                                     { "protocolVersion", "2024-11-05" },
                                     { "serverInfo", { { "name", "mock" }, { "version", "0.1" } } },
                                     { "capabilities", { { "tools", nlohmann::json::object() } } },
                                 });
            }
            if (method == "tools/list")
                return resultFor(request, { { "tools", tools } });
            if (method == "tools/call")
            {
                auto const text =
                    request["params"]["name"].get<std::string>() + ": " + request["params"]["arguments"].dump();
                return resultFor(
                    request,
                    { { "content", nlohmann::json::array({ { { "type", "text" }, { "text", text } } }) } });
            }
            return errorFor(request, -32601, "Method not found");
        });
    }

    static auto resultFor(const nlohmann::json& request, nlohmann::json result) -> nlohmann::json
    {
        return nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", request["id"] },
            { "result", std::move(result) },
        };
    }

    static auto errorFor(const nlohmann::json& request, int code, std::string message,
                         nlohmann::json data = nullptr) -> nlohmann::json
    {
        auto error = nlohmann::json { { "code", code }, { "message", std::move(message) } };
        if (!data.is_null())
            error["data"] = std::move(data);
        return nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", request["id"] },
            { "error", std::move(error) },
        };
    }

    /// @brief Factory handing out transports connected to this provider.
    auto factory() -> TransportFactory
    {
        return [self = shared_from_this()](const ProviderConfig&) -> std::unique_ptr<Transport> {
            return std::make_unique<Connection>(self);
        };
    }

    void setFailOpen(bool fail)
    {
        auto const lock = std::lock_guard(_mutex);
        _failOpen = fail;
    }

    [[nodiscard]] auto openCount() const -> size_t
    {
        auto const lock = std::lock_guard(_mutex);
        return _history.size();
    }

    [[nodiscard]] auto sent() const -> std::vector<nlohmann::json>
    {
        auto const lock = std::lock_guard(_mutex);
        return _sent;
    }

    [[nodiscard]] auto sentMethods() const -> std::vector<std::string>
    {
        auto methods = std::vector<std::string> {};
        for (auto const& message: sent())
            methods.push_back(message.value("method", ""));
        return methods;
    }

    /// @brief Waits until @p count requests for @p method have been sent.
    /// @return The matching requests, or an empty vector on timeout.
    auto waitForRequests(std::string_view method, size_t count, std::chrono::milliseconds timeout)
        -> std::vector<nlohmann::json>
    {
        auto lock = std::unique_lock(_mutex);
        auto matching = std::vector<nlohmann::json> {};
        auto const found = _sentChanged.wait_for(lock, timeout, [&] {
            matching.clear();
            for (auto const& message: _sent)
                if (message.value("method", "") == method && message.contains("id"))
                    matching.push_back(message);
            return matching.size() >= count;
        });
        return found ? matching : std::vector<nlohmann::json> {};
    }

    /// @brief Delivers a message on the current connection.
    void respond(const nlohmann::json& message) { deliver(jsonrpc::encode(message)); }

    /// @brief Delivers raw bytes on the current connection.
    void deliver(std::string_view bytes)
    {
        auto events = currentEvents();
        if (!events || !events->onData)
            return;
        auto const lock = std::lock_guard(_deliveryMutex);
        events->onData(bytes);
    }

    /// @brief Simulates the provider ending the stream.
    void closeFromPeer()
    {
        auto events = detach();
        if (events && events->onClosed)
            events->onClosed();
    }

    /// @brief Simulates an abnormal end of the stream.
    void failFromPeer(std::string message)
    {
        auto events = detach();
        if (events && events->onError)
            events->onError(Error { ErrorCode::TransportError, std::move(message), {} });
    }

    /// @brief The callbacks registered by the @p index-th open(), kept after close.
    [[nodiscard]] auto eventsOfConnection(size_t index) const -> TransportEvents
    {
        auto const lock = std::lock_guard(_mutex);
        return _history.at(index);
    }

  private:
    class Connection: public Transport
    {
      public:
        explicit Connection(std::shared_ptr<MockProvider> provider): _provider(std::move(provider)) {}

        ~Connection() override { close(); }

        auto open(TransportEvents events) -> VoidResult override
        {
            auto attached = _provider->attach(std::move(events));
            if (!attached)
                return std::unexpected(attached.error());
            _index = *attached;
            _connected = true;
            return {};
        }

        auto send(std::string_view data) -> VoidResult override
        {
            if (!_connected)
                return makeError(ErrorCode::TransportError, "mock connection is closed");
            _provider->receive(data);
            return {};
        }

        void close() override
        {
            if (_connected.exchange(false))
                _provider->detach(_index);
        }

        auto isConnected() const -> bool override { return _connected; }

        auto describe() const -> std::string override { return "mock"; }

      private:
        std::shared_ptr<MockProvider> _provider;
        size_t _index = 0;
        std::atomic<bool> _connected = false;
    };

    explicit MockProvider(Handler handler): _handler(std::move(handler)) {}

    auto attach(TransportEvents events) -> Result<size_t>
    {
        auto const lock = std::lock_guard(_mutex);
        if (_failOpen)
            return makeError(ErrorCode::TransportError, "mock provider refused the connection");
        _history.push_back(events);
        _current = std::move(events);
        _currentIndex = _history.size() - 1;
        return _currentIndex;
    }

    /// Ends the current connection, or only connection @p index when given.
    auto detach(std::optional<size_t> index = std::nullopt) -> std::optional<TransportEvents>
    {
        auto const lock = std::lock_guard(_mutex);
        if (index && *index != _currentIndex)
            return std::nullopt;
        auto events = std::move(_current);
        _current.reset();
        return events;
    }

    auto currentEvents() const -> std::optional<TransportEvents>
    {
        auto const lock = std::lock_guard(_mutex);
        return _current;
    }

    void receive(std::string_view data)
    {
        auto responses = std::vector<nlohmann::json> {};
        {
            auto const lock = std::lock_guard(_mutex);
            while (!data.empty())
            {
                auto const newline = data.find('\n');
                auto const line = data.substr(0, newline);
                data = newline == std::string_view::npos ? std::string_view {} : data.substr(newline + 1);
                if (line.empty())
                    continue;

                auto message = nlohmann::json::parse(line);
                _sent.push_back(message);
                if (message.contains("id") && _handler)
                {
                    if (auto response = _handler(message))
                        responses.push_back(std::move(*response));
                }
            }
        }
        _sentChanged.notify_all();

        for (auto const& response: responses)
            respond(response);
    }

    Handler _handler;

    mutable std::mutex _mutex;
    std::condition_variable _sentChanged;
    bool _failOpen = false;
    std::vector<nlohmann::json> _sent;
    std::optional<TransportEvents> _current;
    size_t _currentIndex = 0;
    std::vector<TransportEvents> _history;

    std::mutex _deliveryMutex;
};

} // namespace webchat::test
