// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcpbridge::test
{

class MockServer;

/// @brief Transport that hands every message to a scripted in-process server.
class MockTransport: public Transport
{
  public:
    explicit MockTransport(std::shared_ptr<MockServer> server): _server(std::move(server)) {}
    ~MockTransport() override;

    auto connect() -> VoidResult override;
    void disconnect() override;
    auto send(const nlohmann::json& message) -> VoidResult override;
    auto isConnected() const -> bool override { return _connected; }
    auto kind() const -> TransportKind override { return TransportKind::Pipe; }

    /// @brief Delivers a message as if it had been read from the wire.
    void deliver(nlohmann::json message) { dispatchMessage(std::move(message)); }

    /// @brief Simulates the peer going away.
    void dropFromPeer(std::string reason)
    {
        _connected = false;
        dispatchClose(std::move(reason));
    }

  private:
    std::shared_ptr<MockServer> _server;
    std::atomic<bool> _connected = false;
};

/// @brief A fake tool server answering JSON-RPC requests synchronously.
///
/// Shared between the test and the transport so that the test can inspect
/// what was sent after the transport has been handed to a Connection.
class MockServer
{
  public:
    /// @brief Produces the result of a request, or an error sent back as an RPC error.
    using Handler = std::function<Result<nlohmann::json>(const nlohmann::json& params)>;

    explicit MockServer(const std::vector<std::string>& toolNames = {})
    {
        for (const auto& name: toolNames)
            addTool(name);
    }

    void addTool(const std::string& name, nlohmann::json inputSchema = nlohmann::json { { "type", "object" } })
    {
        auto lock = std::lock_guard(_mutex);
        _tools.push_back(nlohmann::json {
            { "name", name },
            { "description", "Mock " + name },
            { "inputSchema", std::move(inputSchema) },
        });
    }

    void setHandler(const std::string& method, Handler handler)
    {
        auto lock = std::lock_guard(_mutex);
        _handlers[method] = std::move(handler);
    }

    /// @brief Requests for @p method are recorded but only answered through reply().
    void deferMethod(const std::string& method)
    {
        auto lock = std::lock_guard(_mutex);
        _deferred.insert(method);
    }

    void setRefuseConnect(bool refuse)
    {
        auto lock = std::lock_guard(_mutex);
        _refuseConnect = refuse;
    }

    /// @brief Answers a deferred request.
    void reply(int64_t id, nlohmann::json result)
    {
        auto* transport = attached();
        if (transport)
            transport->deliver(nlohmann::json { { "jsonrpc", "2.0" }, { "id", id }, { "result", std::move(result) } });
    }

    /// @brief Sends an arbitrary message to the client.
    void push(nlohmann::json message)
    {
        if (auto* transport = attached())
            transport->deliver(std::move(message));
    }

    void closeFromPeer(std::string reason)
    {
        if (auto* transport = attached())
            transport->dropFromPeer(std::move(reason));
    }

    [[nodiscard]] auto sentMessages() const -> std::vector<nlohmann::json>
    {
        auto lock = std::lock_guard(_mutex);
        return _sent;
    }

    [[nodiscard]] auto sentMethods() const -> std::vector<std::string>
    {
        auto methods = std::vector<std::string> {};
        for (const auto& message: sentMessages())
            methods.push_back(message.value("method", ""));
        return methods;
    }

    /// @brief Ids of every request sent, in order.
    [[nodiscard]] auto requestIds() const -> std::vector<int64_t>
    {
        auto ids = std::vector<int64_t> {};
        for (const auto& message: sentMessages())
        {
            if (message.contains("id") && message.contains("method"))
                ids.push_back(message["id"].get<int64_t>());
        }
        return ids;
    }

    /// @brief Ids of deferred requests, in arrival order.
    [[nodiscard]] auto deferredIds() const -> std::vector<int64_t>
    {
        auto lock = std::lock_guard(_mutex);
        return _deferredIds;
    }

    [[nodiscard]] auto connectCount() const -> int
    {
        auto lock = std::lock_guard(_mutex);
        return _connects;
    }

    auto attach(MockTransport* transport) -> VoidResult
    {
        auto lock = std::lock_guard(_mutex);
        ++_connects;
        if (_refuseConnect)
            return makeError(ErrorCode::ConnectionError, "Connection refused");
        _transport = transport;
        return {};
    }

    void detach(MockTransport* transport)
    {
        auto lock = std::lock_guard(_mutex);
        if (_transport == transport)
            _transport = nullptr;
    }

    void receive(MockTransport* transport, const nlohmann::json& message)
    {
        auto reply = std::optional<nlohmann::json> {};
        {
            auto lock = std::lock_guard(_mutex);
            _sent.push_back(message);

            if (!message.contains("id") || !message.contains("method"))
                return;

            auto const id = message["id"];
            auto const method = message["method"].get<std::string>();
            auto const params = message.value("params", nlohmann::json::object());

            if (_deferred.contains(method))
            {
                _deferredIds.push_back(id.get<int64_t>());
                return;
            }

            auto result = answer(method, params);
            if (result)
                reply = nlohmann::json { { "jsonrpc", "2.0" }, { "id", id }, { "result", std::move(*result) } };
            else
                reply = jsonrpc::makeErrorResponse(id, -32000, result.error().message);
        }

        transport->deliver(std::move(*reply));
    }

  private:
    auto attached() const -> MockTransport*
    {
        auto lock = std::lock_guard(_mutex);
        return _transport;
    }

    auto answer(const std::string& method, const nlohmann::json& params) -> Result<nlohmann::json>
    {
        if (auto const it = _handlers.find(method); it != _handlers.end())
            return it->second(params);

        if (method == "initialize")
            return nlohmann::json {
                { "protocolVersion", "2024-11-05" },
                { "serverInfo", { { "name", "mock-server" }, { "version", "1.0" } } },
                { "capabilities", { { "tools", nlohmann::json::object() }, { "resources", nlohmann::json::object() } } },
            };
        if (method == "tools/list")
            return nlohmann::json { { "tools", _tools } };
        if (method == "resources/list")
            return nlohmann::json { { "resources", nlohmann::json::array() } };
        if (method == "tools/call")
        {
            auto const text = "ok " + params.value("name", "");
            return nlohmann::json {
                { "content", nlohmann::json::array({ { { "type", "text" }, { "text", text } } }) },
            };
        }

        return makeError(ErrorCode::ProtocolError, "Method not found");
    }

    mutable std::mutex _mutex;
    MockTransport* _transport = nullptr;
    nlohmann::json _tools = nlohmann::json::array();
    std::map<std::string, Handler> _handlers;
    std::set<std::string> _deferred;
    std::vector<nlohmann::json> _sent;
    std::vector<int64_t> _deferredIds;
    bool _refuseConnect = false;
    int _connects = 0;
};

inline MockTransport::~MockTransport()
{
    _server->detach(this);
}

inline auto MockTransport::connect() -> VoidResult
{
    if (auto attached = _server->attach(this); !attached)
        return attached;
    _connected = true;
    return {};
}

inline void MockTransport::disconnect()
{
    _connected = false;
    _server->detach(this);
}

inline auto MockTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_connected)
        return makeError(ErrorCode::ConnectionError, "Transport not connected");
    _server->receive(this, message);
    return {};
}

/// @brief Transport factory serving each configured server id from a MockServer.
///
/// Unknown ids fail like an unreachable server.
class MockNetwork
{
  public:
    auto add(const std::string& serverId, std::shared_ptr<MockServer> server) -> std::shared_ptr<MockServer>
    {
        auto lock = std::lock_guard(_mutex);
        _servers[serverId] = server;
        return server;
    }

    auto factory()
    {
        return [this](const ServerConfig& config) -> Result<std::unique_ptr<Transport>> {
            auto lock = std::lock_guard(_mutex);
            auto const it = _servers.find(config.name);
            if (it == _servers.end())
                return makeError(ErrorCode::ConnectionError, "No route to " + config.name);
            return std::make_unique<MockTransport>(it->second);
        };
    }

  private:
    std::mutex _mutex;
    std::map<std::string, std::shared_ptr<MockServer>> _servers;
};

} // namespace mcpbridge::test
