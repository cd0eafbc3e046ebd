// SPDX-License-Identifier: Apache-2.0
#include "Connection.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <algorithm>
#include <format>

namespace mcpbridge
{

namespace
{
    constexpr auto ProtocolVersion = "2024-11-05";
    constexpr auto ClientName = "mcpbridge";
    constexpr auto ClientVersion = "0.1.0";
} // namespace

Connection::Connection(std::string serverId,
                       std::unique_ptr<Transport> transport,
                       std::shared_ptr<RequestIdSequence> ids):
    _serverId(std::move(serverId)), _ids(std::move(ids)), _transport(std::move(transport))
{
    _transport->setMessageHandler([this](nlohmann::json message) { handleMessage(std::move(message)); });
    _transport->setCloseHandler([this](std::string reason) { handleClose(std::move(reason)); });
}

Connection::~Connection()
{
    disconnect();
}

auto Connection::connect(std::chrono::milliseconds timeout) -> VoidResult
{
    if (auto opened = _transport->connect(); !opened)
        return makeError(ErrorCode::ConnectionError,
                         std::format("Failed to open transport to '{}': {}", _serverId, opened.error().message));

    auto params = nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities",
          nlohmann::json {
              { "tools", nlohmann::json::object() },
              { "resources", nlohmann::json::object() },
          } },
        { "clientInfo",
          nlohmann::json {
              { "name", ClientName },
              { "version", ClientVersion },
          } },
    };

    auto initialized = callMethod("initialize", std::move(params), timeout);
    if (!initialized)
    {
        disconnect();
        return makeError(
            ErrorCode::ConnectionError,
            std::format("Initialize handshake with '{}' failed: {}", _serverId, initialized.error().message));
    }

    if (!initialized->is_object())
    {
        disconnect();
        return makeError(ErrorCode::ProtocolError,
                         std::format("Initialize handshake with '{}' returned a {} instead of an object",
                                     _serverId,
                                     initialized->type_name()));
    }

    auto info = ServerInfo {};
    auto const serverInfo = json::getObjectOr(*initialized, "serverInfo");
    info.name = json::getStringOr(serverInfo, "name", _serverId);
    info.version = json::getStringOr(serverInfo, "version", "unknown");
    info.protocolVersion = json::getStringOr(*initialized, "protocolVersion", ProtocolVersion);
    if (auto const caps = initialized->find("capabilities"); caps != initialized->end() && caps->is_object())
    {
        info.hasTools = caps->contains("tools");
        info.hasResources = caps->contains("resources");
    }

    {
        auto lock = std::lock_guard(_mutex);
        _info = info;
    }

    if (auto sent = _transport->send(jsonrpc::makeNotification("notifications/initialized")); !sent)
    {
        disconnect();
        return makeError(ErrorCode::ConnectionError,
                         std::format("Failed to notify '{}' of initialization: {}", _serverId, sent.error().message));
    }

    _initialized = true;
    log::info("Connected to '{}': {} v{}", _serverId, info.name, info.version);

    if (auto tools = listTools(timeout); !tools)
        log::warning("Failed to list tools of '{}': {}", _serverId, tools.error().message);

    return {};
}

void Connection::disconnect()
{
    _initialized = false;
    _transport->disconnect();
    _pending.rejectAll(Error { ErrorCode::ConnectionError, "Connection closed" });
}

auto Connection::isConnected() const -> bool
{
    return _initialized && _transport->isConnected();
}

auto Connection::serverInfo() const -> ServerInfo
{
    auto lock = std::lock_guard(_mutex);
    return _info;
}

auto Connection::tools() const -> std::vector<ToolDefinition>
{
    auto lock = std::lock_guard(_mutex);
    return _tools;
}

auto Connection::hasTool(std::string_view name) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return std::ranges::any_of(_tools, [&](const ToolDefinition& tool) { return tool.name == name; });
}

auto Connection::callMethod(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    auto const id = _ids->next();

    auto future = _pending.add(id, timeout);
    if (!future)
        return std::unexpected(future.error());

    if (auto sent = _transport->send(jsonrpc::makeRequest(id, method, std::move(params))); !sent)
    {
        _pending.complete(id, std::unexpected(sent.error()));
        return future->get();
    }

    log::trace("'{}' request {} sent: {}", _serverId, id, method);
    return future->get();
}

auto Connection::listTools(std::chrono::milliseconds timeout) -> Result<std::vector<ToolDefinition>>
{
    return callMethod("tools/list", nlohmann::json::object(), timeout)
        .transform([this](const nlohmann::json& result) {
            auto tools = std::vector<ToolDefinition> {};
            if (auto const it = result.find("tools"); it != result.end() && it->is_array())
            {
                for (const auto& toolJson: *it)
                {
                    auto tool = toolFromJson(toolJson, _serverId);
                    if (!tool.name.empty())
                        tools.push_back(std::move(tool));
                }
            }

            auto lock = std::lock_guard(_mutex);
            _tools = tools;
            return tools;
        });
}

auto Connection::callTool(std::string_view name, const nlohmann::json& arguments, std::chrono::milliseconds timeout)
    -> Result<ToolResult>
{
    if (!isConnected())
        return makeError(ErrorCode::ConnectionError, std::format("Server '{}' is not connected", _serverId));

    if (!hasTool(name))
        return makeError(ErrorCode::ToolNotFoundError,
                         std::format("Tool '{}' not found on server '{}'", name, _serverId));

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    return callMethod("tools/call", std::move(params), timeout).transform([&](const nlohmann::json& result) {
        auto toolResult = ToolResult {};
        toolResult.isError = json::getBoolOr(result, "isError", false);
        if (auto const it = result.find("content"); it != result.end() && it->is_array())
            toolResult.content = *it;

        log::debug("Tool '{}' on '{}' returned {} item(s) (isError: {})",
                   name,
                   _serverId,
                   toolResult.content.size(),
                   toolResult.isError);
        return toolResult;
    });
}

auto Connection::listResources(std::chrono::milliseconds timeout) -> Result<std::vector<ResourceDefinition>>
{
    return callMethod("resources/list", nlohmann::json::object(), timeout)
        .transform([](const nlohmann::json& result) {
            auto resources = std::vector<ResourceDefinition> {};
            if (auto const it = result.find("resources"); it != result.end() && it->is_array())
            {
                for (const auto& resourceJson: *it)
                    resources.push_back(resourceFromJson(resourceJson));
            }
            return resources;
        });
}

auto Connection::readResource(std::string_view uri, std::chrono::milliseconds timeout) -> Result<ResourceContents>
{
    return callMethod("resources/read", nlohmann::json { { "uri", uri } }, timeout)
        .transform([&](const nlohmann::json& result) {
            auto contents = ResourceContents { .uri = std::string(uri) };
            if (auto const it = result.find("contents"); it != result.end() && it->is_array())
                contents.contents = *it;
            return contents;
        });
}

void Connection::handleMessage(nlohmann::json message)
{
    if (jsonrpc::isResponse(message))
    {
        auto response = jsonrpc::parseResponse(message);
        if (!response)
        {
            log::warning("Malformed reply from '{}': {}", _serverId, response.error().message);
            return;
        }

        auto const id = response->numericId();
        if (!id)
        {
            log::warning("Reply from '{}' carries a non-numeric id: {}", _serverId, response->id.dump());
            return;
        }

        if (!_pending.complete(*id, jsonrpc::toResult(std::move(*response))))
            log::debug("Dropping reply from '{}' for unknown or expired request {}", _serverId, *id);
        return;
    }

    if (jsonrpc::isNotification(message))
    {
        auto const method = json::getStringOr(message, "method", "");
        if (!message.contains("id"))
        {
            log::debug("Notification from '{}': {}", _serverId, method);
            return;
        }

        // Server-initiated requests are not supported by this client.
        auto const reply = jsonrpc::makeErrorResponse(message["id"], jsonrpc::MethodNotFound, "Method not found");
        if (auto sent = _transport->send(reply); !sent)
            log::warning("Failed to reject request '{}' from '{}': {}", method, _serverId, sent.error().message);
        return;
    }

    log::warning("Ignoring unrecognized message from '{}': {}", _serverId, message.dump());
}

void Connection::handleClose(std::string reason)
{
    _initialized = false;
    log::warning("Connection to '{}' lost: {}", _serverId, reason);
    _pending.rejectAll(Error { ErrorCode::ConnectionError, "Connection closed" });
}

} // namespace mcpbridge
