// SPDX-License-Identifier: Apache-2.0
#include "ConnectionManager.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <future>
#include <iterator>
#include <thread>

namespace mcpbridge
{

void EngineContext::defaultSleep(std::chrono::milliseconds delay)
{
    std::this_thread::sleep_for(delay);
}

auto findSearchTool(const std::vector<ToolDefinition>& tools) -> std::optional<ToolDefinition>
{
    auto const exact = std::ranges::find_if(tools, [](const ToolDefinition& tool) { return tool.name == "search"; });
    if (exact != tools.end())
        return *exact;

    auto const partial = std::ranges::find_if(
        tools, [](const ToolDefinition& tool) { return tool.name.find("search") != std::string::npos; });
    if (partial != tools.end())
        return *partial;

    return std::nullopt;
}

auto makeSearchArguments(const ToolDefinition& tool, std::string_view query) -> nlohmann::json
{
    static constexpr auto QueryFields = std::array { "query", "q", "pattern", "search", "text", "keyword" };

    auto const properties = json::getObjectOr(tool.inputSchema, "properties");
    auto arguments = nlohmann::json::object();

    auto const field = std::ranges::find_if(QueryFields, [&](const char* name) { return properties.contains(name); });
    arguments[field != QueryFields.end() ? *field : "query"] = query;

    // File searches need a root to start from.
    auto const required = json::getStringList(tool.inputSchema, "required");
    if (properties.contains("path") && std::ranges::find(required, "path") != required.end())
        arguments["path"] = ".";

    return arguments;
}

ConnectionManager::ConnectionManager(EngineContext context): _context(std::move(context))
{
}

ConnectionManager::~ConnectionManager()
{
    shutdown();
}

auto ConnectionManager::initialize(std::vector<ServerConfig> configs) -> size_t
{
    // Connections of a previous set must not outlive their configuration.
    shutdown();

    auto enabled = std::vector<ServerConfig> {};
    {
        auto lock = std::lock_guard(_mutex);
        _configs.clear();
        for (auto& config: configs)
        {
            if (config.enabled)
                enabled.push_back(config);
            _configs[config.name] = std::move(config);
        }
    }

    _health.clear();
    for (const auto& config: enabled)
        _health.track(config.name);

    log::info("Connecting to {} tool server(s)", enabled.size());

    auto attempts = std::vector<std::future<VoidResult>> {};
    attempts.reserve(enabled.size());
    for (const auto& config: enabled)
        attempts.push_back(std::async(std::launch::async, [this, &config] { return connectWithRetry(config); }));

    auto connected = size_t { 0 };
    for (size_t i = 0; i < attempts.size(); ++i)
    {
        if (auto result = attempts[i].get(); result)
            ++connected;
        else
            log::error("Server '{}' unavailable: {}", enabled[i].name, result.error().message);
    }

    log::info("{} of {} tool server(s) connected", connected, enabled.size());
    return connected;
}

void ConnectionManager::shutdown()
{
    auto connections = std::map<std::string, std::shared_ptr<Connection>, std::less<>> {};
    {
        auto lock = std::lock_guard(_mutex);
        connections.swap(_connections);
    }

    for (auto& [id, connection]: connections)
    {
        connection->disconnect();
        _health.recordDisconnected(id);
        log::debug("Disconnected from '{}'", id);
    }
}

auto ConnectionManager::updateConfig(std::vector<ServerConfig> configs) -> size_t
{
    return initialize(std::move(configs));
}

auto ConnectionManager::connectWithRetry(const ServerConfig& config) -> VoidResult
{
    auto const ids = idSequenceFor(config.name);
    auto const maxAttempts = std::max(1, config.maxRetryAttempts);
    auto lastError = Error { ErrorCode::ConnectionError, "No connection attempt made" };

    for (auto attempt = 1; attempt <= maxAttempts; ++attempt)
    {
        if (attempt > 1)
        {
            auto const delay = _context.backoff.delayAfterFailure(attempt - 1);
            log::info("Retrying '{}' in {} ms (attempt {}/{})", config.name, delay.count(), attempt, maxAttempts);
            _context.sleep(delay);
        }

        auto transport = _context.transportFactory(config);
        if (!transport)
        {
            lastError = transport.error();
            _health.recordConnectFailure(config.name, lastError.message, _context.now());
            continue;
        }

        auto connection = std::make_shared<Connection>(config.name, std::move(*transport), ids);
        if (auto connected = connection->connect(config.timeout); !connected)
        {
            lastError = connected.error();
            log::warning("Connect attempt {}/{} to '{}' failed: {}",
                         attempt,
                         maxAttempts,
                         config.name,
                         lastError.message);
            _health.recordConnectFailure(config.name, lastError.message, _context.now());
            continue;
        }

        {
            auto lock = std::lock_guard(_mutex);
            _connections[config.name] = std::move(connection);
        }
        _health.recordConnected(config.name);
        return {};
    }

    return std::unexpected(lastError);
}

auto ConnectionManager::reconnectServer(std::string_view serverId) -> VoidResult
{
    auto config = serverConfig(serverId);
    if (!config)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown server '{}'", serverId));

    auto previous = std::shared_ptr<Connection> {};
    {
        auto lock = std::lock_guard(_mutex);
        if (auto const it = _connections.find(serverId); it != _connections.end())
        {
            previous = std::move(it->second);
            _connections.erase(it);
        }
    }

    if (previous)
    {
        previous->disconnect();
        _health.recordDisconnected(serverId);
    }

    log::info("Reconnecting '{}'", serverId);
    return connectWithRetry(*config);
}

auto ConnectionManager::healthCheck() -> std::vector<ConnectionHealth>
{
    auto connections = std::vector<std::shared_ptr<Connection>> {};
    {
        auto lock = std::lock_guard(_mutex);
        for (const auto& [id, connection]: _connections)
            connections.push_back(connection);
    }

    auto probes = std::vector<std::future<void>> {};
    for (const auto& connection: connections)
    {
        probes.push_back(std::async(std::launch::async, [this, connection] {
            auto const& id = connection->serverId();
            if (!connection->isConnected())
            {
                _health.recordDisconnected(id, std::string("Connection lost"));
                return;
            }

            auto probe = connection->listResources(timeoutFor(id));
            // An RPC error reply still proves the server is alive.
            if (probe || probe.error().code == ErrorCode::ProtocolError)
                recordOutcome(id, *connection, nullptr);
            else
                recordOutcome(id, *connection, &probe.error());
        }));
    }

    for (auto& probe: probes)
        probe.get();

    return _health.snapshot();
}

auto ConnectionManager::callTool(std::string_view serverId,
                                 std::string_view toolName,
                                 const nlohmann::json& arguments) -> Result<ToolResult>
{
    auto connection = liveConnection(serverId);
    if (!connection)
        return std::unexpected(connection.error());

    auto result = (*connection)->callTool(toolName, arguments, timeoutFor(serverId));
    recordOutcome(std::string(serverId), **connection, result ? nullptr : &result.error());

    return result;
}

auto ConnectionManager::listTools(std::string_view serverId) -> Result<std::vector<ToolDefinition>>
{
    return liveConnection(serverId).and_then([&](const std::shared_ptr<Connection>& connection) {
        return connection->listTools(timeoutFor(serverId));
    });
}

auto ConnectionManager::listResources(std::string_view serverId) -> Result<std::vector<ResourceDefinition>>
{
    return liveConnection(serverId).and_then([&](const std::shared_ptr<Connection>& connection) {
        return connection->listResources(timeoutFor(serverId));
    });
}

auto ConnectionManager::readResource(std::string_view serverId, std::string_view uri) -> Result<ResourceContents>
{
    return liveConnection(serverId).and_then([&](const std::shared_ptr<Connection>& connection) {
        return connection->readResource(uri, timeoutFor(serverId));
    });
}

auto ConnectionManager::callMethod(std::string_view serverId, std::string_view method, nlohmann::json params)
    -> Result<nlohmann::json>
{
    return liveConnection(serverId).and_then([&](const std::shared_ptr<Connection>& connection) {
        return connection->callMethod(method, std::move(params), timeoutFor(serverId));
    });
}

auto ConnectionManager::searchAcrossServers(std::string_view query) -> std::vector<SearchHit>
{
    struct Target
    {
        std::shared_ptr<Connection> connection;
        ToolDefinition tool;
    };

    auto targets = std::vector<Target> {};
    {
        auto lock = std::lock_guard(_mutex);
        for (const auto& [id, connection]: _connections)
        {
            if (!connection->isConnected())
                continue;
            if (auto tool = findSearchTool(connection->tools()); tool)
                targets.push_back(Target { .connection = connection, .tool = std::move(*tool) });
        }
    }

    auto searches = std::vector<std::future<std::vector<SearchHit>>> {};
    for (const auto& target: targets)
    {
        searches.push_back(std::async(std::launch::async, [this, &target, query] {
            auto const& id = target.connection->serverId();
            auto hits = std::vector<SearchHit> {};

            auto result = callTool(id, target.tool.name, makeSearchArguments(target.tool, query));
            if (!result)
            {
                log::warning("Search failed for server '{}': {}", id, result.error().message);
                return hits;
            }
            if (result->isError)
            {
                log::warning("Search tool '{}' on '{}' reported an error: {}", target.tool.name, id, result->text());
                return hits;
            }

            for (const auto& item: result->content)
                hits.push_back(SearchHit { .source = id, .tool = target.tool.name, .item = item });
            return hits;
        }));
    }

    auto results = std::vector<SearchHit> {};
    for (auto& search: searches)
    {
        auto hits = search.get();
        std::ranges::move(hits, std::back_inserter(results));
    }
    return results;
}

auto ConnectionManager::connectedServers() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto ids = std::vector<std::string> {};
    for (const auto& [id, connection]: _connections)
    {
        if (connection->isConnected())
            ids.push_back(id);
    }
    return ids;
}

auto ConnectionManager::isServerConnected(std::string_view serverId) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _connections.find(serverId);
    return it != _connections.end() && it->second->isConnected();
}

auto ConnectionManager::health(std::string_view serverId) const -> std::optional<ConnectionHealth>
{
    return _health.get(serverId);
}

auto ConnectionManager::healthSnapshot() const -> std::vector<ConnectionHealth>
{
    return _health.snapshot();
}

auto ConnectionManager::serverConfig(std::string_view serverId) const -> std::optional<ServerConfig>
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _configs.find(serverId); it != _configs.end())
        return it->second;
    return std::nullopt;
}

auto ConnectionManager::serverConfigs() const -> std::vector<ServerConfig>
{
    auto lock = std::lock_guard(_mutex);
    auto configs = std::vector<ServerConfig> {};
    for (const auto& [id, config]: _configs)
        configs.push_back(config);
    return configs;
}

auto ConnectionManager::serverInfo(std::string_view serverId) const -> std::optional<ServerInfo>
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _connections.find(serverId); it != _connections.end())
        return it->second->serverInfo();
    return std::nullopt;
}

auto ConnectionManager::liveConnection(std::string_view serverId) const -> Result<std::shared_ptr<Connection>>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _connections.find(serverId);
    if (it == _connections.end() || !it->second->isConnected())
        return makeError(ErrorCode::ConnectionError, std::format("Server '{}' is not connected", serverId));
    return it->second;
}

auto ConnectionManager::timeoutFor(std::string_view serverId) const -> std::chrono::milliseconds
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _configs.find(serverId); it != _configs.end())
        return it->second.timeout;
    return ServerConfig {}.timeout;
}

auto ConnectionManager::idSequenceFor(const std::string& serverId) -> std::shared_ptr<RequestIdSequence>
{
    auto lock = std::lock_guard(_mutex);
    auto& sequence = _idSequences[serverId];
    if (!sequence)
        sequence = std::make_shared<RequestIdSequence>();
    return sequence;
}

void ConnectionManager::recordOutcome(const std::string& serverId, const Connection& connection, const Error* error)
{
    if (!error)
    {
        _health.recordOperation(serverId, true);
        return;
    }

    _health.recordOperation(serverId, false, error->message);
    if (!connection.isConnected())
        _health.recordDisconnected(serverId, error->message);
}

} // namespace mcpbridge
