// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Connection.hpp>
#include <mcp/HealthMonitor.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

/// @brief Collaborators the connection manager is built from.
///
/// Tests replace the transport factory, the sleeper and the clock.
struct EngineContext
{
    using TransportFactory = std::function<Result<std::unique_ptr<Transport>>(const ServerConfig&)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Clock = std::function<Timestamp()>;

    TransportFactory transportFactory = makeTransport;
    BackoffPolicy backoff {};
    Sleeper sleep = defaultSleep;
    Clock now = [] { return std::chrono::system_clock::now(); };

    static void defaultSleep(std::chrono::milliseconds delay);
};

/// @brief One item returned by a cross-server search, tagged with its origin.
struct SearchHit
{
    std::string source; ///< Server id.
    std::string tool;   ///< Tool that produced the item.
    nlohmann::json item;
};

/// @brief Owns the connections to all configured tool servers.
///
/// Every operation addresses a server by its configured id. Connections are
/// shared with in-flight callers, so a reconnect never invalidates a call
/// that is already running.
class ConnectionManager
{
  public:
    explicit ConnectionManager(EngineContext context = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// @brief Connects every enabled server concurrently, retrying with backoff.
    /// @param configs The server configurations; replaces any previous set and
    ///                disconnects every connection made for it.
    /// @return The number of servers that ended up connected.
    auto initialize(std::vector<ServerConfig> configs) -> size_t;

    /// @brief Disconnects every server. The configuration is kept.
    void shutdown();

    /// @brief Replaces the configuration and reconnects; same as initialize().
    auto updateConfig(std::vector<ServerConfig> configs) -> size_t;

    /// @brief Tears down one server's connection and runs its retry sequence once.
    [[nodiscard]] auto reconnectServer(std::string_view serverId) -> VoidResult;

    /// @brief Probes every connection by listing its resources, concurrently.
    ///
    /// Never fails. A failing probe is recorded but does not disconnect.
    /// @return The health snapshot after the probes.
    auto healthCheck() -> std::vector<ConnectionHealth>;

    [[nodiscard]] auto callTool(std::string_view serverId, std::string_view toolName, const nlohmann::json& arguments)
        -> Result<ToolResult>;

    [[nodiscard]] auto listTools(std::string_view serverId) -> Result<std::vector<ToolDefinition>>;
    [[nodiscard]] auto listResources(std::string_view serverId) -> Result<std::vector<ResourceDefinition>>;
    [[nodiscard]] auto readResource(std::string_view serverId, std::string_view uri) -> Result<ResourceContents>;

    /// @brief Sends an arbitrary JSON-RPC request to one server.
    [[nodiscard]] auto callMethod(std::string_view serverId, std::string_view method, nlohmann::json params)
        -> Result<nlohmann::json>;

    /// @brief Runs a search on every connected server exposing a search tool, concurrently.
    ///
    /// A server's failure is logged and recorded in its health; it never
    /// suppresses the other servers' hits.
    [[nodiscard]] auto searchAcrossServers(std::string_view query) -> std::vector<SearchHit>;

    /// @brief Ids of the servers with a live connection, sorted.
    [[nodiscard]] auto connectedServers() const -> std::vector<std::string>;
    [[nodiscard]] auto isServerConnected(std::string_view serverId) const -> bool;

    [[nodiscard]] auto health(std::string_view serverId) const -> std::optional<ConnectionHealth>;
    [[nodiscard]] auto healthSnapshot() const -> std::vector<ConnectionHealth>;

    [[nodiscard]] auto serverConfig(std::string_view serverId) const -> std::optional<ServerConfig>;
    [[nodiscard]] auto serverConfigs() const -> std::vector<ServerConfig>;

    /// @brief Identity the server reported during the handshake.
    [[nodiscard]] auto serverInfo(std::string_view serverId) const -> std::optional<ServerInfo>;

  private:
    auto connectWithRetry(const ServerConfig& config) -> VoidResult;
    auto liveConnection(std::string_view serverId) const -> Result<std::shared_ptr<Connection>>;
    auto timeoutFor(std::string_view serverId) const -> std::chrono::milliseconds;
    auto idSequenceFor(const std::string& serverId) -> std::shared_ptr<RequestIdSequence>;
    void recordOutcome(const std::string& serverId, const Connection& connection, const Error* error);

    EngineContext _context;
    HealthMonitor _health;

    mutable std::mutex _mutex;
    std::map<std::string, ServerConfig, std::less<>> _configs;
    std::map<std::string, std::shared_ptr<Connection>, std::less<>> _connections;
    std::map<std::string, std::shared_ptr<RequestIdSequence>, std::less<>> _idSequences;
};

/// @brief Picks the tool a server would use to answer a search, if it has one.
///
/// Prefers a tool named exactly "search", then any tool whose name contains "search".
[[nodiscard]] auto findSearchTool(const std::vector<ToolDefinition>& tools) -> std::optional<ToolDefinition>;

/// @brief Builds the arguments of a search tool call from the tool's input schema.
[[nodiscard]] auto makeSearchArguments(const ToolDefinition& tool, std::string_view query) -> nlohmann::json;

} // namespace mcpbridge
