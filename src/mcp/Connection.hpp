// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/PendingRequests.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

/// @brief Hands out strictly increasing request ids.
///
/// One sequence is kept per server and shared by every Connection created for
/// it, so ids are never reused across reconnects.
class RequestIdSequence
{
  public:
    [[nodiscard]] auto next() -> int64_t { return _next.fetch_add(1); }
    [[nodiscard]] auto peek() const -> int64_t { return _next.load(); }

  private:
    std::atomic<int64_t> _next { 1 };
};

/// @brief Server identity and capabilities reported by the initialize handshake.
struct ServerInfo
{
    std::string name;
    std::string version;
    std::string protocolVersion;
    bool hasTools = false;
    bool hasResources = false;
};

/// @brief A client session with one tool server.
///
/// Owns the transport and the table of outstanding requests. Requests may be
/// issued from any thread; replies are matched by id on the transport's
/// reader thread, so they may arrive in any order.
class Connection
{
  public:
    /// @param serverId The configured server name.
    /// @param transport The unconnected transport.
    /// @param ids The server's id sequence; a fresh one if omitted.
    Connection(std::string serverId,
               std::unique_ptr<Transport> transport,
               std::shared_ptr<RequestIdSequence> ids = std::make_shared<RequestIdSequence>());
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// @brief Opens the transport and performs the initialize handshake.
    ///
    /// On success the initialized notification has been sent and the tool
    /// list is cached.
    /// @param timeout Bounds the handshake and the initial tool listing.
    /// @return Success or a ConnectionError.
    [[nodiscard]] auto connect(std::chrono::milliseconds timeout) -> VoidResult;

    /// @brief Closes the transport and fails every outstanding request with "Connection closed".
    void disconnect();

    [[nodiscard]] auto isConnected() const -> bool;
    [[nodiscard]] auto serverId() const -> const std::string& { return _serverId; }
    [[nodiscard]] auto serverInfo() const -> ServerInfo;

    /// @brief Returns the tools cached by the last successful listTools().
    [[nodiscard]] auto tools() const -> std::vector<ToolDefinition>;

    /// @brief Returns true if the cached tool list contains @p name.
    [[nodiscard]] auto hasTool(std::string_view name) const -> bool;

    /// @brief Sends a request and waits for its reply.
    /// @return The "result" member, a ProtocolError for an RPC error reply,
    ///         a RequestTimeoutError, or a ConnectionError.
    [[nodiscard]] auto callMethod(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
        -> Result<nlohmann::json>;

    /// @brief Fetches the tool list and refreshes the cache.
    [[nodiscard]] auto listTools(std::chrono::milliseconds timeout) -> Result<std::vector<ToolDefinition>>;

    /// @brief Invokes a tool.
    ///
    /// Tools missing from the cached list fail with ToolNotFoundError without
    /// sending anything.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::chrono::milliseconds timeout) -> Result<ToolResult>;

    [[nodiscard]] auto listResources(std::chrono::milliseconds timeout) -> Result<std::vector<ResourceDefinition>>;

    [[nodiscard]] auto readResource(std::string_view uri, std::chrono::milliseconds timeout)
        -> Result<ResourceContents>;

    /// @brief Number of requests awaiting a reply.
    [[nodiscard]] auto pendingCount() const -> size_t { return _pending.size(); }

    /// @brief Returns true if the request with @p id is awaiting a reply.
    [[nodiscard]] auto isPending(int64_t id) const -> bool { return _pending.contains(id); }

  private:
    void handleMessage(nlohmann::json message);
    void handleClose(std::string reason);

    std::string _serverId;
    std::shared_ptr<RequestIdSequence> _ids;
    PendingRequests _pending;

    mutable std::mutex _mutex;
    ServerInfo _info;
    std::vector<ToolDefinition> _tools;
    std::atomic<bool> _initialized = false;

    // Declared last: its reader thread calls back into the members above.
    std::unique_ptr<Transport> _transport;
};

} // namespace mcpbridge
