// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <mcp/ConnectionManager.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

enum class ServerStatus : std::uint8_t
{
    Connected,
    Disconnected,
    Error,
};

[[nodiscard]] constexpr auto serverStatusName(ServerStatus status) -> std::string_view
{
    switch (status)
    {
        case ServerStatus::Connected: return "connected";
        case ServerStatus::Disconnected: return "disconnected";
        case ServerStatus::Error: return "error";
    }
    return "error";
}

/// @brief What one server offers, as seen by the last discovery pass.
struct ServerCatalogEntry
{
    std::string serverId;
    std::string displayName;
    std::string description;
    std::vector<ToolDefinition> tools;
    std::vector<ResourceDefinition> resources;
    ServerStatus status = ServerStatus::Disconnected;
    Timestamp lastUpdated {};
};

/// @brief An immutable snapshot of all servers' capabilities.
struct ServerCatalog
{
    std::vector<ServerCatalogEntry> entries;
    Timestamp builtAt {};

    [[nodiscard]] auto find(std::string_view serverId) const -> const ServerCatalogEntry*;

    /// @brief Looks up a tool of a connected server.
    [[nodiscard]] auto findTool(std::string_view serverId, std::string_view toolName) const -> const ToolDefinition*;

    [[nodiscard]] auto empty() const -> bool { return entries.empty(); }
};

using CatalogSnapshot = std::shared_ptr<const ServerCatalog>;

/// @brief Builds and periodically refreshes the server catalog.
///
/// Each refresh produces a new snapshot; readers keep whichever snapshot they
/// obtained and never observe a partially built one.
class ServerDiscovery
{
  public:
    using Clock = std::function<Timestamp()>;

    static constexpr auto DefaultInterval = std::chrono::milliseconds(5 * 60 * 1000);

    explicit ServerDiscovery(ConnectionManager& manager,
                             std::chrono::milliseconds interval = DefaultInterval,
                             Clock clock = {});
    ~ServerDiscovery();

    ServerDiscovery(const ServerDiscovery&) = delete;
    ServerDiscovery& operator=(const ServerDiscovery&) = delete;

    /// @brief Queries every connected server concurrently and publishes a new catalog.
    auto refresh() -> CatalogSnapshot;

    /// @brief Returns the last published catalog without refreshing.
    [[nodiscard]] auto catalog() const -> CatalogSnapshot;

    /// @brief Returns a catalog that is not stale, refreshing first if needed.
    auto currentCatalog() -> CatalogSnapshot;

    /// @brief True if the catalog is empty, any entry is older than the
    /// interval, or the set of connected servers differs from the catalog's.
    [[nodiscard]] auto shouldRediscover() const -> bool;

    /// @brief Starts refreshing in the background on the interval.
    void start();

    /// @brief Stops the background refresh. Idempotent.
    void stop();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Human-readable name of a server id ("filesystem" -> "File System").
[[nodiscard]] auto serverDisplayName(std::string_view serverId) -> std::string;

/// @brief One-line summary of what a server offers, naming up to three tools.
[[nodiscard]] auto describeServer(std::string_view serverId, const std::vector<ToolDefinition>& tools)
    -> std::string;

/// @brief Example phrases a user might type to invoke a tool.
[[nodiscard]] auto toolExamples(std::string_view toolName, std::string_view description)
    -> std::vector<std::string>;

} // namespace mcpbridge
