// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

/// @brief Observed state of one server's connection.
struct ConnectionHealth
{
    std::string serverId;
    bool connected = false;
    std::optional<std::string> lastError;
    int retryCount = 0; ///< Failed connect attempts since the server was configured.
    std::optional<Timestamp> lastRetry;
};

/// @brief Exponential backoff between connect attempts.
struct BackoffPolicy
{
    std::chrono::milliseconds baseDelay { 1000 };
    double factor = 2.0;
    std::chrono::milliseconds maxDelay { 30000 };

    /// @brief Delay before attempt @p attempt + 1, i.e. after the @p attempt-th failure (1-based).
    ///
    /// Yields min(maxDelay, baseDelay * factor^(attempt-1)).
    [[nodiscard]] auto delayAfterFailure(int attempt) const -> std::chrono::milliseconds;
};

/// @brief Thread-safe table of per-server connection health.
class HealthMonitor
{
  public:
    /// @brief Starts tracking a server (disconnected, no retries); resets an existing record.
    void track(std::string_view serverId);

    /// @brief Stops tracking every server.
    void clear();

    void recordConnected(std::string_view serverId);
    void recordConnectFailure(std::string_view serverId, std::string_view error, Timestamp when);
    void recordDisconnected(std::string_view serverId, std::optional<std::string> reason = std::nullopt);

    /// @brief Records the outcome of a tool call or probe on a live connection.
    ///
    /// A failure stores the error but leaves the connected flag alone; a
    /// success clears the last error.
    void recordOperation(std::string_view serverId, bool succeeded, std::string_view error = {});

    [[nodiscard]] auto get(std::string_view serverId) const -> std::optional<ConnectionHealth>;
    [[nodiscard]] auto snapshot() const -> std::vector<ConnectionHealth>;

  private:
    auto entry(std::string_view serverId) -> ConnectionHealth&;

    mutable std::mutex _mutex;
    std::map<std::string, ConnectionHealth, std::less<>> _health;
};

} // namespace mcpbridge
