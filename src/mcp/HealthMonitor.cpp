// SPDX-License-Identifier: Apache-2.0
#include "HealthMonitor.hpp"

#include <algorithm>
#include <cmath>

namespace mcpbridge
{

auto BackoffPolicy::delayAfterFailure(int attempt) const -> std::chrono::milliseconds
{
    if (attempt < 1)
        return std::chrono::milliseconds(0);

    auto const scaled = static_cast<double>(baseDelay.count()) * std::pow(factor, attempt - 1);
    auto const capped = std::min(scaled, static_cast<double>(maxDelay.count()));
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
}

auto HealthMonitor::entry(std::string_view serverId) -> ConnectionHealth&
{
    auto it = _health.find(serverId);
    if (it == _health.end())
        it = _health.emplace(std::string(serverId), ConnectionHealth { .serverId = std::string(serverId) }).first;
    return it->second;
}

void HealthMonitor::track(std::string_view serverId)
{
    auto lock = std::lock_guard(_mutex);
    entry(serverId) = ConnectionHealth { .serverId = std::string(serverId) };
}

void HealthMonitor::clear()
{
    auto lock = std::lock_guard(_mutex);
    _health.clear();
}

void HealthMonitor::recordConnected(std::string_view serverId)
{
    auto lock = std::lock_guard(_mutex);
    auto& health = entry(serverId);
    health.connected = true;
    health.lastError.reset();
}

void HealthMonitor::recordConnectFailure(std::string_view serverId, std::string_view error, Timestamp when)
{
    auto lock = std::lock_guard(_mutex);
    auto& health = entry(serverId);
    health.connected = false;
    health.lastError = std::string(error);
    health.retryCount += 1;
    health.lastRetry = when;
}

void HealthMonitor::recordDisconnected(std::string_view serverId, std::optional<std::string> reason)
{
    auto lock = std::lock_guard(_mutex);
    auto& health = entry(serverId);
    health.connected = false;
    if (reason)
        health.lastError = std::move(reason);
}

void HealthMonitor::recordOperation(std::string_view serverId, bool succeeded, std::string_view error)
{
    auto lock = std::lock_guard(_mutex);
    auto& health = entry(serverId);
    if (succeeded)
        health.lastError.reset();
    else
        health.lastError = std::string(error);
}

auto HealthMonitor::get(std::string_view serverId) const -> std::optional<ConnectionHealth>
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _health.find(serverId); it != _health.end())
        return it->second;
    return std::nullopt;
}

auto HealthMonitor::snapshot() const -> std::vector<ConnectionHealth>
{
    auto lock = std::lock_guard(_mutex);
    auto result = std::vector<ConnectionHealth> {};
    result.reserve(_health.size());
    for (const auto& [id, health]: _health)
        result.push_back(health);
    return result;
}

} // namespace mcpbridge
