// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>

namespace mcpbridge
{

/// @brief Transport over a persistent WebSocket connection.
///
/// Each text frame (or fragmented text message) carries exactly one JSON-RPC
/// message. Built on libcurl's WebSocket support in connect-only mode.
class SocketTransport: public Transport
{
  public:
    /// @param url A ws:// or wss:// URL.
    /// @param connectTimeout Upper bound for the opening handshake.
    SocketTransport(std::string url, std::chrono::milliseconds connectTimeout);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    [[nodiscard]] auto connect() -> VoidResult override;
    void disconnect() override;
    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto kind() const -> TransportKind override { return TransportKind::Socket; }

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;

    void readLoop(std::stop_token stopToken);
};

} // namespace mcpbridge
