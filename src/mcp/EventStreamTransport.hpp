// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace mcpbridge
{

/// @brief Transport over a server-sent event stream plus HTTP POST.
///
/// The server announces the URL to POST requests to in an "endpoint" event;
/// the transport is ready once that event arrives. Replies and notifications
/// arrive as "message" events.
class EventStreamTransport: public Transport
{
  public:
    /// @param url The event stream URL.
    /// @param timeout Bounds the wait for the endpoint announcement and each POST.
    EventStreamTransport(std::string url, std::chrono::milliseconds timeout);
    ~EventStreamTransport() override;

    EventStreamTransport(const EventStreamTransport&) = delete;
    EventStreamTransport& operator=(const EventStreamTransport&) = delete;

    [[nodiscard]] auto connect() -> VoidResult override;
    void disconnect() override;
    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto kind() const -> TransportKind override { return TransportKind::EventStream; }

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;

    void streamLoop(std::stop_token stopToken);
};

/// @brief Resolves the announced endpoint against the stream URL.
///
/// Absolute URLs are returned unchanged, paths starting with '/' replace the
/// stream URL's path, anything else is resolved relative to its directory.
[[nodiscard]] auto resolveEndpointUrl(std::string_view streamUrl, std::string_view endpoint) -> std::string;

} // namespace mcpbridge
