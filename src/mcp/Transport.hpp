// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerConfig.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <string>

namespace mcpbridge
{

/// @brief Abstract interface for tool server transport communication.
///
/// A transport moves whole JSON-RPC messages. Inbound messages and the end of
/// the connection are pushed to the handlers from the transport's reader
/// thread; handlers must be installed before connect().
class Transport
{
  public:
    /// @brief Receives one inbound JSON-RPC message.
    using MessageHandler = std::function<void(nlohmann::json message)>;

    /// @brief Called once when the peer goes away without disconnect() being called.
    using CloseHandler = std::function<void(std::string reason)>;

    virtual ~Transport() = default;

    /// @brief Opens the channel and waits until it is ready for traffic.
    /// @return Success or a ConnectionError.
    [[nodiscard]] virtual auto connect() -> VoidResult = 0;

    /// @brief Closes the channel. Idempotent.
    virtual void disconnect() = 0;

    /// @brief Sends a JSON message to the server.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Returns the variant of this transport.
    [[nodiscard]] virtual auto kind() const -> TransportKind = 0;

    void setMessageHandler(MessageHandler handler) { _onMessage = std::move(handler); }
    void setCloseHandler(CloseHandler handler) { _onClose = std::move(handler); }

  protected:
    void dispatchMessage(nlohmann::json message) const
    {
        if (_onMessage)
            _onMessage(std::move(message));
    }

    void dispatchClose(std::string reason) const
    {
        if (_onClose)
            _onClose(std::move(reason));
    }

  private:
    MessageHandler _onMessage;
    CloseHandler _onClose;
};

/// @brief Creates the transport variant selected by the server's configuration.
/// @param config The server configuration.
/// @return The unconnected transport, or a ConfigError when required fields are missing.
[[nodiscard]] auto makeTransport(const ServerConfig& config) -> Result<std::unique_ptr<Transport>>;

} // namespace mcpbridge
