// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

/// @brief The wire a tool server is reached over.
enum class TransportKind : std::uint8_t
{
    Pipe,        ///< Child process, newline-delimited JSON over stdin/stdout.
    Socket,      ///< Persistent WebSocket connection.
    EventStream, ///< Server-sent events plus POSTed requests.
};

/// @brief Returns the configuration name of a transport kind.
[[nodiscard]] constexpr auto transportKindName(TransportKind kind) -> std::string_view
{
    switch (kind)
    {
        case TransportKind::Pipe: return "stdio";
        case TransportKind::Socket: return "websocket";
        case TransportKind::EventStream: return "sse";
    }
    return "stdio";
}

/// @brief Parses a transport kind from its configuration name.
///
/// Accepts "stdio"/"pipe", "websocket"/"socket" and "sse"/"event-stream".
[[nodiscard]] constexpr auto transportKindFromString(std::string_view name) -> std::optional<TransportKind>
{
    if (name == "stdio" || name == "pipe")
        return TransportKind::Pipe;
    if (name == "websocket" || name == "socket")
        return TransportKind::Socket;
    if (name == "sse" || name == "event-stream")
        return TransportKind::EventStream;
    return std::nullopt;
}

/// @brief Configuration for a single tool server.
struct ServerConfig
{
    std::string name;        ///< Unique server id.
    std::string displayName; ///< Optional human-readable name.
    TransportKind kind = TransportKind::Pipe;

    // Pipe transport
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string workingDirectory;

    // Socket and event-stream transports
    std::string url;

    bool enabled = true;
    std::chrono::milliseconds timeout { 30000 };
    int maxRetryAttempts = 3;
};

} // namespace mcpbridge
