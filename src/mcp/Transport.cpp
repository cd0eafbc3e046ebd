// SPDX-License-Identifier: Apache-2.0
#include "Transport.hpp"

#include <mcp/EventStreamTransport.hpp>
#include <mcp/PipeTransport.hpp>
#include <mcp/SocketTransport.hpp>

#include <format>

namespace mcpbridge
{

auto makeTransport(const ServerConfig& config) -> Result<std::unique_ptr<Transport>>
{
    switch (config.kind)
    {
        case TransportKind::Pipe:
            if (config.command.empty())
                return makeError(ErrorCode::ConfigError,
                                 std::format("Server '{}': stdio transport requires a command", config.name));
            return std::make_unique<PipeTransport>(PipeTransportConfig {
                .command = config.command,
                .args = config.args,
                .env = config.env,
                .workingDirectory = config.workingDirectory,
            });

        case TransportKind::Socket:
            if (config.url.empty())
                return makeError(ErrorCode::ConfigError,
                                 std::format("Server '{}': websocket transport requires a url", config.name));
            return std::make_unique<SocketTransport>(config.url, config.timeout);

        case TransportKind::EventStream:
            if (config.url.empty())
                return makeError(ErrorCode::ConfigError,
                                 std::format("Server '{}': sse transport requires a url", config.name));
            return std::make_unique<EventStreamTransport>(config.url, config.timeout);
    }

    return makeError(ErrorCode::ConfigError, std::format("Server '{}': unknown transport type", config.name));
}

} // namespace mcpbridge
