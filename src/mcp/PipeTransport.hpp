// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace mcpbridge
{

/// @brief Configuration for spawning a tool server process.
struct PipeTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; ///< Added to (or overriding) the parent environment.
    std::string workingDirectory;           ///< Empty to inherit the parent's.
};

/// @brief Transport that talks to a tool server via the stdio pipes of a child process.
///
/// Messages are framed as one JSON document per line. A reader thread splits
/// stdout into lines and dispatches each parsed message; unparseable lines are
/// logged and dropped. Stderr is logged and its tail kept for diagnostics.
///
/// POSIX only.
class PipeTransport: public Transport
{
  public:
    explicit PipeTransport(PipeTransportConfig config);
    ~PipeTransport() override;

    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;

    /// @brief Spawns the server process.
    /// @return Success or a ConnectionError if the process could not be started.
    [[nodiscard]] auto connect() -> VoidResult override;

    /// @brief Closes stdin, sends SIGTERM and escalates to SIGKILL after a grace period.
    void disconnect() override;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto kind() const -> TransportKind override { return TransportKind::Pipe; }

    /// @brief Returns the most recent stderr output of the child (bounded).
    [[nodiscard]] auto stderrOutput() const -> std::string;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;

    void readLoop(std::stop_token stopToken);
    void stderrLoop(std::stop_token stopToken);
};

} // namespace mcpbridge
