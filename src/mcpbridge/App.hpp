// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcpbridge/Config.hpp>

#include <memory>
#include <string_view>

namespace mcpbridge
{

/// @brief Wires the connection engine, discovery, router and bridge together
/// and implements the command line sub-commands.
///
/// Every command prints to stdout and returns the process exit code.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Connects the configured servers and builds the first catalog.
    ///
    /// Servers that cannot be reached are reported in the health table;
    /// they do not make initialization fail.
    [[nodiscard]] auto initialize() -> VoidResult;

    [[nodiscard]] auto showServers() -> int;
    [[nodiscard]] auto showTools() -> int;
    [[nodiscard]] auto route(std::string_view query) -> int;
    [[nodiscard]] auto ask(std::string_view query) -> int;
    [[nodiscard]] auto call(std::string_view serverId, std::string_view toolName, std::string_view argumentsJson) -> int;
    [[nodiscard]] auto read(std::string_view serverId, std::string_view uri) -> int;
    [[nodiscard]] auto search(std::string_view query) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpbridge
