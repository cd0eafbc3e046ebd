// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ConnectionManager.hpp>
#include <mcp/ServerDiscovery.hpp>
#include <router/QueryRouter.hpp>
#include <router/RoutingPlan.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

/// @brief Configuration for query execution.
struct BridgeConfig
{
    double confidenceThreshold = LowConfidence;
    size_t maxSearchResults = 5;
};

/// @brief The answer to one query, with what was done to produce it.
struct QueryResponse
{
    bool success = false;
    std::string content;
    RoutingPlan plan;
    std::optional<ToolResult> toolResult;
    std::optional<Error> error;

    struct Metadata
    {
        std::string serverUsed;
        std::vector<std::string> toolsCalled;
        std::chrono::milliseconds processingTime {};
    } metadata;
};

/// @brief Executes natural-language queries end to end.
///
/// A query is routed to a plan, the plan is checked against the live
/// catalog and executed through the connection manager.
class Bridge
{
  public:
    /// @param manager The connections tools are called on.
    /// @param discovery Supplies the catalog plans are validated against.
    /// @param router Turns queries into plans.
    /// @param config Execution settings.
    Bridge(ConnectionManager& manager, ServerDiscovery& discovery, const QueryRouter& router, BridgeConfig config);

    /// @brief Routes and executes a query. Failures are reported in the response.
    [[nodiscard]] auto processQuery(std::string_view query) -> QueryResponse;

    /// @brief Executes an already computed plan.
    [[nodiscard]] auto executePlan(const RoutingPlan& plan) -> QueryResponse;

    /// @brief Searches every search-capable server and lists the first hits.
    [[nodiscard]] auto search(std::string_view query) -> QueryResponse;

    [[nodiscard]] auto config() const -> const BridgeConfig&;

  private:
    ConnectionManager& _manager;
    ServerDiscovery& _discovery;
    const QueryRouter& _router;
    BridgeConfig _config;
};

/// @brief Renders tool result content as plain text.
///
/// Text items are joined with newlines; other items are summarized as
/// "[image: <mimeType>]" or "[resource: <uri>]".
[[nodiscard]] auto formatToolResult(const ToolResult& result) -> std::string;

} // namespace mcpbridge
