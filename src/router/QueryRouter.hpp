// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerDiscovery.hpp>
#include <router/LlmClient.hpp>
#include <router/RoutingPlan.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace mcpbridge
{

/// @brief Turns a natural-language query into a RoutingPlan.
///
/// The router asks an LlmClient when one is configured and falls back to
/// keyword heuristics on any provider, parse or validation failure. Plans are
/// always checked against the catalog snapshot they were produced from.
class QueryRouter
{
  public:
    using CatalogProvider = std::function<CatalogSnapshot()>;

    /// @param catalogProvider Supplies the catalog each query is routed against.
    /// @param llm The provider to consult, or null for heuristics only.
    explicit QueryRouter(CatalogProvider catalogProvider, std::shared_ptr<LlmClient> llm = nullptr);

    /// @brief Routes a query against the provider's current catalog. Never fails.
    [[nodiscard]] auto analyzeQuery(std::string_view query) const -> RoutingPlan;

    /// @brief Routes a query against the given catalog. Never fails.
    [[nodiscard]] auto analyzeQuery(std::string_view query, const ServerCatalog& catalog) const -> RoutingPlan;

    [[nodiscard]] auto hasLlm() const noexcept -> bool { return _llm != nullptr; }

  private:
    CatalogProvider _catalogProvider;
    std::shared_ptr<LlmClient> _llm;
};

/// @brief Renders the connected servers of a catalog, their tools and examples, as prompt text.
[[nodiscard]] auto buildCapabilitiesContext(const ServerCatalog& catalog) -> std::string;

/// @brief The full routing prompt for a query.
[[nodiscard]] auto buildAnalysisPrompt(std::string_view query, std::string_view capabilities) -> std::string;

/// @brief Removes a surrounding markdown code fence (with or without a language tag) and trims.
[[nodiscard]] auto stripCodeFences(std::string_view text) -> std::string;

/// @brief Parses an LLM answer into a plan, filling defaults and clamping the confidence.
/// @return The plan, an LlmProviderError for text that is not a JSON object, or a
///         RoutingValidationError when the server or tool is missing.
[[nodiscard]] auto parseRoutingPlan(std::string_view text) -> Result<RoutingPlan>;

/// @brief Checks that the plan's server is connected in the catalog and owns the tool.
[[nodiscard]] auto validatePlan(const RoutingPlan& plan, const ServerCatalog& catalog) -> VoidResult;

/// @brief Keyword-based routing used when no LLM answer is usable.
[[nodiscard]] auto fallbackPlan(std::string_view query, const ServerCatalog& catalog) -> RoutingPlan;

} // namespace mcpbridge
