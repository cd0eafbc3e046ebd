// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace mcpbridge
{

/// @name Confidence levels
/// Plans below LowConfidence are answered with a clarification request.
/// @{
constexpr auto LowConfidence = 0.3;
constexpr auto MediumConfidence = 0.6;
constexpr auto HighConfidence = 0.8;
/// @}

/// @brief The router's decision of which server and tool should answer a query.
struct RoutingPlan
{
    std::string intent;
    std::string selectedServer;
    std::string selectedTool;
    nlohmann::json parameters = nlohmann::json::object();
    std::string reasoning;
    double confidence = 0.0; ///< In [0, 1].
    std::vector<RoutingPlan> fallbackOptions;
    bool fromHeuristics = false; ///< Set when keyword rules produced the plan.

    /// @brief True if the plan names a target and is confident enough to execute.
    [[nodiscard]] auto isActionable(double threshold = LowConfidence) const -> bool
    {
        return !selectedServer.empty() && !selectedTool.empty() && confidence >= threshold;
    }
};

/// @brief Serializes a plan in the same shape the LLM is asked to produce.
[[nodiscard]] inline auto planToJson(const RoutingPlan& plan) -> nlohmann::json
{
    auto fallbacks = nlohmann::json::array();
    for (const auto& option: plan.fallbackOptions)
        fallbacks.push_back(planToJson(option));

    return nlohmann::json {
        { "intent", plan.intent },
        { "selectedServer", plan.selectedServer },
        { "selectedTool", plan.selectedTool },
        { "parameters", plan.parameters },
        { "reasoning", plan.reasoning },
        { "confidence", plan.confidence },
        { "fallbackOptions", std::move(fallbacks) },
        { "source", plan.fromHeuristics ? "heuristics" : "llm" },
    };
}

} // namespace mcpbridge
