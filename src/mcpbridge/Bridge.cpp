// SPDX-License-Identifier: Apache-2.0
#include "Bridge.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <utility>

namespace mcpbridge
{

namespace
{
    using SteadyClock = std::chrono::steady_clock;

    auto elapsedSince(SteadyClock::time_point start) -> std::chrono::milliseconds
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
    }

    auto describeHit(const SearchHit& hit) -> std::pair<std::string, std::string>
    {
        auto const& item = hit.item;
        auto title = json::getStringOr(item, "title", json::getStringOr(item, "name", "Untitled"));
        auto content = json::getStringOr(item, "text", json::getStringOr(item, "content", ""));
        if (content.empty())
            content = "No content available";
        return { std::move(title), std::move(content) };
    }
} // namespace

auto formatToolResult(const ToolResult& result) -> std::string
{
    auto text = std::string {};
    for (const auto& item: result.content)
    {
        if (!text.empty())
            text += '\n';

        auto const type = json::getStringOr(item, "type", "");
        if (type == "text")
            text += json::getStringOr(item, "text", "");
        else if (type == "image")
            text += std::format("[image: {}]", json::getStringOr(item, "mimeType", "unknown"));
        else if (type == "resource")
        {
            auto const resource = json::getObjectOr(item, "resource");
            text += std::format("[resource: {}]", json::getStringOr(resource, "uri", ""));
        }
        else
            text += item.dump();
    }

    if (result.isError)
        return std::format("Error: {}", text);
    return text;
}

Bridge::Bridge(ConnectionManager& manager, ServerDiscovery& discovery, const QueryRouter& router, BridgeConfig config):
    _manager(manager), _discovery(discovery), _router(router), _config(config)
{
}

auto Bridge::processQuery(std::string_view query) -> QueryResponse
{
    auto const start = SteadyClock::now();
    log::info("Processing query: {}", query);

    auto const catalog = _discovery.currentCatalog();
    auto plan = _router.analyzeQuery(query, *catalog);

    if (!plan.isActionable(_config.confidenceThreshold))
    {
        log::info("Plan not actionable (confidence {:.2f})", plan.confidence);
        auto response = QueryResponse {};
        response.content = std::format("I could not determine how to help with that. {}", plan.reasoning);
        response.plan = std::move(plan);
        response.metadata.processingTime = elapsedSince(start);
        return response;
    }

    auto response = executePlan(plan);
    response.metadata.processingTime = elapsedSince(start);
    return response;
}

auto Bridge::executePlan(const RoutingPlan& plan) -> QueryResponse
{
    auto const start = SteadyClock::now();
    auto response = QueryResponse {};
    response.plan = plan;

    // The catalog may have changed while the plan was being computed.
    if (auto valid = validatePlan(plan, *_discovery.currentCatalog()); !valid)
    {
        log::warning("Discarding plan: {}", valid.error().message);
        response.content = std::format("Sorry, I encountered an error: {}", valid.error().message);
        response.error = valid.error();
        response.metadata.processingTime = elapsedSince(start);
        return response;
    }

    response.metadata.serverUsed = plan.selectedServer;
    response.metadata.toolsCalled.push_back(plan.selectedTool);

    auto result = _manager.callTool(plan.selectedServer, plan.selectedTool, plan.parameters);
    response.metadata.processingTime = elapsedSince(start);
    if (!result)
    {
        log::error("Tool '{}' on '{}' failed: {}", plan.selectedTool, plan.selectedServer, result.error().message);
        response.content = std::format("Sorry, I encountered an error: {}", result.error().message);
        response.error = result.error();
        return response;
    }

    response.success = !result->isError;
    response.content = formatToolResult(*result);
    if (response.content.empty())
        response.content = "No response from server";
    response.toolResult = std::move(*result);
    return response;
}

auto Bridge::search(std::string_view query) -> QueryResponse
{
    auto const start = SteadyClock::now();
    auto const hits = _manager.searchAcrossServers(query);

    auto response = QueryResponse {};
    response.success = true;
    for (const auto& hit: hits)
    {
        if (std::ranges::find(response.metadata.toolsCalled, hit.tool) == response.metadata.toolsCalled.end())
            response.metadata.toolsCalled.push_back(hit.tool);
    }

    if (hits.empty())
        response.content = std::format("No results found for \"{}\"", query);
    else
    {
        response.content = std::format("Found {} results for \"{}\":\n", hits.size(), query);
        auto const shown = std::min(hits.size(), _config.maxSearchResults);
        for (size_t i = 0; i < shown; ++i)
        {
            auto const [title, content] = describeHit(hits[i]);
            response.content += std::format("\n{}. {} ({})\n   {}\n", i + 1, title, hits[i].source, content);
        }
    }

    response.metadata.processingTime = elapsedSince(start);
    return response;
}

auto Bridge::config() const -> const BridgeConfig&
{
    return _config;
}

} // namespace mcpbridge
