// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ConnectionManager.hpp>
#include <mcp/ServerDiscovery.hpp>
#include <mcpbridge/Bridge.hpp>
#include <router/LlmClient.hpp>
#include <router/QueryRouter.hpp>

#include <format>
#include <print>
#include <string>

namespace mcpbridge
{

namespace
{
    auto makeLlmClient(const AppConfig& config) -> std::shared_ptr<LlmClient>
    {
        if (!config.llm.enableIntelligentRouting)
        {
            log::info("Intelligent routing disabled, using keyword heuristics");
            return nullptr;
        }

        auto settings = makeLlmSettings(config);
        if (settings.provider != LlmProvider::Local && settings.apiKey.empty())
        {
            log::info("No {} API key configured, using keyword heuristics", llmProviderName(settings.provider));
            return nullptr;
        }

        return std::make_shared<HttpLlmClient>(std::move(settings));
    }

    void printResponse(const QueryResponse& response)
    {
        std::println("{}", response.content);

        if (log::getLevel() < log::Level::Debug)
            return;

        auto tools = std::string {};
        for (const auto& tool: response.metadata.toolsCalled)
            tools += tools.empty() ? tool : ", " + tool;
        std::println("\n[server: {}, tools: {}, {} ms]",
                     response.metadata.serverUsed.empty() ? "none" : response.metadata.serverUsed,
                     tools.empty() ? "none" : tools,
                     response.metadata.processingTime.count());
    }
} // namespace

struct App::Impl
{
    explicit Impl(AppConfig appConfig):
        config(std::move(appConfig)),
        manager(EngineContext { .backoff = config.retry }),
        discovery(manager, config.discoveryInterval),
        router([this] { return discovery.currentCatalog(); }, makeLlmClient(config)),
        bridge(manager, discovery, router, BridgeConfig { .confidenceThreshold = config.llm.confidenceThreshold })
    {
    }

    AppConfig config;
    ConnectionManager manager;
    ServerDiscovery discovery;
    QueryRouter router;
    Bridge bridge;
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App()
{
    _impl->discovery.stop();
    _impl->manager.shutdown();
}

auto App::initialize() -> VoidResult
{
    auto const& servers = _impl->config.servers;
    if (servers.empty())
        log::warning("No servers configured; add some to {}", defaultConfigPath());

    auto const connected = _impl->manager.initialize(servers);
    log::info("{} of {} server(s) connected", connected, servers.size());

    _impl->discovery.refresh();
    return {};
}

auto App::showServers() -> int
{
    auto const health = _impl->manager.healthCheck();
    if (health.empty())
    {
        std::println("No servers configured.");
        return 0;
    }

    std::println("{:<24} {:<10} {:<12} {:>7}  {}", "SERVER", "TRANSPORT", "STATUS", "RETRIES", "LAST ERROR");
    for (const auto& entry: health)
    {
        auto const config = _impl->manager.serverConfig(entry.serverId);
        auto const transport = config ? transportKindName(config->kind) : std::string_view("?");
        std::println("{:<24} {:<10} {:<12} {:>7}  {}",
                     entry.serverId,
                     transport,
                     entry.connected ? "connected" : "down",
                     entry.retryCount,
                     entry.lastError.value_or(""));
    }
    return 0;
}

auto App::showTools() -> int
{
    auto const catalog = _impl->discovery.currentCatalog();
    if (catalog->empty())
    {
        std::println("No connected servers.");
        return 0;
    }

    for (const auto& entry: catalog->entries)
    {
        std::println("{} ({}) [{}]", entry.displayName, entry.serverId, serverStatusName(entry.status));
        std::println("  {}", entry.description);
        for (const auto& tool: entry.tools)
            std::println("  - {}: {}", tool.name, tool.description);
        for (const auto& resource: entry.resources)
            std::println("  * {} {}", resource.uri, resource.name);
        std::println("");
    }
    return 0;
}

auto App::route(std::string_view query) -> int
{
    auto const plan = _impl->router.analyzeQuery(query);
    std::println("{}", planToJson(plan).dump(2));
    return plan.isActionable(_impl->config.llm.confidenceThreshold) ? 0 : 2;
}

auto App::ask(std::string_view query) -> int
{
    auto const response = _impl->bridge.processQuery(query);
    printResponse(response);
    return response.success ? 0 : 1;
}

auto App::call(std::string_view serverId, std::string_view toolName, std::string_view argumentsJson) -> int
{
    auto arguments = json::parse(argumentsJson.empty() ? std::string_view("{}") : argumentsJson);
    if (!arguments || !arguments->is_object())
    {
        log::error("Tool arguments must be a JSON object");
        return 1;
    }

    auto result = _impl->manager.callTool(serverId, toolName, *arguments);
    if (!result)
    {
        log::error("{}", result.error());
        return 1;
    }

    std::println("{}", formatToolResult(*result));
    return result->isError ? 1 : 0;
}

auto App::read(std::string_view serverId, std::string_view uri) -> int
{
    auto contents = _impl->manager.readResource(serverId, uri);
    if (!contents)
    {
        log::error("{}", contents.error());
        return 1;
    }

    for (const auto& item: contents->contents)
    {
        if (item.contains("text"))
            std::println("{}", json::getStringOr(item, "text", ""));
        else
            std::println("[blob: {}]", json::getStringOr(item, "mimeType", "application/octet-stream"));
    }
    return 0;
}

auto App::search(std::string_view query) -> int
{
    auto const response = _impl->bridge.search(query);
    printResponse(response);
    return 0;
}

} // namespace mcpbridge
