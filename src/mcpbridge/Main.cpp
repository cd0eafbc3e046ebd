// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcpbridge/App.hpp>
#include <mcpbridge/Config.hpp>

#include <CLI/CLI.hpp>

#include <string>

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcpbridge - route natural-language queries to MCP tool servers" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;
    auto logLevel = std::string {};

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-level", logLevel, "Log level (error|warn|info|debug|trace)");

    auto query = std::string {};
    auto serverId = std::string {};
    auto toolName = std::string {};
    auto arguments = std::string { "{}" };
    auto uri = std::string {};

    auto* servers = app.add_subcommand("servers", "Probe every server and show its health");
    auto* tools = app.add_subcommand("tools", "List the tools and resources of connected servers");

    auto* route = app.add_subcommand("route", "Show the routing plan for a query without executing it");
    route->add_option("query", query, "Natural-language query")->required();

    auto* ask = app.add_subcommand("ask", "Route a query and execute the selected tool");
    ask->add_option("query", query, "Natural-language query")->required();

    auto* call = app.add_subcommand("call", "Call a tool directly");
    call->add_option("server", serverId, "Server id")->required();
    call->add_option("tool", toolName, "Tool name")->required();
    call->add_option("--args", arguments, "Tool arguments as a JSON object");

    auto* read = app.add_subcommand("read", "Read a resource");
    read->add_option("server", serverId, "Server id")->required();
    read->add_option("uri", uri, "Resource URI")->required();

    auto* search = app.add_subcommand("search", "Search across every search-capable server");
    search->add_option("query", query, "Search terms")->required();

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? mcpbridge::loadConfig() : mcpbridge::loadConfigFromFile(configPath);
    if (!configResult)
    {
        mcpbridge::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    mcpbridge::log::setLevel(config.logLevel);
    if (!logLevel.empty())
    {
        auto const level = mcpbridge::log::levelFromString(logLevel);
        if (!level)
        {
            mcpbridge::log::error("Unknown log level: {}", logLevel);
            return 1;
        }
        mcpbridge::log::setLevel(*level);
    }
    if (verbose)
        mcpbridge::log::setLevel(mcpbridge::log::Level::Debug);

    auto application = mcpbridge::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        mcpbridge::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    if (servers->parsed())
        return application.showServers();
    if (tools->parsed())
        return application.showTools();
    if (route->parsed())
        return application.route(query);
    if (ask->parsed())
        return application.ask(query);
    if (call->parsed())
        return application.call(serverId, toolName, arguments);
    if (read->parsed())
        return application.read(serverId, uri);
    if (search->parsed())
        return application.search(query);

    return 1;
}
