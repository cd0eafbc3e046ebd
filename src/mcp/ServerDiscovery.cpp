// SPDX-License-Identifier: Apache-2.0
#include "ServerDiscovery.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <format>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace mcpbridge
{

namespace
{
    auto summarizeToolNames(const std::vector<ToolDefinition>& tools) -> std::string
    {
        auto summary = std::string {};
        auto const shown = std::min<size_t>(tools.size(), 3);
        for (size_t i = 0; i < shown; ++i)
        {
            if (i > 0)
                summary += ", ";
            summary += tools[i].name;
        }
        if (tools.size() > 3)
            summary += std::format(" and {} more", tools.size() - 3);
        return summary;
    }
} // namespace

auto ServerCatalog::find(std::string_view serverId) const -> const ServerCatalogEntry*
{
    auto const it =
        std::ranges::find_if(entries, [&](const ServerCatalogEntry& entry) { return entry.serverId == serverId; });
    return it != entries.end() ? &*it : nullptr;
}

auto ServerCatalog::findTool(std::string_view serverId, std::string_view toolName) const -> const ToolDefinition*
{
    auto const* entry = find(serverId);
    if (!entry || entry->status != ServerStatus::Connected)
        return nullptr;

    auto const it =
        std::ranges::find_if(entry->tools, [&](const ToolDefinition& tool) { return tool.name == toolName; });
    return it != entry->tools.end() ? &*it : nullptr;
}

auto serverDisplayName(std::string_view serverId) -> std::string
{
    static auto const knownNames = std::map<std::string, std::string, std::less<>> {
        { "filesystem", "File System" },
        { "git", "Git Repository" },
        { "web-search", "Web Search" },
        { "brave-search", "Brave Search" },
        { "memory", "Memory & Knowledge" },
        { "sequential-thinking", "Sequential Thinking" },
    };

    if (auto const it = knownNames.find(serverId); it != knownNames.end())
        return it->second;

    auto name = std::string {};
    auto startOfWord = true;
    for (auto const c: serverId)
    {
        if (c == '-')
        {
            name += ' ';
            startOfWord = true;
            continue;
        }
        name += startOfWord ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
        startOfWord = false;
    }
    return name;
}

auto describeServer(std::string_view serverId, const std::vector<ToolDefinition>& tools) -> std::string
{
    if (tools.empty())
        return "MCP server with no available tools";

    if (serverId == "filesystem")
        return std::format("File system operations including {}", summarizeToolNames(tools));
    if (serverId == "git")
        return std::format("Git repository operations including {}", summarizeToolNames(tools));

    return std::format("MCP server providing {} tools: {}", tools.size(), summarizeToolNames(tools));
}

auto toolExamples(std::string_view toolName, std::string_view description) -> std::vector<std::string>
{
    static auto const knownExamples = std::map<std::string, std::vector<std::string>, std::less<>> {
        { "list_directory", { "list files", "show directory contents", "ls" } },
        { "read_file", { "read package.json", "show file contents", "cat readme.md" } },
        { "write_file", { "write hello.txt with \"Hello World\"", "create new file", "save content to file" } },
        { "search_files", { "find .ts files", "search for \"TODO\"", "locate specific files" } },
        { "create_directory", { "create folder", "make directory", "mkdir new-folder" } },
        { "move_file", { "move file to folder", "rename file", "relocate document" } },
        { "get_file_info", { "file info", "file details", "check file size" } },
        { "directory_tree", { "show file tree", "directory structure", "folder hierarchy" } },
        { "git_status", { "git status", "check git state", "show changes" } },
        { "git_log", { "git history", "commit log", "recent commits" } },
        { "git_diff", { "show differences", "git diff", "compare changes" } },
        { "web_search", { "search the web", "find information online", "google search" } },
        { "search", { "search for information", "find content", "lookup" } },
    };

    if (auto const it = knownExamples.find(toolName); it != knownExamples.end())
        return it->second;

    // Lowercased description, alphanumerics and whitespace only, trimmed, at most 20 characters.
    auto phrase = std::string {};
    for (auto const c: description)
    {
        auto const uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || std::isspace(uc))
            phrase += static_cast<char>(std::tolower(uc));
    }
    auto const first = phrase.find_first_not_of(" \t\r\n");
    auto const last = phrase.find_last_not_of(" \t\r\n");
    phrase = first == std::string::npos ? std::string {} : phrase.substr(first, last - first + 1);
    phrase = phrase.substr(0, 20);

    auto examples = std::vector<std::string> {
        std::format("use {}", toolName),
        std::format("{} operation", toolName),
    };
    if (!phrase.empty())
        examples.push_back(std::move(phrase));
    return examples;
}

struct ServerDiscovery::Impl
{
    Impl(ConnectionManager& manager, std::chrono::milliseconds interval, Clock clock):
        manager(manager), interval(interval), clock(std::move(clock))
    {
    }

    ConnectionManager& manager;
    std::chrono::milliseconds interval;
    Clock clock;

    mutable std::mutex catalogMutex;
    CatalogSnapshot current = std::make_shared<const ServerCatalog>();

    std::mutex refreshMutex; // one pass at a time
    std::mutex threadMutex;
    std::condition_variable_any wakeup;
    std::jthread refresher;

    auto discoverServer(const std::string& serverId) const -> ServerCatalogEntry;
    [[nodiscard]] auto isStale(const ServerCatalog& catalog) const -> bool;
};

auto ServerDiscovery::Impl::discoverServer(const std::string& serverId) const -> ServerCatalogEntry
{
    auto entry = ServerCatalogEntry {
        .serverId = serverId,
        .displayName = serverDisplayName(serverId),
        .description = {},
        .tools = {},
        .resources = {},
        .status = ServerStatus::Connected,
        .lastUpdated = clock(),
    };

    auto tools = manager.listTools(serverId);
    if (!tools)
    {
        log::error("Failed to discover server '{}': {}", serverId, tools.error().message);
        entry.displayName = serverId;
        entry.description = "Server discovery failed";
        entry.status = ServerStatus::Error;
        return entry;
    }

    for (auto& tool: *tools)
    {
        if (tool.description.empty())
            tool.description = "No description available";
        tool.examples = toolExamples(tool.name, tool.description);
    }

    if (auto resources = manager.listResources(serverId); resources)
        entry.resources = std::move(*resources);
    else
        log::debug("Could not get resources of '{}': {}", serverId, resources.error().message);

    if (auto const config = manager.serverConfig(serverId); config && !config->displayName.empty())
        entry.displayName = config->displayName;

    entry.description = describeServer(serverId, *tools);
    entry.tools = std::move(*tools);
    log::info("Discovered server '{}' with {} tool(s)", serverId, entry.tools.size());
    return entry;
}

auto ServerDiscovery::Impl::isStale(const ServerCatalog& catalog) const -> bool
{
    if (catalog.builtAt == Timestamp {})
        return true;

    auto const connected = manager.connectedServers();
    auto catalogued = std::set<std::string> {};
    for (const auto& entry: catalog.entries)
        catalogued.insert(entry.serverId);

    if (catalogued != std::set<std::string>(connected.begin(), connected.end()))
        return true;

    auto const threshold = clock() - interval;
    return std::ranges::any_of(catalog.entries,
                               [&](const ServerCatalogEntry& entry) { return entry.lastUpdated < threshold; });
}

ServerDiscovery::ServerDiscovery(ConnectionManager& manager, std::chrono::milliseconds interval, Clock clock):
    _impl(std::make_unique<Impl>(
        manager, interval, clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })))
{
}

ServerDiscovery::~ServerDiscovery()
{
    stop();
}

auto ServerDiscovery::refresh() -> CatalogSnapshot
{
    auto passLock = std::lock_guard(_impl->refreshMutex);

    auto const serverIds = _impl->manager.connectedServers();
    log::debug("Discovering {} connected server(s)", serverIds.size());

    auto passes = std::vector<std::future<ServerCatalogEntry>> {};
    passes.reserve(serverIds.size());
    for (const auto& id: serverIds)
        passes.push_back(std::async(std::launch::async, [this, &id] { return _impl->discoverServer(id); }));

    auto catalog = std::make_shared<ServerCatalog>();
    for (auto& pass: passes)
        catalog->entries.push_back(pass.get());
    catalog->builtAt = _impl->clock();

    auto snapshot = CatalogSnapshot(std::move(catalog));
    {
        auto lock = std::lock_guard(_impl->catalogMutex);
        _impl->current = snapshot;
    }

    log::info("Discovery complete: {} server(s) cataloged", snapshot->entries.size());
    return snapshot;
}

auto ServerDiscovery::catalog() const -> CatalogSnapshot
{
    auto lock = std::lock_guard(_impl->catalogMutex);
    return _impl->current;
}

auto ServerDiscovery::currentCatalog() -> CatalogSnapshot
{
    if (shouldRediscover())
        return refresh();
    return catalog();
}

auto ServerDiscovery::shouldRediscover() const -> bool
{
    return _impl->isStale(*catalog());
}

void ServerDiscovery::start()
{
    auto lock = std::lock_guard(_impl->threadMutex);
    if (_impl->refresher.joinable())
        return;

    _impl->refresher = std::jthread([this](std::stop_token stopToken) {
        while (!stopToken.stop_requested())
        {
            refresh();

            auto waitLock = std::unique_lock(_impl->threadMutex);
            _impl->wakeup.wait_for(waitLock, stopToken, _impl->interval, [] { return false; });
        }
    });
}

void ServerDiscovery::stop()
{
    auto lock = std::unique_lock(_impl->threadMutex);
    if (!_impl->refresher.joinable())
        return;

    _impl->refresher.request_stop();
    auto refresher = std::move(_impl->refresher);
    lock.unlock();
    refresher.join();
}

} // namespace mcpbridge
