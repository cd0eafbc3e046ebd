// SPDX-License-Identifier: Apache-2.0
#include "QueryRouter.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ConnectionManager.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <initializer_list>
#include <optional>
#include <regex>

namespace mcpbridge
{

namespace
{
    struct ToolMatch
    {
        const ServerCatalogEntry* entry = nullptr;
        const ToolDefinition* tool = nullptr;
    };

    auto toLower(std::string_view text) -> std::string
    {
        auto lower = std::string(text);
        std::ranges::transform(
            lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    /// True if a word of @p text starts with @p keyword.
    auto mentions(std::string_view text, std::string_view keyword) -> bool
    {
        for (auto pos = text.find(keyword); pos != std::string_view::npos; pos = text.find(keyword, pos + 1))
        {
            if (pos == 0 || !std::isalnum(static_cast<unsigned char>(text[pos - 1])))
                return true;
        }
        return false;
    }

    auto mentionsAny(std::string_view text, std::initializer_list<std::string_view> keywords) -> bool
    {
        return std::ranges::any_of(keywords, [&](std::string_view keyword) { return mentions(text, keyword); });
    }

    auto isConnected(const ServerCatalogEntry& entry) -> bool
    {
        return entry.status == ServerStatus::Connected;
    }

    /// First connected server owning a tool that satisfies @p predicate.
    /// The server named @p preferredServer is tried first.
    template <typename Predicate>
    auto findTool(const ServerCatalog& catalog, std::string_view preferredServer, Predicate predicate)
        -> std::optional<ToolMatch>
    {
        auto const search = [&](const ServerCatalogEntry& entry) -> std::optional<ToolMatch> {
            if (!isConnected(entry))
                return std::nullopt;
            auto const it = std::ranges::find_if(entry.tools, predicate);
            if (it == entry.tools.end())
                return std::nullopt;
            return ToolMatch { .entry = &entry, .tool = &*it };
        };

        if (auto const* preferred = catalog.find(preferredServer))
        {
            if (auto match = search(*preferred))
                return match;
        }

        for (const auto& entry: catalog.entries)
        {
            if (auto match = search(entry))
                return match;
        }
        return std::nullopt;
    }

    auto findToolNamed(const ServerCatalog& catalog,
                       std::string_view preferredServer,
                       std::initializer_list<std::string_view> names) -> std::optional<ToolMatch>
    {
        for (auto const name: names)
        {
            if (auto match =
                    findTool(catalog, preferredServer, [&](const ToolDefinition& tool) { return tool.name == name; }))
                return match;
        }
        return std::nullopt;
    }

    auto hasProperty(const ToolDefinition& tool, std::string_view name) -> bool
    {
        auto const it = tool.inputSchema.find("properties");
        return it != tool.inputSchema.end() && it->is_object() && it->contains(name);
    }

    auto heuristicPlan(const ToolMatch& match,
                       std::string intent,
                       nlohmann::json parameters,
                       double confidence,
                       std::string_view rule) -> RoutingPlan
    {
        return RoutingPlan {
            .intent = std::move(intent),
            .selectedServer = match.entry->serverId,
            .selectedTool = match.tool->name,
            .parameters = std::move(parameters),
            .reasoning = std::format("Fallback heuristic analysis: {} keywords", rule),
            .confidence = confidence,
            .fallbackOptions = {},
            .fromHeuristics = true,
        };
    }

    /// The token following one of the verbs, as typed by the user.
    auto wordAfter(std::string_view query, const std::regex& pattern) -> std::optional<std::string>
    {
        auto match = std::cmatch {};
        if (!std::regex_search(query.data(), query.data() + query.size(), match, pattern))
            return std::nullopt;
        return match[1].str();
    }

    auto looksLikePath(std::string_view word) -> bool
    {
        return word.find_first_of("/.~") != std::string_view::npos;
    }

    auto filesystemRule(std::string_view query, std::string_view lower, const ServerCatalog& catalog)
        -> std::optional<RoutingPlan>
    {
        if (!mentionsAny(lower, { "file", "director", "folder", "read", "write", "list", "ls", "open" }))
            return std::nullopt;

        static auto const readTarget = std::regex(R"((?:read|open)\s+(\S+))", std::regex::icase);
        static auto const listTarget = std::regex(R"((?:in|of|under|at)\s+(\S+))", std::regex::icase);

        auto const wantsRead = mentionsAny(lower, { "read", "open" });
        auto const match = findToolNamed(catalog, "filesystem", { wantsRead ? "read_file" : "list_directory" });
        if (!match)
            return std::nullopt;

        auto path = std::string(".");
        if (wantsRead)
        {
            if (auto target = wordAfter(query, readTarget))
                path = std::move(*target);
        }
        else if (auto target = wordAfter(query, listTarget); target && looksLikePath(*target))
        {
            path = std::move(*target);
        }

        return heuristicPlan(
            *match, "Filesystem operation", nlohmann::json { { "path", path } }, MediumConfidence, "filesystem");
    }

    auto versionControlRule(std::string_view lower, const ServerCatalog& catalog) -> std::optional<RoutingPlan>
    {
        if (!mentionsAny(lower, { "git", "commit", "branch", "diff", "repo" }))
            return std::nullopt;

        auto wanted = std::string_view("git_status");
        if (mentions(lower, "diff"))
            wanted = "git_diff";
        else if (mentionsAny(lower, { "log", "history", "commit" }))
            wanted = "git_log";
        else if (mentions(lower, "branch"))
            wanted = "git_branch";

        auto const match = findToolNamed(catalog, "git", { wanted, "git_status" });
        if (!match)
            return std::nullopt;

        auto parameters = nlohmann::json::object();
        if (hasProperty(*match->tool, "repo_path"))
            parameters["repo_path"] = ".";

        return heuristicPlan(*match, "Version control operation", std::move(parameters), 0.7, "version control");
    }

    auto webSearchRule(std::string_view query, std::string_view lower, const ServerCatalog& catalog)
        -> std::optional<RoutingPlan>
    {
        if (!mentionsAny(lower, { "search", "look up", "lookup", "google", "web", "online", "internet" }))
            return std::nullopt;

        auto match = findToolNamed(catalog, "web-search", { "web_search", "brave_web_search", "search" });
        if (!match)
        {
            match = findTool(catalog, "web-search", [](const ToolDefinition& tool) {
                return tool.name.find("search") != std::string::npos && tool.name != "search_files";
            });
        }
        if (!match)
            return std::nullopt;

        return heuristicPlan(
            *match, "Web search", makeSearchArguments(*match->tool, query), MediumConfidence, "web search");
    }

    auto databaseRule(std::string_view query, std::string_view lower, const ServerCatalog& catalog)
        -> std::optional<RoutingPlan>
    {
        if (!mentionsAny(lower, { "sql", "database", "table", "select", "query" }))
            return std::nullopt;

        auto const match = findTool(catalog, "database", [](const ToolDefinition& tool) {
            return tool.name.find("query") != std::string::npos || tool.name.find("sql") != std::string::npos;
        });
        if (!match)
            return std::nullopt;

        auto const field = hasProperty(*match->tool, "sql") ? "sql" : "query";
        return heuristicPlan(*match,
                             "Database query",
                             nlohmann::json { { field, std::string(query) } },
                             0.5,
                             "database");
    }

    auto readConfidence(const nlohmann::json& value) -> double
    {
        auto confidence = 0.0;
        if (value.is_number())
            confidence = value.get<double>();
        else if (value.is_string())
        {
            auto const text = value.get<std::string>();
            auto const [_, ec] = std::from_chars(text.data(), text.data() + text.size(), confidence);
            if (ec != std::errc {})
                confidence = 0.0;
        }

        if (std::isnan(confidence))
            return 0.0;
        return std::clamp(confidence, 0.0, 1.0);
    }

    auto planFromObject(const nlohmann::json& object) -> Result<RoutingPlan>
    {
        auto plan = RoutingPlan {
            .intent = json::getStringOr(object, "intent", "Unknown intent"),
            .selectedServer = json::getStringOr(object, "selectedServer", ""),
            .selectedTool = json::getStringOr(object, "selectedTool", ""),
            .parameters = json::getObjectOr(object, "parameters"),
            .reasoning = json::getStringOr(object, "reasoning", "No reasoning provided"),
            .confidence = readConfidence(json::getValueOr(object, "confidence")),
            .fallbackOptions = {},
            .fromHeuristics = false,
        };

        if (plan.selectedServer.empty() || plan.selectedTool.empty())
            return makeError(ErrorCode::RoutingValidationError,
                             "Routing answer is missing selectedServer or selectedTool");

        return plan;
    }
} // namespace

auto buildCapabilitiesContext(const ServerCatalog& catalog) -> std::string
{
    auto context = std::string {};
    for (const auto& entry: catalog.entries)
    {
        if (!isConnected(entry))
            continue;

        if (!context.empty())
            context += "\n\n";

        context += std::format("Server: {} ({})\nDescription: {}\nTools:",
                               entry.displayName,
                               entry.serverId,
                               entry.description);
        for (const auto& tool: entry.tools)
        {
            context += std::format("\n  - {}: {}", tool.name, tool.description);
            if (tool.examples.empty())
                continue;

            context += "\n    Examples: ";
            for (size_t i = 0; i < tool.examples.size(); ++i)
            {
                if (i > 0)
                    context += ", ";
                context += tool.examples[i];
            }
        }
    }

    if (context.empty())
        return "No servers are currently connected.";
    return context;
}

auto buildAnalysisPrompt(std::string_view query, std::string_view capabilities) -> std::string
{
    constexpr auto Instructions = std::string_view(
        "You are an intelligent query router for MCP (Model Context Protocol) servers. "
        "Your job is to analyze user queries and determine which MCP server and tool should handle the "
        "request.");

    constexpr auto ResponseFormat = std::string_view(R"(Analyze the query and respond with a JSON object in this exact format:
{
  "intent": "Brief description of what the user wants to do",
  "selectedServer": "server_id",
  "selectedTool": "tool_name",
  "parameters": {
    "param1": "value1",
    "param2": "value2"
  },
  "reasoning": "Explanation of why this server/tool was chosen",
  "confidence": 0.95
}

Guidelines:
1. Only select servers and tools that are listed in the available capabilities
2. Extract the parameters the selected tool needs from the user query
3. If the query is ambiguous, choose the most likely interpretation
4. Set confidence to 0 if no server or tool can handle the query
5. Prefer filesystem servers for file and directory operations
6. Prefer search-capable servers for information lookup

Respond with only valid JSON, no additional text.)");

    return std::format("{}\n\nAvailable MCP Capabilities:\n{}\n\nUser Query: \"{}\"\n\n{}",
                       Instructions,
                       capabilities,
                       query,
                       ResponseFormat);
}

auto stripCodeFences(std::string_view text) -> std::string
{
    constexpr auto Fence = std::string_view("```");

    auto const open = text.find(Fence);
    if (open == std::string_view::npos)
        return std::string(trim(text));

    auto bodyStart = open + Fence.size();
    while (bodyStart < text.size() && std::isalnum(static_cast<unsigned char>(text[bodyStart])))
        ++bodyStart; // language tag

    auto const close = text.find(Fence, bodyStart);
    auto const body = close == std::string_view::npos ? text.substr(bodyStart)
                                                      : text.substr(bodyStart, close - bodyStart);
    return std::string(trim(body));
}

auto parseRoutingPlan(std::string_view text) -> Result<RoutingPlan>
{
    auto const cleaned = stripCodeFences(text);
    auto parsed = json::parse(cleaned);
    if (!parsed)
        return makeError(ErrorCode::LlmProviderError,
                         std::format("Routing answer is not valid JSON: {}", parsed.error().message));
    if (!parsed->is_object())
        return makeError(ErrorCode::LlmProviderError, "Routing answer is not a JSON object");

    auto plan = planFromObject(*parsed);
    if (!plan)
        return plan;

    auto const options = parsed->value("fallbackOptions", nlohmann::json::array());
    if (options.is_array())
    {
        for (const auto& option: options)
        {
            if (!option.is_object())
                continue;
            if (auto fallback = planFromObject(option); fallback)
                plan->fallbackOptions.push_back(std::move(*fallback));
            else
                log::debug("Ignoring fallback option: {}", fallback.error().message);
        }
    }

    return plan;
}

auto validatePlan(const RoutingPlan& plan, const ServerCatalog& catalog) -> VoidResult
{
    auto const* entry = catalog.find(plan.selectedServer);
    if (!entry)
        return makeError(ErrorCode::RoutingValidationError,
                         std::format("Selected server '{}' is not available", plan.selectedServer));
    if (!isConnected(*entry))
        return makeError(ErrorCode::RoutingValidationError,
                         std::format("Selected server '{}' is not connected", plan.selectedServer));
    if (!catalog.findTool(plan.selectedServer, plan.selectedTool))
        return makeError(ErrorCode::RoutingValidationError,
                         std::format("Tool '{}' not found on server '{}'", plan.selectedTool, plan.selectedServer));
    return {};
}

auto fallbackPlan(std::string_view query, const ServerCatalog& catalog) -> RoutingPlan
{
    auto const lower = toLower(query);

    if (auto plan = filesystemRule(query, lower, catalog))
        return *plan;
    if (auto plan = versionControlRule(lower, catalog))
        return *plan;
    if (auto plan = webSearchRule(query, lower, catalog))
        return *plan;
    if (auto plan = databaseRule(query, lower, catalog))
        return *plan;

    if (auto const match = findTool(catalog, "", [](const ToolDefinition&) { return true; }))
    {
        return RoutingPlan {
            .intent = "Unknown intent",
            .selectedServer = match->entry->serverId,
            .selectedTool = match->tool->name,
            .parameters = nlohmann::json::object(),
            .reasoning = "No keyword rule matched; using the first available tool",
            .confidence = 0.2,
            .fallbackOptions = {},
            .fromHeuristics = true,
        };
    }

    return RoutingPlan {
        .intent = "Unknown",
        .selectedServer = {},
        .selectedTool = {},
        .parameters = nlohmann::json::object(),
        .reasoning = "No suitable server/tool found",
        .confidence = 0.0,
        .fallbackOptions = {},
        .fromHeuristics = true,
    };
}

QueryRouter::QueryRouter(CatalogProvider catalogProvider, std::shared_ptr<LlmClient> llm):
    _catalogProvider(std::move(catalogProvider)), _llm(std::move(llm))
{
}

auto QueryRouter::analyzeQuery(std::string_view query) const -> RoutingPlan
{
    auto const snapshot = _catalogProvider ? _catalogProvider() : CatalogSnapshot {};
    if (!snapshot)
        return analyzeQuery(query, ServerCatalog {});
    return analyzeQuery(query, *snapshot);
}

auto QueryRouter::analyzeQuery(std::string_view query, const ServerCatalog& catalog) const -> RoutingPlan
{
    auto const anyConnected = std::ranges::any_of(catalog.entries, isConnected);
    if (!_llm || !anyConnected)
    {
        auto plan = fallbackPlan(query, catalog);
        log::debug("Heuristic routing: {}/{} ({:.2f})", plan.selectedServer, plan.selectedTool, plan.confidence);
        return plan;
    }

    auto const prompt = buildAnalysisPrompt(query, buildCapabilitiesContext(catalog));
    auto plan = _llm->complete(prompt)
                    .and_then([](const std::string& answer) { return parseRoutingPlan(answer); })
                    .and_then([&](RoutingPlan candidate) -> Result<RoutingPlan> {
                        if (auto valid = validatePlan(candidate, catalog); !valid)
                            return std::unexpected(valid.error());
                        std::erase_if(candidate.fallbackOptions, [&](const RoutingPlan& option) {
                            return !validatePlan(option, catalog).has_value();
                        });
                        return candidate;
                    });

    if (!plan)
    {
        log::warning("LLM routing failed, using heuristics: {}", plan.error());
        return fallbackPlan(query, catalog);
    }

    log::info("Routed query to {}/{} (confidence {:.2f})", plan->selectedServer, plan->selectedTool, plan->confidence);
    return std::move(*plan);
}

} // namespace mcpbridge
