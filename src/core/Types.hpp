// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "JsonUtils.hpp"

namespace mcpbridge
{

/// @brief Wall-clock time point used for health and catalog timestamps.
using Timestamp = std::chrono::system_clock::time_point;

/// @brief Defines a tool exposed by a tool server.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();
    std::vector<std::string> examples;
    std::string serverId;
};

/// @brief Describes a readable resource exposed by a tool server.
struct ResourceDefinition
{
    std::string uri;
    std::string name;
    std::string description;
    std::string mimeType;
};

/// @brief The result of a tools/call round trip.
///
/// Content items are kept as received (text, image or resource items).
struct ToolResult
{
    nlohmann::json content = nlohmann::json::array();
    bool isError = false;

    /// @brief Joins the text of all "text" content items with newlines.
    [[nodiscard]] auto text() const -> std::string
    {
        auto joined = std::string {};
        for (const auto& item: content)
        {
            if (json::getStringOr(item, "type", "") != "text")
                continue;
            if (!joined.empty())
                joined += '\n';
            joined += json::getStringOr(item, "text", "");
        }
        return joined;
    }
};

/// @brief Contents returned by resources/read.
struct ResourceContents
{
    std::string uri;
    nlohmann::json contents = nlohmann::json::array();
};

/// @brief Parses a tools/list entry.
/// @param toolJson One element of the "tools" array.
/// @param serverId The owning server.
/// @return The tool; the name is empty if the entry is not a usable tool object.
[[nodiscard]] inline auto toolFromJson(const nlohmann::json& toolJson, std::string_view serverId)
    -> ToolDefinition
{
    auto tool = ToolDefinition {
        .name = json::getStringOr(toolJson, "name", ""),
        .description = json::getStringOr(toolJson, "description", ""),
        .inputSchema = json::getObjectOr(toolJson, "inputSchema"),
        .examples = {},
        .serverId = std::string(serverId),
    };
    return tool;
}

/// @brief Parses a resources/list entry.
[[nodiscard]] inline auto resourceFromJson(const nlohmann::json& resourceJson) -> ResourceDefinition
{
    return ResourceDefinition {
        .uri = json::getStringOr(resourceJson, "uri", ""),
        .name = json::getStringOr(resourceJson, "name", ""),
        .description = json::getStringOr(resourceJson, "description", ""),
        .mimeType = json::getStringOr(resourceJson, "mimeType", ""),
    };
}

/// @brief Serializes a resource definition for display or catalog output.
[[nodiscard]] inline auto resourceToJson(const ResourceDefinition& resource) -> nlohmann::json
{
    auto obj = nlohmann::json { { "uri", resource.uri } };
    if (!resource.name.empty())
        obj["name"] = resource.name;
    if (!resource.description.empty())
        obj["description"] = resource.description;
    if (!resource.mimeType.empty())
        obj["mimeType"] = resource.mimeType;
    return obj;
}

} // namespace mcpbridge
