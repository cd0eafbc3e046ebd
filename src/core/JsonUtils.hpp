// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace mcpbridge::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON object or an Error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Serializes JSON for the wire; invalid UTF-8 in strings is replaced instead of throwing.
[[nodiscard]] inline auto serialize(const nlohmann::json& value) -> std::string
{
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or an Error.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it == obj.end() || !it->is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return it->get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The integer value or the default.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end() && it->is_number_integer())
        return it->get<int>();
    return defaultValue;
}

/// @brief Extracts an optional floating point field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The value or the default.
[[nodiscard]] inline auto getDoubleOr(const nlohmann::json& obj, std::string_view key, double defaultValue)
    -> double
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end() && it->is_number())
        return it->get<double>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The boolean value or the default.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end() && it->is_boolean())
        return it->get<bool>();
    return defaultValue;
}

/// @brief Extracts an optional object field; anything else yields an empty object.
[[nodiscard]] inline auto getObjectOr(const nlohmann::json& obj, std::string_view key) -> nlohmann::json
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end() && it->is_object())
        return *it;
    return nlohmann::json::object();
}

/// @brief Extracts an optional array field; anything else yields an empty array.
[[nodiscard]] inline auto getArrayOr(const nlohmann::json& obj, std::string_view key) -> nlohmann::json
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end() && it->is_array())
        return *it;
    return nlohmann::json::array();
}

/// @brief Extracts a field of any type, or null if absent.
[[nodiscard]] inline auto getValueOr(const nlohmann::json& obj, std::string_view key) -> nlohmann::json
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end())
        return *it;
    return nullptr;
}

/// @brief Extracts the string elements of an array field; non-string elements are skipped.
[[nodiscard]] inline auto getStringList(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it == obj.end() || !it->is_array())
        return result;

    for (const auto& item: *it)
    {
        if (item.is_string())
            result.push_back(item.get<std::string>());
    }
    return result;
}

/// @brief Extracts the string members of an object field; non-string members are skipped.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto result = std::map<std::string, std::string> {};
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it == obj.end() || !it->is_object())
        return result;

    for (const auto& [name, value]: it->items())
    {
        if (value.is_string())
            result[name] = value.get<std::string>();
    }
    return result;
}

} // namespace mcpbridge::json
