// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcpbridge::jsonrpc
{

/// @name Standard error codes
/// @{
constexpr auto ParseError = -32700;
constexpr auto InvalidRequest = -32600;
constexpr auto MethodNotFound = -32601;
constexpr auto InvalidParams = -32602;
constexpr auto InternalError = -32603;
/// @}

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }

    /// @brief Returns the id as an integer, if it is one.
    [[nodiscard]] auto numericId() const -> std::optional<int64_t>;
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds an error reply to a request the client cannot serve.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Returns true if the message is a reply (carries an id and a result or error).
[[nodiscard]] auto isResponse(const nlohmann::json& message) -> bool;

/// @brief Returns true if the message is a notification or server-initiated request.
[[nodiscard]] auto isNotification(const nlohmann::json& message) -> bool;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Converts a response into the result a caller waits for.
///
/// An error member becomes a ProtocolError naming the RPC code; a missing
/// result becomes an empty object.
[[nodiscard]] auto toResult(Response response) -> Result<nlohmann::json>;

} // namespace mcpbridge::jsonrpc
