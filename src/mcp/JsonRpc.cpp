// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcpbridge::jsonrpc
{

auto Response::numericId() const -> std::optional<int64_t>
{
    if (id.is_number_integer())
        return id.get<int64_t>();
    return std::nullopt;
}

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", nlohmann::json { { "code", code }, { "message", message } } },
    };
}

auto isResponse(const nlohmann::json& message) -> bool
{
    return message.is_object() && message.contains("id") && !message.contains("method")
           && (message.contains("result") || message.contains("error"));
}

auto isNotification(const nlohmann::json& message) -> bool
{
    return message.is_object() && message.contains("method");
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (!err.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error member is not an object");

        response.error = RpcError {
            .code = json::getIntOr(err, "code", InternalError),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = json::getValueOr(err, "data"),
        };
    }
    else if (!message.contains("method"))
    {
        // It's neither a valid response nor a notification
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto toResult(Response response) -> Result<nlohmann::json>
{
    if (response.error)
        return makeError(ErrorCode::ProtocolError,
                         std::format("RPC error {}: {}", response.error->code, response.error->message));
    return std::move(response.result).value_or(nlohmann::json::object());
}

} // namespace mcpbridge::jsonrpc
