// SPDX-License-Identifier: Apache-2.0
#include "LlmClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace mcpbridge
{

namespace
{
    constexpr auto OpenAiUrl = "https://api.openai.com/v1/chat/completions";
    constexpr auto AnthropicUrl = "https://api.anthropic.com/v1/messages";
    constexpr auto AnthropicVersion = "2023-06-01";

    auto defaultModel(LlmProvider provider) -> std::string
    {
        return provider == LlmProvider::Anthropic ? "claude-3-sonnet-20240229" : "gpt-4";
    }

    /// Accepts a server root, a ".../v1" prefix or a full completions URL.
    auto chatCompletionsUrl(std::string_view baseUrl) -> std::string
    {
        while (baseUrl.ends_with('/'))
            baseUrl.remove_suffix(1);

        if (baseUrl.ends_with("/chat/completions"))
            return std::string(baseUrl);
        if (baseUrl.ends_with("/v1"))
            return std::format("{}/chat/completions", baseUrl);
        return std::format("{}/v1/chat/completions", baseUrl);
    }
} // namespace

auto llmProviderFromString(std::string_view name) -> std::optional<LlmProvider>
{
    if (name == "openai")
        return LlmProvider::OpenAi;
    if (name == "anthropic")
        return LlmProvider::Anthropic;
    if (name == "local")
        return LlmProvider::Local;
    return std::nullopt;
}

auto llmProviderName(LlmProvider provider) -> std::string_view
{
    switch (provider)
    {
        case LlmProvider::OpenAi: return "openai";
        case LlmProvider::Anthropic: return "anthropic";
        case LlmProvider::Local: return "local";
    }
    return "openai";
}

auto makeCompletionRequest(const LlmSettings& settings, std::string_view prompt) -> Result<CompletionRequest>
{
    auto const model = settings.model.empty() ? defaultModel(settings.provider) : settings.model;
    auto messages = nlohmann::json::array({ nlohmann::json { { "role", "user" }, { "content", prompt } } });

    auto request = CompletionRequest {};
    request.headers["Content-Type"] = "application/json";
    request.body = nlohmann::json {
        { "model", model },
        { "messages", std::move(messages) },
        { "max_tokens", settings.maxTokens },
        { "temperature", settings.temperature },
    };

    switch (settings.provider)
    {
        case LlmProvider::OpenAi:
            if (settings.apiKey.empty())
                return makeError(ErrorCode::LlmProviderError, "OpenAI API key not configured");
            request.url = settings.baseUrl.empty() ? std::string(OpenAiUrl) : chatCompletionsUrl(settings.baseUrl);
            request.headers["Authorization"] = std::format("Bearer {}", settings.apiKey);
            break;

        case LlmProvider::Anthropic:
            if (settings.apiKey.empty())
                return makeError(ErrorCode::LlmProviderError, "Anthropic API key not configured");
            request.url = settings.baseUrl.empty() ? std::string(AnthropicUrl) : settings.baseUrl;
            request.headers["x-api-key"] = settings.apiKey;
            request.headers["anthropic-version"] = AnthropicVersion;
            break;

        case LlmProvider::Local:
            if (settings.baseUrl.empty())
                return makeError(ErrorCode::LlmProviderError, "Local LLM base URL not configured");
            request.url = chatCompletionsUrl(settings.baseUrl);
            if (!settings.apiKey.empty())
                request.headers["Authorization"] = std::format("Bearer {}", settings.apiKey);
            break;
    }

    return request;
}

auto parseCompletionResponse(LlmProvider provider, std::string_view body) -> Result<std::string>
{
    auto parsed = json::parse(body);
    if (!parsed)
        return makeError(ErrorCode::LlmProviderError,
                         std::format("Unparseable {} response: {}", llmProviderName(provider), parsed.error().message));

    auto const& data = *parsed;
    if (!data.is_object())
        return makeError(ErrorCode::LlmProviderError,
                         std::format("{} response is a {} instead of an object",
                                     llmProviderName(provider),
                                     data.type_name()));

    if (provider == LlmProvider::Anthropic)
    {
        auto const content = json::getArrayOr(data, "content");
        if (content.empty() || !content.front().is_object())
            return makeError(ErrorCode::LlmProviderError, "Anthropic response has no content");
        return json::getStringOr(content.front(), "text", "");
    }

    auto const choices = json::getArrayOr(data, "choices");
    if (choices.empty() || !choices.front().is_object())
        return makeError(ErrorCode::LlmProviderError,
                         std::format("{} response has no choices", llmProviderName(provider)));

    return json::getStringOr(json::getObjectOr(choices.front(), "message"), "content", "");
}

HttpLlmClient::HttpLlmClient(LlmSettings settings):
    _settings(std::move(settings)), _http(std::make_unique<HttpClient>())
{
    _http->setTimeout(_settings.timeout);
}

auto HttpLlmClient::complete(std::string_view prompt) -> Result<std::string>
{
    auto request = makeCompletionRequest(_settings, prompt);
    if (!request)
        return std::unexpected(request.error());

    log::debug("Calling {} ({} prompt bytes)", llmProviderName(_settings.provider), prompt.size());

    auto response = _http->post(request->url, json::serialize(request->body), request->headers);
    if (!response)
        return makeError(ErrorCode::LlmProviderError, response.error().message);

    if (!response->isSuccess())
        return makeError(
            ErrorCode::LlmProviderError,
            std::format("{} API error: HTTP {}", llmProviderName(_settings.provider), response->status));

    return parseCompletionResponse(_settings.provider, response->body);
}

} // namespace mcpbridge
