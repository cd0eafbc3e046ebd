// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <net/HttpClient.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcpbridge
{

enum class LlmProvider : std::uint8_t
{
    OpenAi,
    Anthropic,
    Local, ///< OpenAI-compatible endpoint at a configured base URL.
};

[[nodiscard]] auto llmProviderFromString(std::string_view name) -> std::optional<LlmProvider>;
[[nodiscard]] auto llmProviderName(LlmProvider provider) -> std::string_view;

/// @brief How to reach the chat-completion endpoint.
struct LlmSettings
{
    LlmProvider provider = LlmProvider::OpenAi;
    std::string apiKey;
    std::string model;   ///< Empty selects the provider's default.
    std::string baseUrl; ///< Required for Local, optional override otherwise.
    int maxTokens = 1000;
    double temperature = 0.1;
    std::chrono::milliseconds timeout { 30000 };
};

/// @brief Produces a single text completion for a prompt.
class LlmClient
{
  public:
    virtual ~LlmClient() = default;

    /// @return The completion text or an LlmProviderError.
    [[nodiscard]] virtual auto complete(std::string_view prompt) -> Result<std::string> = 0;
};

/// @brief A fully prepared chat-completion HTTP request.
struct CompletionRequest
{
    std::string url;
    HttpHeaders headers;
    nlohmann::json body;
};

/// @brief Builds the provider-specific request for a single user message.
/// @return The request, or an LlmProviderError if a required API key or base URL is missing.
[[nodiscard]] auto makeCompletionRequest(const LlmSettings& settings, std::string_view prompt)
    -> Result<CompletionRequest>;

/// @brief Extracts the completion text from a provider's response body.
[[nodiscard]] auto parseCompletionResponse(LlmProvider provider, std::string_view body) -> Result<std::string>;

/// @brief LlmClient that talks to a hosted or local chat-completion API over HTTP.
class HttpLlmClient: public LlmClient
{
  public:
    explicit HttpLlmClient(LlmSettings settings);

    [[nodiscard]] auto complete(std::string_view prompt) -> Result<std::string> override;

    [[nodiscard]] auto settings() const -> const LlmSettings& { return _settings; }

  private:
    LlmSettings _settings;
    std::unique_ptr<HttpClient> _http;
};

} // namespace mcpbridge
