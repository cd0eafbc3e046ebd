// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <mcp/HealthMonitor.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/ServerDiscovery.hpp>
#include <router/LlmClient.hpp>
#include <router/RoutingPlan.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

/// @brief Query routing configuration section.
struct RoutingConfig
{
    bool enableIntelligentRouting = true;
    LlmProvider provider = LlmProvider::OpenAi;
    std::string model; ///< Empty selects the provider default (gpt-4 for OpenAI).
    std::string baseUrl;
    int maxTokens = 1000;
    double temperature = 0.1;
    double confidenceThreshold = LowConfidence;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    log::Level logLevel = log::Level::Info;
    std::chrono::milliseconds defaultTimeout { 30000 };

    /// Ordered by server id.
    std::vector<ServerConfig> servers;

    BackoffPolicy retry;
    std::chrono::milliseconds discoveryInterval = ServerDiscovery::DefaultInterval;
    RoutingConfig llm;

    /// API keys by provider name ("openai", "anthropic", "local").
    std::map<std::string, std::string> apiKeys;
};

/// @brief Replaces every ${VAR} with the value of the environment variable VAR.
///
/// Unset variables expand to the empty string. A "${" without a closing
/// brace is kept literally.
[[nodiscard]] auto expandEnvironmentVariables(std::string_view text) -> std::string;

/// @brief Parses configuration JSON text, expanding ${VAR} references in all strings.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/mcpbridge or ~/.config/mcpbridge
/// On macOS: ~/Library/Application Support/mcpbridge
/// On Windows: %APPDATA%\mcpbridge
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Builds the LLM client settings for the configured provider.
///
/// The key comes from "apiKeys", falling back to OPENAI_API_KEY or
/// ANTHROPIC_API_KEY in the environment.
[[nodiscard]] auto makeLlmSettings(const AppConfig& config) -> LlmSettings;

} // namespace mcpbridge
