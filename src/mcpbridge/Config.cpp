// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcpbridge
{

namespace
{

    void expandStrings(nlohmann::json& value)
    {
        if (value.is_string())
            value = expandEnvironmentVariables(value.get<std::string>());
        else if (value.is_structured())
        {
            for (auto& child: value)
                expandStrings(child);
        }
    }

    auto millisecondsOr(const nlohmann::json& obj, std::string_view key, std::chrono::milliseconds defaultValue)
        -> std::chrono::milliseconds
    {
        auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
        if (it != obj.end() && it->is_number())
            return std::chrono::milliseconds(it->get<std::int64_t>());
        return defaultValue;
    }

    auto parseServer(const std::string& id, const nlohmann::json& serverJson, std::chrono::milliseconds defaultTimeout)
        -> Result<ServerConfig>
    {
        if (!serverJson.is_object())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}': entry must be an object", id));

        auto const typeName = json::getStringOr(serverJson, "type", "stdio");
        auto const kind = transportKindFromString(typeName);
        if (!kind)
            return makeError(ErrorCode::ConfigError,
                             std::format("Server '{}': unknown transport type '{}'", id, typeName));

        auto config = ServerConfig {
            .name = id,
            .displayName = json::getStringOr(serverJson, "name", ""),
            .kind = *kind,
            .command = json::getStringOr(serverJson, "command", ""),
            .args = json::getStringList(serverJson, "args"),
            .env = json::getStringMap(serverJson, "env"),
            .workingDirectory = json::getStringOr(serverJson, "workingDirectory", ""),
            .url = json::getStringOr(serverJson, "url", ""),
            .enabled = json::getBoolOr(serverJson, "enabled", true),
            .timeout = millisecondsOr(serverJson, "timeout", defaultTimeout),
            .maxRetryAttempts = json::getIntOr(serverJson, "retryAttempts", 3),
        };

        if (config.maxRetryAttempts < 1)
            return makeError(ErrorCode::ConfigError,
                             std::format("Server '{}': retryAttempts must be at least 1", id));

        return config;
    }

} // namespace

auto expandEnvironmentVariables(std::string_view text) -> std::string
{
    auto result = std::string {};
    auto pos = size_t { 0 };
    while (pos < text.size())
    {
        auto const open = text.find("${", pos);
        if (open == std::string_view::npos)
            break;

        auto const close = text.find('}', open + 2);
        if (close == std::string_view::npos)
            break;

        result += text.substr(pos, open - pos);
        auto const name = std::string(text.substr(open + 2, close - open - 2));
        if (auto const* value = std::getenv(name.c_str()))
            result += value;
        pos = close + 1;
    }
    result += text.substr(pos);
    return result;
}

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\mcpbridge";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/mcpbridge";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/mcpbridge";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcpbridge";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, parseResult.error().message);

    auto root = std::move(*parseResult);
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be an object");
    expandStrings(root);

    auto config = AppConfig {};

    auto const levelName = json::getStringOr(root, "logLevel", "info");
    auto const level = log::levelFromString(levelName);
    if (!level)
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", levelName));
    config.logLevel = *level;
    config.defaultTimeout = millisecondsOr(root, "defaultTimeout", config.defaultTimeout);

    // Servers section
    if (root.contains("servers") && root["servers"].is_object())
    {
        for (const auto& [id, serverJson]: root["servers"].items())
        {
            auto server = parseServer(id, serverJson, config.defaultTimeout);
            if (!server)
                return std::unexpected(server.error());
            config.servers.push_back(std::move(*server));
        }
    }

    // Retry section
    if (root.contains("retry"))
    {
        auto const& retry = root["retry"];
        config.retry.baseDelay = millisecondsOr(retry, "baseDelay", config.retry.baseDelay);
        config.retry.maxDelay = millisecondsOr(retry, "maxDelay", config.retry.maxDelay);
        config.retry.factor = json::getDoubleOr(retry, "backoffFactor", config.retry.factor);
    }

    // Discovery section
    if (root.contains("discovery"))
        config.discoveryInterval = millisecondsOr(root["discovery"], "intervalMs", config.discoveryInterval);

    // LLM section
    if (root.contains("llm"))
    {
        auto const& llm = root["llm"];
        config.llm.enableIntelligentRouting = json::getBoolOr(llm, "enableIntelligentRouting", true);

        auto const providerName = json::getStringOr(llm, "provider", "openai");
        auto const provider = llmProviderFromString(providerName);
        if (!provider)
            return makeError(ErrorCode::ConfigError, std::format("Unknown LLM provider '{}'", providerName));
        config.llm.provider = *provider;

        config.llm.model = json::getStringOr(llm, "model", "");
        config.llm.baseUrl = json::getStringOr(llm, "baseUrl", "");
        config.llm.maxTokens = json::getIntOr(llm, "maxTokens", config.llm.maxTokens);
        config.llm.temperature = json::getDoubleOr(llm, "temperature", config.llm.temperature);
        config.llm.confidenceThreshold =
            json::getDoubleOr(llm, "confidenceThreshold", config.llm.confidenceThreshold);
    }

    config.apiKeys = json::getStringMap(root, "apiKeys");
    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    root["logLevel"] = log::levelName(config.logLevel);
    root["defaultTimeout"] = config.defaultTimeout.count();

    // Servers section
    auto servers = nlohmann::json::object();
    for (const auto& serverConfig: config.servers)
    {
        auto server = nlohmann::json::object();
        if (!serverConfig.displayName.empty())
            server["name"] = serverConfig.displayName;
        server["type"] = transportKindName(serverConfig.kind);
        if (!serverConfig.command.empty())
            server["command"] = serverConfig.command;
        if (!serverConfig.args.empty())
            server["args"] = serverConfig.args;
        if (!serverConfig.env.empty())
            server["env"] = serverConfig.env;
        if (!serverConfig.workingDirectory.empty())
            server["workingDirectory"] = serverConfig.workingDirectory;
        if (!serverConfig.url.empty())
            server["url"] = serverConfig.url;
        server["enabled"] = serverConfig.enabled;
        server["timeout"] = serverConfig.timeout.count();
        server["retryAttempts"] = serverConfig.maxRetryAttempts;
        servers[serverConfig.name] = std::move(server);
    }
    root["servers"] = std::move(servers);

    root["retry"] = nlohmann::json {
        { "baseDelay", config.retry.baseDelay.count() },
        { "maxDelay", config.retry.maxDelay.count() },
        { "backoffFactor", config.retry.factor },
    };
    root["discovery"] = nlohmann::json { { "intervalMs", config.discoveryInterval.count() } };

    // LLM section
    auto llm = nlohmann::json::object();
    llm["enableIntelligentRouting"] = config.llm.enableIntelligentRouting;
    llm["provider"] = llmProviderName(config.llm.provider);
    if (!config.llm.model.empty())
        llm["model"] = config.llm.model;
    if (!config.llm.baseUrl.empty())
        llm["baseUrl"] = config.llm.baseUrl;
    llm["maxTokens"] = config.llm.maxTokens;
    llm["temperature"] = config.llm.temperature;
    llm["confidenceThreshold"] = config.llm.confidenceThreshold;
    root["llm"] = std::move(llm);

    if (!config.apiKeys.empty())
        root["apiKeys"] = config.apiKeys;

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto makeLlmSettings(const AppConfig& config) -> LlmSettings
{
    auto settings = LlmSettings {
        .provider = config.llm.provider,
        .apiKey = {},
        .model = config.llm.model,
        .baseUrl = config.llm.baseUrl,
        .maxTokens = config.llm.maxTokens,
        .temperature = config.llm.temperature,
        .timeout = config.defaultTimeout,
    };

    auto const providerName = std::string(llmProviderName(config.llm.provider));
    if (auto const it = config.apiKeys.find(providerName); it != config.apiKeys.end())
        settings.apiKey = it->second;

    if (settings.apiKey.empty())
    {
        auto const* const variable = config.llm.provider == LlmProvider::Anthropic ? "ANTHROPIC_API_KEY"
                                                                                  : "OPENAI_API_KEY";
        if (auto const* value = std::getenv(variable))
            settings.apiKey = value;
    }

    return settings;
}

} // namespace mcpbridge
