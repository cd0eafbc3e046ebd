// SPDX-License-Identifier: Apache-2.0
#include <mcpbridge/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace mcpbridge;
using namespace std::chrono_literals;

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    REQUIRE(!defaultConfigDir().empty());
    REQUIRE(defaultConfigPath().ends_with("config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.logLevel == log::Level::Info);
    CHECK(config.defaultTimeout == 30000ms);
    CHECK(config.servers.empty());
    CHECK(config.retry.baseDelay == 1000ms);
    CHECK(config.retry.maxDelay == 30000ms);
    CHECK(config.llm.enableIntelligentRouting);
    CHECK(config.llm.provider == LlmProvider::OpenAi);
    CHECK(config.llm.model.empty());
    CHECK(config.llm.confidenceThreshold == LowConfidence);
}

TEST_CASE("parseConfig reads every section", "[config]")
{
    auto result = parseConfig(R"({
        "logLevel": "debug",
        "defaultTimeout": 5000,
        "servers": {
            "filesystem": {
                "type": "stdio",
                "command": "npx",
                "args": ["-y", "@modelcontextprotocol/server-filesystem", "/tmp"],
                "env": {"NODE_ENV": "production"},
                "workingDirectory": "/tmp"
            },
            "remote": {
                "name": "Remote Tools",
                "type": "sse",
                "url": "http://localhost:3000/sse",
                "timeout": 2000,
                "retryAttempts": 5,
                "enabled": false
            },
            "socket": {"type": "websocket", "url": "ws://localhost:4000"}
        },
        "retry": {"baseDelay": 500, "maxDelay": 8000, "backoffFactor": 3},
        "discovery": {"intervalMs": 60000},
        "llm": {
            "provider": "anthropic",
            "model": "claude-custom",
            "maxTokens": 256,
            "temperature": 0.3,
            "confidenceThreshold": 0.5
        },
        "apiKeys": {"anthropic": "ak-123"}
    })");
    REQUIRE(result.has_value());
    auto const& config = *result;

    CHECK(config.logLevel == log::Level::Debug);
    CHECK(config.defaultTimeout == 5000ms);

    SECTION("servers")
    {
        REQUIRE(config.servers.size() == 3);

        auto const& filesystem = config.servers[0];
        CHECK(filesystem.name == "filesystem");
        CHECK(filesystem.kind == TransportKind::Pipe);
        CHECK(filesystem.command == "npx");
        CHECK(filesystem.args.size() == 3);
        CHECK(filesystem.env.at("NODE_ENV") == "production");
        CHECK(filesystem.workingDirectory == "/tmp");
        CHECK(filesystem.timeout == 5000ms);
        CHECK(filesystem.maxRetryAttempts == 3);
        CHECK(filesystem.enabled);

        auto const& remote = config.servers[1];
        CHECK(remote.name == "remote");
        CHECK(remote.displayName == "Remote Tools");
        CHECK(remote.kind == TransportKind::EventStream);
        CHECK(remote.url == "http://localhost:3000/sse");
        CHECK(remote.timeout == 2000ms);
        CHECK(remote.maxRetryAttempts == 5);
        CHECK(!remote.enabled);

        CHECK(config.servers[2].kind == TransportKind::Socket);
    }

    SECTION("retry and discovery")
    {
        CHECK(config.retry.baseDelay == 500ms);
        CHECK(config.retry.maxDelay == 8000ms);
        CHECK(config.retry.factor == 3.0);
        CHECK(config.discoveryInterval == 60000ms);
    }

    SECTION("llm")
    {
        CHECK(config.llm.provider == LlmProvider::Anthropic);
        CHECK(config.llm.model == "claude-custom");
        CHECK(config.llm.maxTokens == 256);
        CHECK(config.llm.temperature == 0.3);
        CHECK(config.llm.confidenceThreshold == 0.5);

        auto const settings = makeLlmSettings(config);
        CHECK(settings.provider == LlmProvider::Anthropic);
        CHECK(settings.apiKey == "ak-123");
        CHECK(settings.model == "claude-custom");
        CHECK(settings.timeout == 5000ms);
    }
}

TEST_CASE("parseConfig expands environment variables", "[config]")
{
    ::setenv("MCPBRIDGE_TEST_ROOT", "/srv/data", 1);
    ::unsetenv("MCPBRIDGE_TEST_UNSET");

    auto result = parseConfig(R"({
        "servers": {
            "filesystem": {"command": "fs-server", "args": ["${MCPBRIDGE_TEST_ROOT}/docs", "x${MCPBRIDGE_TEST_UNSET}y"]}
        }
    })");
    REQUIRE(result.has_value());
    REQUIRE(result->servers.size() == 1);
    CHECK(result->servers[0].args[0] == "/srv/data/docs");
    CHECK(result->servers[0].args[1] == "xy");

    CHECK(expandEnvironmentVariables("no variables") == "no variables");
    CHECK(expandEnvironmentVariables("broken ${MCPBRIDGE_TEST_ROOT") == "broken ${MCPBRIDGE_TEST_ROOT");
}

TEST_CASE("parseConfig rejects invalid configuration", "[config]")
{
    auto const expectConfigError = [](std::string_view text) {
        auto result = parseConfig(text);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        return result.error().message;
    };

    CHECK(expectConfigError(R"({"servers": {"x": {"type": "carrier-pigeon"}}})").find("carrier-pigeon")
          != std::string::npos);
    expectConfigError(R"({"servers": {"x": {"command": "a", "retryAttempts": 0}}})");
    expectConfigError(R"({"servers": {"x": "not an object"}})");
    expectConfigError(R"({"logLevel": "chatty"})");
    expectConfigError(R"({"llm": {"provider": "oracle"}})");
    expectConfigError("[1, 2, 3]");
    expectConfigError("{ not json");
}

TEST_CASE("loadConfigFromFile reports a missing file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("saveConfigToFile and loadConfigFromFile round-trip", "[config]")
{
    auto const tempDir = std::filesystem::temp_directory_path() / "mcpbridge_test_config";
    auto const tempPath = tempDir / "config.json";
    std::filesystem::remove_all(tempDir);

    auto original = AppConfig {};
    original.logLevel = log::Level::Warning;
    original.servers.push_back(ServerConfig {
        .name = "notes",
        .displayName = "Notes",
        .kind = TransportKind::Pipe,
        .command = "notes-server",
        .args = { "--db", "notes.db" },
        .env = { { "TOKEN", "t" } },
        .workingDirectory = {},
        .url = {},
        .enabled = true,
        .timeout = 1500ms,
        .maxRetryAttempts = 2,
    });
    original.llm.provider = LlmProvider::Local;
    original.llm.baseUrl = "http://localhost:8080";
    original.apiKeys["local"] = "secret";

    REQUIRE(saveConfigToFile(tempPath.string(), original).has_value());

    auto loaded = loadConfigFromFile(tempPath.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->logLevel == log::Level::Warning);
    REQUIRE(loaded->servers.size() == 1);
    CHECK(loaded->servers[0].displayName == "Notes");
    CHECK(loaded->servers[0].args == original.servers[0].args);
    CHECK(loaded->servers[0].timeout == 1500ms);
    CHECK(loaded->servers[0].maxRetryAttempts == 2);
    CHECK(loaded->llm.provider == LlmProvider::Local);
    CHECK(loaded->llm.baseUrl == "http://localhost:8080");
    CHECK(loaded->apiKeys.at("local") == "secret");

    std::filesystem::remove_all(tempDir);
}

TEST_CASE("makeLlmSettings falls back to the provider's environment key", "[config]")
{
    ::setenv("OPENAI_API_KEY", "sk-from-env", 1);

    auto config = AppConfig {};
    CHECK(makeLlmSettings(config).apiKey == "sk-from-env");

    config.apiKeys["openai"] = "sk-from-config";
    CHECK(makeLlmSettings(config).apiKey == "sk-from-config");

    ::unsetenv("OPENAI_API_KEY");
}
