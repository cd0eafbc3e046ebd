// SPDX-License-Identifier: Apache-2.0
#include <router/QueryRouter.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace mcpbridge;
using Catch::Approx;

namespace
{
    /// LlmClient returning a canned answer and remembering the prompt.
    class ScriptedLlm: public LlmClient
    {
      public:
        explicit ScriptedLlm(Result<std::string> answer): _answer(std::move(answer)) {}

        auto complete(std::string_view prompt) -> Result<std::string> override
        {
            prompts.emplace_back(prompt);
            return _answer;
        }

        std::vector<std::string> prompts;

      private:
        Result<std::string> _answer;
    };

    auto schemaWith(std::initializer_list<const char*> fields) -> nlohmann::json
    {
        auto properties = nlohmann::json::object();
        for (auto const* field: fields)
            properties[field] = nlohmann::json { { "type", "string" } };
        return nlohmann::json { { "type", "object" }, { "properties", properties } };
    }

    auto tool(std::string name, nlohmann::json schema = nlohmann::json::object()) -> ToolDefinition
    {
        return ToolDefinition {
            .name = std::move(name),
            .description = "does things",
            .inputSchema = std::move(schema),
            .examples = {},
            .serverId = {},
        };
    }

    auto entry(std::string id, std::vector<ToolDefinition> tools, ServerStatus status = ServerStatus::Connected)
        -> ServerCatalogEntry
    {
        for (auto& t: tools)
            t.serverId = id;
        return ServerCatalogEntry {
            .serverId = id,
            .displayName = serverDisplayName(id),
            .description = describeServer(id, tools),
            .tools = std::move(tools),
            .resources = {},
            .status = status,
            .lastUpdated = {},
        };
    }

    auto standardCatalog() -> ServerCatalog
    {
        auto catalog = ServerCatalog {};
        catalog.entries.push_back(
            entry("filesystem", { tool("read_file", schemaWith({ "path" })), tool("list_directory", schemaWith({ "path" })) }));
        catalog.entries.push_back(entry("git", { tool("git_status", schemaWith({ "repo_path" })), tool("git_log") }));
        catalog.entries.push_back(entry("web-search", { tool("web_search", schemaWith({ "query" })) }));
        return catalog;
    }

    auto llmAnswer(std::string server, std::string toolName, double confidence = 0.9) -> std::string
    {
        return nlohmann::json {
            { "intent", "Do the thing" },
            { "selectedServer", std::move(server) },
            { "selectedTool", std::move(toolName) },
            { "parameters", { { "path", "README.md" } } },
            { "reasoning", "Because" },
            { "confidence", confidence },
        }
            .dump();
    }
} // namespace

TEST_CASE("fallbackPlan routes version control queries to git", "[router]")
{
    auto const plan = fallbackPlan("show git status", standardCatalog());

    CHECK(plan.selectedServer == "git");
    CHECK(plan.selectedTool == "git_status");
    CHECK(plan.confidence >= 0.5);
    CHECK(plan.confidence <= 0.7);
    CHECK(plan.parameters["repo_path"] == ".");
    CHECK(plan.fromHeuristics);
    CHECK(plan.isActionable());
}

TEST_CASE("fallbackPlan extracts file paths", "[router]")
{
    auto const catalog = standardCatalog();

    auto const read = fallbackPlan("read notes.txt please", catalog);
    CHECK(read.selectedServer == "filesystem");
    CHECK(read.selectedTool == "read_file");
    CHECK(read.parameters["path"] == "notes.txt");
    CHECK(read.confidence == Approx(MediumConfidence));

    auto const list = fallbackPlan("list files in /tmp", catalog);
    CHECK(list.selectedTool == "list_directory");
    CHECK(list.parameters["path"] == "/tmp");

    auto const vague = fallbackPlan("list the files in the project", catalog);
    CHECK(vague.selectedTool == "list_directory");
    CHECK(vague.parameters["path"] == ".");
}

TEST_CASE("fallbackPlan routes lookups to a search tool", "[router]")
{
    auto const plan = fallbackPlan("search the web for cats", standardCatalog());

    CHECK(plan.selectedServer == "web-search");
    CHECK(plan.selectedTool == "web_search");
    CHECK(plan.parameters["query"] == "search the web for cats");
}

TEST_CASE("fallbackPlan routes SQL to a query tool", "[router]")
{
    auto catalog = ServerCatalog {};
    catalog.entries.push_back(entry("warehouse", { tool("run_query", schemaWith({ "sql" })) }));

    auto const plan = fallbackPlan("select * from orders", catalog);
    CHECK(plan.selectedServer == "warehouse");
    CHECK(plan.selectedTool == "run_query");
    CHECK(plan.parameters["sql"] == "select * from orders");
    CHECK(plan.confidence == Approx(0.5));
}

TEST_CASE("fallbackPlan picks any connected tool with low confidence", "[router]")
{
    auto catalog = ServerCatalog {};
    catalog.entries.push_back(entry("down", { tool("ping") }, ServerStatus::Disconnected));
    catalog.entries.push_back(entry("weather", { tool("forecast") }));

    auto const plan = fallbackPlan("will it rain tomorrow", catalog);
    CHECK(plan.selectedServer == "weather");
    CHECK(plan.selectedTool == "forecast");
    CHECK(plan.confidence == Approx(0.2));
    CHECK(!plan.isActionable());
}

TEST_CASE("fallbackPlan with no servers yields an empty plan", "[router]")
{
    auto const plan = fallbackPlan("show git status", ServerCatalog {});

    CHECK(plan.selectedServer.empty());
    CHECK(plan.selectedTool.empty());
    CHECK(plan.confidence == 0.0);
    CHECK(plan.intent == "Unknown");
    CHECK(plan.reasoning == "No suitable server/tool found");
    CHECK(!plan.isActionable());
}

TEST_CASE("stripCodeFences removes markdown fences", "[router]")
{
    CHECK(stripCodeFences("```json\n{\"a\":1}\n```") == "{\"a\":1}");
    CHECK(stripCodeFences("```\n{\"a\":1}\n```") == "{\"a\":1}");
    CHECK(stripCodeFences("Here you go:\n```json\n{}\n```\nDone") == "{}");
    CHECK(stripCodeFences("  {\"plain\":true}  ") == "{\"plain\":true}");
}

TEST_CASE("parseRoutingPlan fills defaults and clamps confidence", "[router]")
{
    auto const plan = parseRoutingPlan(R"({"selectedServer":"git","selectedTool":"git_log","confidence":1.7})");
    REQUIRE(plan.has_value());
    CHECK(plan->intent == "Unknown intent");
    CHECK(plan->reasoning == "No reasoning provided");
    CHECK(plan->confidence == 1.0);
    CHECK(plan->parameters.is_object());
    CHECK(!plan->fromHeuristics);

    auto const textual = parseRoutingPlan(R"({"selectedServer":"git","selectedTool":"git_log","confidence":"0.4"})");
    REQUIRE(textual.has_value());
    CHECK(textual->confidence == Approx(0.4));

    auto const negative = parseRoutingPlan(R"({"selectedServer":"git","selectedTool":"git_log","confidence":-3})");
    REQUIRE(negative.has_value());
    CHECK(negative->confidence == 0.0);
}

TEST_CASE("parseRoutingPlan rejects unusable answers", "[router]")
{
    auto const prose = parseRoutingPlan("I think you should use git.");
    REQUIRE(!prose.has_value());
    CHECK(prose.error().code == ErrorCode::LlmProviderError);

    auto const array = parseRoutingPlan("[1, 2]");
    REQUIRE(!array.has_value());
    CHECK(array.error().code == ErrorCode::LlmProviderError);

    auto const incomplete = parseRoutingPlan(R"({"selectedServer":"git"})");
    REQUIRE(!incomplete.has_value());
    CHECK(incomplete.error().code == ErrorCode::RoutingValidationError);
}

TEST_CASE("parseRoutingPlan keeps only well-formed fallback options", "[router]")
{
    auto const plan = parseRoutingPlan(R"({
        "selectedServer": "filesystem", "selectedTool": "read_file", "confidence": 0.8,
        "fallbackOptions": [
            {"selectedServer": "git", "selectedTool": "git_log", "confidence": 0.3},
            {"selectedServer": "git"},
            "nonsense"
        ]
    })");
    REQUIRE(plan.has_value());
    REQUIRE(plan->fallbackOptions.size() == 1);
    CHECK(plan->fallbackOptions[0].selectedTool == "git_log");
}

TEST_CASE("validatePlan requires a connected server owning the tool", "[router]")
{
    auto catalog = standardCatalog();
    catalog.entries.push_back(entry("offline", { tool("anything") }, ServerStatus::Disconnected));

    auto plan = RoutingPlan { .selectedServer = "git", .selectedTool = "git_status" };
    CHECK(validatePlan(plan, catalog).has_value());

    plan.selectedTool = "git_push";
    CHECK(validatePlan(plan, catalog).error().code == ErrorCode::RoutingValidationError);

    plan.selectedServer = "nowhere";
    CHECK(validatePlan(plan, catalog).error().code == ErrorCode::RoutingValidationError);

    plan = RoutingPlan { .selectedServer = "offline", .selectedTool = "anything" };
    CHECK(validatePlan(plan, catalog).error().code == ErrorCode::RoutingValidationError);
}

TEST_CASE("buildCapabilitiesContext lists connected servers only", "[router]")
{
    auto catalog = standardCatalog();
    catalog.entries[0].tools[0].examples = { "read package.json", "cat readme.md" };
    catalog.entries.push_back(entry("offline", { tool("hidden_tool") }, ServerStatus::Error));

    auto const context = buildCapabilitiesContext(catalog);
    CHECK(context.find("Server: File System (filesystem)") != std::string::npos);
    CHECK(context.find("  - read_file: does things") != std::string::npos);
    CHECK(context.find("Examples: read package.json, cat readme.md") != std::string::npos);
    CHECK(context.find("hidden_tool") == std::string::npos);

    CHECK(buildCapabilitiesContext(ServerCatalog {}) == "No servers are currently connected.");
}

TEST_CASE("QueryRouter uses a fenced LLM answer", "[router]")
{
    auto llm = std::make_shared<ScriptedLlm>("```json\n" + llmAnswer("filesystem", "read_file") + "\n```");
    auto const router = QueryRouter(nullptr, llm);

    auto const plan = router.analyzeQuery("what does the readme say", standardCatalog());
    CHECK(plan.selectedServer == "filesystem");
    CHECK(plan.selectedTool == "read_file");
    CHECK(plan.parameters["path"] == "README.md");
    CHECK(plan.confidence == Approx(0.9));
    CHECK(!plan.fromHeuristics);

    REQUIRE(llm->prompts.size() == 1);
    CHECK(llm->prompts[0].find("User Query: \"what does the readme say\"") != std::string::npos);
    CHECK(llm->prompts[0].find("web_search") != std::string::npos);
}

TEST_CASE("QueryRouter falls back when the LLM picks an unknown target", "[router]")
{
    auto llm = std::make_shared<ScriptedLlm>(llmAnswer("database", "drop_tables"));
    auto const router = QueryRouter(nullptr, llm);

    auto const plan = router.analyzeQuery("show git status", standardCatalog());
    CHECK(plan.fromHeuristics);
    CHECK(plan.selectedServer == "git");
    CHECK(plan.selectedTool == "git_status");
}

TEST_CASE("QueryRouter falls back when the provider fails", "[router]")
{
    auto llm = std::make_shared<ScriptedLlm>(
        Result<std::string>(std::unexpected(Error { ErrorCode::LlmProviderError, "HTTP 500" })));
    auto const router = QueryRouter(nullptr, llm);

    auto const plan = router.analyzeQuery("read notes.txt", standardCatalog());
    CHECK(plan.fromHeuristics);
    CHECK(plan.selectedTool == "read_file");
}

TEST_CASE("QueryRouter drops fallback options that fail validation", "[router]")
{
    auto answer = nlohmann::json::parse(llmAnswer("git", "git_log"));
    answer["fallbackOptions"] = nlohmann::json::array({
        { { "selectedServer", "git" }, { "selectedTool", "git_status" }, { "confidence", 0.5 } },
        { { "selectedServer", "git" }, { "selectedTool", "git_rebase" }, { "confidence", 0.4 } },
    });
    auto llm = std::make_shared<ScriptedLlm>(answer.dump());
    auto const router = QueryRouter(nullptr, llm);

    auto const plan = router.analyzeQuery("what changed recently", standardCatalog());
    CHECK(plan.selectedTool == "git_log");
    REQUIRE(plan.fallbackOptions.size() == 1);
    CHECK(plan.fallbackOptions[0].selectedTool == "git_status");
}

TEST_CASE("QueryRouter skips the LLM when nothing is connected", "[router]")
{
    auto llm = std::make_shared<ScriptedLlm>(llmAnswer("git", "git_status"));
    auto const router = QueryRouter([] { return std::make_shared<const ServerCatalog>(); }, llm);

    auto const plan = router.analyzeQuery("show git status");
    CHECK(plan.confidence == 0.0);
    CHECK(llm->prompts.empty());
}

TEST_CASE("QueryRouter routes against the provider's catalog", "[router]")
{
    auto const router = QueryRouter([] { return std::make_shared<const ServerCatalog>(standardCatalog()); });
    CHECK(!router.hasLlm());

    auto const plan = router.analyzeQuery("git log please");
    CHECK(plan.selectedServer == "git");
    CHECK(plan.selectedTool == "git_log");
}

TEST_CASE("makeCompletionRequest shapes provider requests", "[router][llm]")
{
    SECTION("OpenAI")
    {
        auto const request = makeCompletionRequest(LlmSettings { .provider = LlmProvider::OpenAi, .apiKey = "sk-1" }, "hi");
        REQUIRE(request.has_value());
        CHECK(request->url == "https://api.openai.com/v1/chat/completions");
        CHECK(request->headers.at("Authorization") == "Bearer sk-1");
        CHECK(request->body["model"] == "gpt-4");
        CHECK(request->body["messages"][0]["content"] == "hi");
        CHECK(request->body["max_tokens"] == 1000);
    }

    SECTION("Anthropic")
    {
        auto const request = makeCompletionRequest(
            LlmSettings { .provider = LlmProvider::Anthropic, .apiKey = "ak", .model = "claude-custom" }, "hi");
        REQUIRE(request.has_value());
        CHECK(request->url == "https://api.anthropic.com/v1/messages");
        CHECK(request->headers.at("x-api-key") == "ak");
        CHECK(request->headers.at("anthropic-version") == "2023-06-01");
        CHECK(request->body["model"] == "claude-custom");
        CHECK(!request->headers.contains("Authorization"));
    }

    SECTION("Local")
    {
        auto const request = makeCompletionRequest(
            LlmSettings { .provider = LlmProvider::Local, .apiKey = {}, .model = "llama", .baseUrl = "http://localhost:8080/" },
            "hi");
        REQUIRE(request.has_value());
        CHECK(request->url == "http://localhost:8080/v1/chat/completions");
        CHECK(!request->headers.contains("Authorization"));
    }

    SECTION("missing credentials")
    {
        auto const openAi = makeCompletionRequest(LlmSettings { .provider = LlmProvider::OpenAi }, "hi");
        REQUIRE(!openAi.has_value());
        CHECK(openAi.error().code == ErrorCode::LlmProviderError);

        auto const local = makeCompletionRequest(LlmSettings { .provider = LlmProvider::Local }, "hi");
        REQUIRE(!local.has_value());
        CHECK(local.error().code == ErrorCode::LlmProviderError);
    }
}

TEST_CASE("parseCompletionResponse reads each provider's shape", "[router][llm]")
{
    auto const openAi =
        parseCompletionResponse(LlmProvider::OpenAi, R"({"choices":[{"message":{"role":"assistant","content":"A"}}]})");
    REQUIRE(openAi.has_value());
    CHECK(*openAi == "A");

    auto const anthropic = parseCompletionResponse(LlmProvider::Anthropic, R"({"content":[{"type":"text","text":"B"}]})");
    REQUIRE(anthropic.has_value());
    CHECK(*anthropic == "B");

    CHECK(!parseCompletionResponse(LlmProvider::OpenAi, R"({"choices":[]})").has_value());
    CHECK(!parseCompletionResponse(LlmProvider::Anthropic, "not json").has_value());
}

TEST_CASE("parseCompletionResponse rejects bodies of the wrong shape", "[router][llm]")
{
    auto const expectProviderError = [](LlmProvider provider, std::string_view body) {
        auto const result = parseCompletionResponse(provider, body);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::LlmProviderError);
    };

    expectProviderError(LlmProvider::OpenAi, "[]");
    expectProviderError(LlmProvider::Anthropic, R"("just a string")");
    expectProviderError(LlmProvider::OpenAi, R"({"choices":["oops"]})");
    expectProviderError(LlmProvider::Local, R"({"choices":{"message":"not a list"}})");
    expectProviderError(LlmProvider::Anthropic, R"({"content":[42]})");

    auto const noMessage = parseCompletionResponse(LlmProvider::OpenAi, R"({"choices":[{"message":null}]})");
    REQUIRE(noMessage.has_value());
    CHECK(noMessage->empty());
}

TEST_CASE("llmProvider names round-trip", "[router][llm]")
{
    CHECK(llmProviderFromString("anthropic") == LlmProvider::Anthropic);
    CHECK(llmProviderFromString("local") == LlmProvider::Local);
    CHECK(!llmProviderFromString("mystery").has_value());
    CHECK(llmProviderName(LlmProvider::OpenAi) == "openai");
}
