// SPDX-License-Identifier: Apache-2.0
#include <mcp/PipeTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

using namespace mcpbridge;
using namespace std::chrono_literals;

namespace
{
    /// Collects what a transport pushes from its reader thread.
    /// Declared before the transport so it outlives the reader thread.
    struct Inbox
    {
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<nlohmann::json> messages;
        std::vector<std::string> closeReasons;

        void attach(Transport& transport)
        {
            transport.setMessageHandler([this](nlohmann::json message) {
                auto lock = std::lock_guard(mutex);
                messages.push_back(std::move(message));
                cv.notify_all();
            });
            transport.setCloseHandler([this](std::string reason) {
                auto lock = std::lock_guard(mutex);
                closeReasons.push_back(std::move(reason));
                cv.notify_all();
            });
        }

        auto waitForMessages(size_t count, std::chrono::milliseconds timeout = 3s) -> bool
        {
            auto lock = std::unique_lock(mutex);
            return cv.wait_for(lock, timeout, [&] { return messages.size() >= count; });
        }

        auto waitForClose(std::chrono::milliseconds timeout = 3s) -> bool
        {
            auto lock = std::unique_lock(mutex);
            return cv.wait_for(lock, timeout, [&] { return !closeReasons.empty(); });
        }
    };

    auto shell(std::string script) -> PipeTransportConfig
    {
        return PipeTransportConfig {
            .command = "sh",
            .args = { "-c", std::move(script) },
            .env = {},
            .workingDirectory = {},
        };
    }
} // namespace

TEST_CASE("PipeTransport starts disconnected", "[transport]")
{
    auto transport = PipeTransport(PipeTransportConfig { .command = "cat" });
    CHECK(!transport.isConnected());
    CHECK(transport.kind() == TransportKind::Pipe);
}

TEST_CASE("PipeTransport send fails when not connected", "[transport]")
{
    auto transport = PipeTransport(PipeTransportConfig { .command = "cat" });
    auto result = transport.send(nlohmann::json { { "test", true } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionError);
}

TEST_CASE("PipeTransport exchanges line-framed messages with a child process", "[transport]")
{
    auto inbox = Inbox {};
    auto transport = PipeTransport(PipeTransportConfig { .command = "cat" });
    inbox.attach(transport);

    REQUIRE(transport.connect().has_value());
    CHECK(transport.isConnected());

    // cat echoes stdin to stdout, one line per message.
    REQUIRE(transport.send(nlohmann::json { { "test", "hello" } }).has_value());
    REQUIRE(transport.send(nlohmann::json { { "test", "world" } }).has_value());

    REQUIRE(inbox.waitForMessages(2));
    CHECK(inbox.messages[0]["test"] == "hello");
    CHECK(inbox.messages[1]["test"] == "world");

    transport.disconnect();
    CHECK(!transport.isConnected());
    CHECK(inbox.closeReasons.empty());
}

TEST_CASE("PipeTransport skips blank and unparseable lines", "[transport]")
{
    auto inbox = Inbox {};
    auto transport = PipeTransport(shell(R"(echo 'not json'; echo; echo '{"ok":true}'; exec sleep 5)"));
    inbox.attach(transport);

    REQUIRE(transport.connect().has_value());
    REQUIRE(inbox.waitForMessages(1));

    auto lock = std::lock_guard(inbox.mutex);
    REQUIRE(inbox.messages.size() == 1);
    CHECK(inbox.messages[0]["ok"] == true);
}

TEST_CASE("PipeTransport reports the child exiting", "[transport]")
{
    auto inbox = Inbox {};
    auto transport = PipeTransport(shell(R"(echo '{"bye":1}')"));
    inbox.attach(transport);

    REQUIRE(transport.connect().has_value());
    REQUIRE(inbox.waitForClose());
    CHECK(inbox.closeReasons.front() == "Process exited");
    CHECK(!transport.isConnected());

    auto result = transport.send(nlohmann::json { { "late", true } });
    CHECK(!result.has_value());
}

TEST_CASE("PipeTransport passes environment overrides and working directory", "[transport]")
{
    auto config = shell(R"(printf '{"value":"%s","cwd":"%s"}\n' "$MCPBRIDGE_TEST_VALUE" "$(pwd)"; exec sleep 5)");
    config.env = { { "MCPBRIDGE_TEST_VALUE", "from-config" } };
    config.workingDirectory = "/";

    auto inbox = Inbox {};
    auto transport = PipeTransport(config);
    inbox.attach(transport);

    REQUIRE(transport.connect().has_value());
    REQUIRE(inbox.waitForMessages(1));
    CHECK(inbox.messages[0]["value"] == "from-config");
    CHECK(inbox.messages[0]["cwd"] == "/");
}

TEST_CASE("PipeTransport captures stderr without affecting the session", "[transport]")
{
    auto inbox = Inbox {};
    auto transport = PipeTransport(shell(R"(echo 'server warming up' >&2; echo '{"ready":true}'; exec sleep 5)"));
    inbox.attach(transport);

    REQUIRE(transport.connect().has_value());
    REQUIRE(inbox.waitForMessages(1));

    auto captured = false;
    for (auto i = 0; i < 100 && !captured; ++i)
    {
        captured = transport.stderrOutput().find("server warming up") != std::string::npos;
        if (!captured)
            std::this_thread::sleep_for(10ms);
    }
    CHECK(captured);
    CHECK(transport.isConnected());
}

TEST_CASE("PipeTransport disconnect terminates a child that ignores stdin", "[transport]")
{
    auto transport = PipeTransport(shell("exec sleep 30"));
    REQUIRE(transport.connect().has_value());

    auto const start = std::chrono::steady_clock::now();
    transport.disconnect();
    CHECK(std::chrono::steady_clock::now() - start < 5s);
    CHECK(!transport.isConnected());
}

TEST_CASE("PipeTransport fails to start invalid command", "[transport]")
{
    auto inbox = Inbox {};
    auto transport = PipeTransport(PipeTransportConfig { .command = "/nonexistent/command/that/does/not/exist" });
    inbox.attach(transport);

    auto result = transport.connect();
    // posix_spawnp may succeed for a missing command and let the child fail
    // right away; either way the transport must not stay usable.
    if (result.has_value())
    {
        CHECK(inbox.waitForClose());
        CHECK(!transport.isConnected());
    }
    else
    {
        CHECK(result.error().code == ErrorCode::ConnectionError);
    }
}
