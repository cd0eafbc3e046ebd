// SPDX-License-Identifier: Apache-2.0
#include <mcp/HealthMonitor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace mcpbridge;
using namespace std::chrono_literals;

TEST_CASE("BackoffPolicy doubles the delay up to the cap", "[health]")
{
    auto const policy = BackoffPolicy {};

    CHECK(policy.delayAfterFailure(1) == 1000ms);
    CHECK(policy.delayAfterFailure(2) == 2000ms);
    CHECK(policy.delayAfterFailure(3) == 4000ms);
    CHECK(policy.delayAfterFailure(5) == 16000ms);
    CHECK(policy.delayAfterFailure(6) == 30000ms);
    CHECK(policy.delayAfterFailure(20) == 30000ms);
}

TEST_CASE("BackoffPolicy honors custom settings", "[health]")
{
    auto const policy = BackoffPolicy { .baseDelay = 100ms, .factor = 3.0, .maxDelay = 1000ms };

    CHECK(policy.delayAfterFailure(0) == 0ms);
    CHECK(policy.delayAfterFailure(1) == 100ms);
    CHECK(policy.delayAfterFailure(2) == 300ms);
    CHECK(policy.delayAfterFailure(3) == 900ms);
    CHECK(policy.delayAfterFailure(4) == 1000ms);
}

TEST_CASE("HealthMonitor tracks a fresh server as disconnected", "[health]")
{
    auto monitor = HealthMonitor {};
    monitor.track("filesystem");

    auto const health = monitor.get("filesystem");
    REQUIRE(health.has_value());
    CHECK(health->serverId == "filesystem");
    CHECK(!health->connected);
    CHECK(health->retryCount == 0);
    CHECK(!health->lastError.has_value());
    CHECK(!health->lastRetry.has_value());

    CHECK(!monitor.get("unknown").has_value());
}

TEST_CASE("HealthMonitor counts failed connect attempts", "[health]")
{
    auto monitor = HealthMonitor {};
    monitor.track("git");

    auto const when = std::chrono::system_clock::now();
    monitor.recordConnectFailure("git", "refused", when);
    monitor.recordConnectFailure("git", "still refused", when + 1s);

    auto health = monitor.get("git");
    REQUIRE(health.has_value());
    CHECK(health->retryCount == 2);
    CHECK(health->lastError == "still refused");
    CHECK(health->lastRetry == when + 1s);

    monitor.recordConnected("git");
    health = monitor.get("git");
    CHECK(health->connected);
    CHECK(!health->lastError.has_value());
    CHECK(health->retryCount == 2);
}

TEST_CASE("HealthMonitor records operation outcomes without touching the connected flag", "[health]")
{
    auto monitor = HealthMonitor {};
    monitor.track("search");
    monitor.recordConnected("search");

    monitor.recordOperation("search", false, "timed out");
    auto health = monitor.get("search");
    CHECK(health->connected);
    CHECK(health->lastError == "timed out");

    monitor.recordOperation("search", true);
    health = monitor.get("search");
    CHECK(!health->lastError.has_value());

    monitor.recordDisconnected("search", "Process exited");
    health = monitor.get("search");
    CHECK(!health->connected);
    CHECK(health->lastError == "Process exited");
}

TEST_CASE("HealthMonitor snapshot is ordered by server id", "[health]")
{
    auto monitor = HealthMonitor {};
    monitor.track("web");
    monitor.track("filesystem");
    monitor.track("git");

    auto const snapshot = monitor.snapshot();
    REQUIRE(snapshot.size() == 3);
    CHECK(snapshot[0].serverId == "filesystem");
    CHECK(snapshot[1].serverId == "git");
    CHECK(snapshot[2].serverId == "web");

    monitor.clear();
    CHECK(monitor.snapshot().empty());
}
