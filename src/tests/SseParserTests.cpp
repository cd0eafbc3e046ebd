// SPDX-License-Identifier: Apache-2.0
#include <mcp/EventStreamTransport.hpp>
#include <net/SseParser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace mcpbridge;

namespace
{
    auto collectInto(std::vector<SseEvent>& events)
    {
        return [&events](const SseEvent& event) {
            events.push_back(event);
            return true;
        };
    }
} // namespace

TEST_CASE("SseParser dispatches an event on a blank line", "[sse]")
{
    auto parser = SseParser {};
    auto events = std::vector<SseEvent> {};

    CHECK(parser.feed("event: endpoint\ndata: /messages?session=1\n\n", collectInto(events)));
    REQUIRE(events.size() == 1);
    CHECK(events[0].type == "endpoint");
    CHECK(events[0].data == "/messages?session=1");
    CHECK(!parser.hasBufferedData());
}

TEST_CASE("SseParser joins multi-line data and keeps the id", "[sse]")
{
    auto parser = SseParser {};
    auto events = std::vector<SseEvent> {};

    parser.feed("id: 42\r\ndata: {\"a\":\r\ndata: 1}\r\n\r\n", collectInto(events));
    REQUIRE(events.size() == 1);
    CHECK(events[0].type.empty());
    CHECK(events[0].id == "42");
    CHECK(events[0].data == "{\"a\":\n1}");
}

TEST_CASE("SseParser handles chunks split anywhere", "[sse]")
{
    auto parser = SseParser {};
    auto events = std::vector<SseEvent> {};
    auto const stream = std::string("event: message\ndata: {\"jsonrpc\":\"2.0\",\"id\":1}\n\ndata: second\n\n");

    for (auto const c: stream)
        parser.feed(std::string_view(&c, 1), collectInto(events));

    REQUIRE(events.size() == 2);
    CHECK(events[0].type == "message");
    CHECK(events[0].data == "{\"jsonrpc\":\"2.0\",\"id\":1}");
    CHECK(events[1].data == "second");
}

TEST_CASE("SseParser ignores comments and unknown fields", "[sse]")
{
    auto parser = SseParser {};
    auto events = std::vector<SseEvent> {};

    parser.feed(": keep-alive\n\nretry: 1000\nfoo: bar\ndata:no-space\n\n", collectInto(events));
    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "no-space");
}

TEST_CASE("SseParser stops when the callback asks it to", "[sse]")
{
    auto parser = SseParser {};
    auto count = 0;

    auto const keepGoing = parser.feed("data: 1\n\ndata: 2\n\n", [&](const SseEvent&) {
        ++count;
        return false;
    });
    CHECK(!keepGoing);
    CHECK(count == 1);
    CHECK(parser.hasBufferedData());

    parser.reset();
    CHECK(!parser.hasBufferedData());
}

TEST_CASE("resolveEndpointUrl resolves relative to the stream URL", "[sse]")
{
    CHECK(resolveEndpointUrl("http://localhost:3000/sse", "/messages?s=1") == "http://localhost:3000/messages?s=1");
    CHECK(resolveEndpointUrl("http://localhost:3000/mcp/sse", "messages") == "http://localhost:3000/mcp/messages");
    CHECK(resolveEndpointUrl("http://localhost:3000", "messages") == "http://localhost:3000/messages");
    CHECK(resolveEndpointUrl("https://a.example/sse?token=x", "post") == "https://a.example/post");
    CHECK(resolveEndpointUrl("http://localhost:3000/sse", "https://other.example/rpc") == "https://other.example/rpc");
}
