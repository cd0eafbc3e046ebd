// SPDX-License-Identifier: Apache-2.0
#include "EventStreamTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <net/HttpClient.hpp>
#include <net/SseParser.hpp>

#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <optional>
#include <thread>

namespace mcpbridge
{

auto resolveEndpointUrl(std::string_view streamUrl, std::string_view endpoint) -> std::string
{
    if (endpoint.starts_with("http://") || endpoint.starts_with("https://"))
        return std::string(endpoint);

    auto const schemeEnd = streamUrl.find("://");
    auto const authorityStart = schemeEnd == std::string_view::npos ? 0 : schemeEnd + 3;
    auto const pathStart = streamUrl.find('/', authorityStart);
    auto const origin = streamUrl.substr(0, pathStart);

    if (endpoint.starts_with('/'))
        return std::format("{}{}", origin, endpoint);

    if (pathStart == std::string_view::npos)
        return std::format("{}/{}", origin, endpoint);

    auto const path = streamUrl.substr(pathStart, streamUrl.find_first_of("?#", pathStart) - pathStart);
    auto const directory = path.substr(0, path.rfind('/') + 1);
    return std::format("{}{}{}", origin, directory, endpoint);
}

struct EventStreamTransport::Impl
{
    std::string url;
    std::chrono::milliseconds timeout;

    HttpClient streamClient;
    HttpClient postClient;
    SseParser parser;

    std::mutex lifecycleMutex;
    std::mutex stateMutex;
    std::condition_variable cv;
    std::string endpoint;
    bool ready = false;
    std::optional<Error> streamError;

    std::atomic<bool> connected = false;
    std::atomic<bool> closing = false;
    std::jthread reader;
};

EventStreamTransport::EventStreamTransport(std::string url, std::chrono::milliseconds timeout):
    _impl(std::make_unique<Impl>())
{
    _impl->url = std::move(url);
    _impl->timeout = timeout;
    _impl->streamClient.setConnectTimeout(timeout);
    _impl->postClient.setConnectTimeout(timeout);
    _impl->postClient.setTimeout(timeout);
}

EventStreamTransport::~EventStreamTransport()
{
    disconnect();
}

auto EventStreamTransport::connect() -> VoidResult
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);
    if (_impl->reader.joinable())
        return makeError(ErrorCode::ConnectionError, "Transport already connected");

    {
        auto stateLock = std::lock_guard(_impl->stateMutex);
        _impl->ready = false;
        _impl->streamError.reset();
        _impl->endpoint.clear();
    }
    _impl->parser.reset();
    _impl->closing = false;
    _impl->reader = std::jthread([this](std::stop_token stopToken) { streamLoop(stopToken); });

    auto failure = std::optional<Error> {};
    {
        auto stateLock = std::unique_lock(_impl->stateMutex);
        auto const signalled = _impl->cv.wait_for(
            stateLock, _impl->timeout, [this] { return _impl->ready || _impl->streamError.has_value(); });

        if (!signalled)
            failure = Error { ErrorCode::ConnectionError,
                              std::format("No endpoint announced by {} within {} ms",
                                          _impl->url,
                                          _impl->timeout.count()) };
        else if (_impl->streamError)
            failure = *_impl->streamError;
    }

    if (failure)
    {
        _impl->closing = true;
        _impl->reader.request_stop();
        _impl->reader.join();
        return std::unexpected(*failure);
    }

    _impl->connected = true;
    log::info("Event stream connected: {} (endpoint {})", _impl->url, _impl->endpoint);
    return {};
}

void EventStreamTransport::streamLoop(std::stop_token stopToken)
{
    auto const onEvent = [this](const SseEvent& event) -> bool {
        if (event.type == "endpoint")
        {
            {
                auto lock = std::lock_guard(_impl->stateMutex);
                _impl->endpoint = resolveEndpointUrl(_impl->url, event.data);
                _impl->ready = true;
            }
            _impl->cv.notify_all();
            return true;
        }

        if (!event.type.empty() && event.type != "message")
        {
            log::debug("Ignoring '{}' event from {}", event.type, _impl->url);
            return true;
        }

        auto message = json::parse(event.data);
        if (!message)
        {
            log::warning("Discarding unparseable event from {}: {}", _impl->url, event.data);
            return true;
        }

        log::trace("<- {}", event.data);
        dispatchMessage(std::move(*message));
        return true;
    };

    auto const headers = HttpHeaders {
        { "Accept", "text/event-stream" },
        { "Cache-Control", "no-cache" },
    };

    auto const result = _impl->streamClient.getStream(
        _impl->url,
        headers,
        [&](std::string_view chunk) { return _impl->parser.feed(chunk, onEvent); },
        stopToken);

    auto wasReady = false;
    {
        auto lock = std::lock_guard(_impl->stateMutex);
        wasReady = _impl->ready;
        if (!wasReady)
        {
            if (!result)
                _impl->streamError = result.error();
            else
                _impl->streamError = Error { ErrorCode::ConnectionError,
                                             std::format("Event stream {} ended with HTTP status {}",
                                                         _impl->url,
                                                         result->status) };
        }
    }
    _impl->cv.notify_all();

    _impl->connected = false;
    if (wasReady && !_impl->closing)
    {
        auto const reason = result ? std::string("Event stream ended") : result.error().message;
        log::warning("Event stream {} closed: {}", _impl->url, reason);
        dispatchClose(reason);
    }
}

auto EventStreamTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::ConnectionError, "Transport not connected");

    auto endpoint = std::string {};
    {
        auto lock = std::lock_guard(_impl->stateMutex);
        endpoint = _impl->endpoint;
    }

    auto const body = json::serialize(message);
    log::trace("-> {}", body);

    auto response = _impl->postClient.post(endpoint, body, { { "Content-Type", "application/json" } });
    if (!response)
        return makeError(ErrorCode::ConnectionError, response.error().message);
    if (!response->isSuccess())
        return makeError(ErrorCode::ConnectionError,
                         std::format("POST {} returned HTTP status {}", endpoint, response->status));

    // Some servers answer inline instead of on the stream.
    if (!response->body.empty())
    {
        if (auto inlineReply = json::parse(response->body); inlineReply && inlineReply->is_object())
            dispatchMessage(std::move(*inlineReply));
    }

    return {};
}

void EventStreamTransport::disconnect()
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);
    if (!_impl->reader.joinable())
        return;

    _impl->closing = true;
    _impl->connected = false;
    _impl->reader.request_stop();
    if (_impl->reader.get_id() == std::this_thread::get_id())
        _impl->reader.detach();
    else
        _impl->reader.join();

    log::debug("Event stream transport closed: {}", _impl->url);
}

auto EventStreamTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace mcpbridge
