// SPDX-License-Identifier: Apache-2.0
#include "SocketTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <curl/curl.h>

#include <array>
#include <atomic>
#include <format>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <poll.h>

namespace mcpbridge
{

namespace
{
    constexpr auto PollIntervalMs = 100;

    void ensureCurlInitialized()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    auto waitSocket(curl_socket_t socket, short events) -> bool
    {
        auto pfd = pollfd { .fd = socket, .events = events, .revents = 0 };
        return ::poll(&pfd, 1, PollIntervalMs) > 0;
    }
} // namespace

struct SocketTransport::Impl
{
    std::string url;
    std::chrono::milliseconds connectTimeout;

    std::mutex lifecycleMutex;
    std::mutex curlMutex; // guards every use of curl after connect
    CURL* curl = nullptr;
    curl_socket_t socket = CURL_SOCKET_BAD;

    std::atomic<bool> connected = false;
    std::atomic<bool> closing = false;
    std::jthread reader;
};

SocketTransport::SocketTransport(std::string url, std::chrono::milliseconds connectTimeout):
    _impl(std::make_unique<Impl>())
{
    _impl->url = std::move(url);
    _impl->connectTimeout = connectTimeout;
}

SocketTransport::~SocketTransport()
{
    disconnect();
}

auto SocketTransport::connect() -> VoidResult
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);
    if (_impl->curl)
        return makeError(ErrorCode::ConnectionError, "Transport already connected");

    ensureCurlInitialized();
    auto* curl = curl_easy_init();
    if (!curl)
        return makeError(ErrorCode::ConnectionError, "Failed to create libcurl handle");

    curl_easy_setopt(curl, CURLOPT_URL, _impl->url.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L); // WebSocket upgrade, then hand over the socket
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(_impl->connectTimeout.count()));

    auto const res = curl_easy_perform(curl);
    if (res != CURLE_OK)
    {
        curl_easy_cleanup(curl);
        return makeError(ErrorCode::ConnectionError,
                         std::format("WebSocket connect to {} failed: {}", _impl->url, curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl, CURLINFO_ACTIVESOCKET, &_impl->socket);
    _impl->curl = curl;
    _impl->closing = false;
    _impl->connected = true;
    _impl->reader = std::jthread([this](std::stop_token stopToken) { readLoop(stopToken); });

    log::info("WebSocket connected: {}", _impl->url);
    return {};
}

void SocketTransport::readLoop(std::stop_token stopToken)
{
    auto message = std::string {};
    auto buffer = std::array<char, 16384> {};

    while (!stopToken.stop_requested())
    {
        if (!waitSocket(_impl->socket, POLLIN))
            continue;

        auto completed = std::vector<std::string> {};
        auto closed = false;
        auto reason = std::string {};
        {
            auto lock = std::lock_guard(_impl->curlMutex);
            while (true)
            {
                auto received = size_t { 0 };
                const curl_ws_frame* meta = nullptr;
                auto const rc = curl_ws_recv(_impl->curl, buffer.data(), buffer.size(), &received, &meta);
                if (rc == CURLE_AGAIN)
                    break;
                if (rc != CURLE_OK)
                {
                    closed = true;
                    reason = curl_easy_strerror(rc);
                    break;
                }
                if (meta->flags & CURLWS_CLOSE)
                {
                    closed = true;
                    reason = "Server closed the WebSocket";
                    break;
                }
                if (!(meta->flags & (CURLWS_TEXT | CURLWS_BINARY)))
                    continue; // ping/pong are answered by libcurl

                message.append(buffer.data(), received);
                if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT))
                    completed.push_back(std::exchange(message, {}));
            }
        }

        for (const auto& text: completed)
        {
            auto parsed = json::parse(text);
            if (!parsed)
            {
                log::warning("Discarding unparseable WebSocket frame from {}: {}", _impl->url, text);
                continue;
            }
            log::trace("<- {}", text);
            dispatchMessage(std::move(*parsed));
        }

        if (closed)
        {
            _impl->connected = false;
            if (!_impl->closing)
            {
                log::warning("WebSocket {} closed: {}", _impl->url, reason);
                dispatchClose(reason);
            }
            return;
        }
    }
}

auto SocketTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::ConnectionError, "Transport not connected");

    auto const data = json::serialize(message);
    log::trace("-> {}", data);

    auto lock = std::lock_guard(_impl->curlMutex);
    if (!_impl->curl)
        return makeError(ErrorCode::ConnectionError, "Transport not connected");

    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto sent = size_t { 0 };
        auto const rc = curl_ws_send(_impl->curl, data.data() + offset, data.size() - offset, &sent, 0, CURLWS_TEXT);
        offset += sent;
        if (rc == CURLE_AGAIN)
        {
            waitSocket(_impl->socket, POLLOUT);
            continue;
        }
        if (rc != CURLE_OK)
            return makeError(ErrorCode::ConnectionError,
                             std::format("WebSocket send failed: {}", curl_easy_strerror(rc)));
    }
    return {};
}

void SocketTransport::disconnect()
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);
    if (!_impl->curl)
        return;

    _impl->closing = true;
    _impl->connected = false;

    _impl->reader.request_stop();
    if (_impl->reader.joinable())
    {
        if (_impl->reader.get_id() == std::this_thread::get_id())
            _impl->reader.detach();
        else
            _impl->reader.join();
    }

    {
        auto curlLock = std::lock_guard(_impl->curlMutex);
        auto sent = size_t { 0 };
        if (auto const rc = curl_ws_send(_impl->curl, "", 0, &sent, 0, CURLWS_CLOSE); rc != CURLE_OK)
            log::debug("WebSocket close frame to {} not sent: {}", _impl->url, curl_easy_strerror(rc));
        curl_easy_cleanup(_impl->curl);
        _impl->curl = nullptr;
        _impl->socket = CURL_SOCKET_BAD;
    }

    log::debug("WebSocket transport closed: {}", _impl->url);
}

auto SocketTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace mcpbridge
