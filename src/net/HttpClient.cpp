// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <format>
#include <mutex>

namespace mcpbridge
{

namespace
{
    void ensureCurlInitialized()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    struct StreamState
    {
        HttpClient::ChunkCallback* onChunk = nullptr;
        std::stop_token stopToken;
        bool keepGoing = true;
    };

    auto writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t
    {
        auto const total = size * nmemb;
        static_cast<HttpResponse*>(userdata)->body.append(ptr, total);
        return total;
    }

    auto headerCallback(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t
    {
        auto const total = size * nmemb;
        auto const line = std::string_view(ptr, total);

        auto const colon = line.find(':');
        if (colon != std::string_view::npos)
        {
            auto value = line.substr(colon + 1);
            auto const start = value.find_first_not_of(" \t\r\n");
            auto const end = value.find_last_not_of(" \t\r\n");
            value = start == std::string_view::npos ? std::string_view {} : value.substr(start, end - start + 1);
            static_cast<HttpResponse*>(userdata)->headers[std::string(line.substr(0, colon))] = std::string(value);
        }
        return total;
    }

    auto streamCallback(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t
    {
        auto const total = size * nmemb;
        auto* state = static_cast<StreamState*>(userdata);
        if (!state->keepGoing || state->stopToken.stop_requested())
            return 0;

        state->keepGoing = (*state->onChunk)(std::string_view(ptr, total));
        return state->keepGoing ? total : 0;
    }

    auto progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int
    {
        auto* state = static_cast<StreamState*>(userdata);
        return state->stopToken.stop_requested() ? 1 : 0;
    }

    auto makeHeaderList(const HttpHeaders& headers) -> curl_slist*
    {
        curl_slist* list = nullptr;
        for (const auto& [key, value]: headers)
            list = curl_slist_append(list, std::format("{}: {}", key, value).c_str());
        return list;
    }
} // namespace

struct HttpClient::Impl
{
    std::mutex mutex;
    CURL* curl = nullptr;
    std::chrono::milliseconds timeout { 30000 };
    std::chrono::milliseconds connectTimeout { 10000 };

    void configure(const std::string& url, bool applyTotalTimeout);
    auto perform(std::string_view what, const std::string& url, curl_slist* headerList, HttpResponse& response)
        -> VoidResult;
};

void HttpClient::Impl::configure(const std::string& url, bool applyTotalTimeout)
{
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connectTimeout.count()));
    if (applyTotalTimeout && timeout.count() > 0)
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
}

auto HttpClient::Impl::perform(std::string_view what,
                               const std::string& url,
                               curl_slist* headerList,
                               HttpResponse& response) -> VoidResult
{
    if (headerList)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);

    auto const res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    if (headerList)
        curl_slist_free_all(headerList);

    if (res != CURLE_OK)
    {
        log::debug("HTTP {} {} failed: {}", what, url, curl_easy_strerror(res));
        return makeError(ErrorCode::IoError, std::format("HTTP {} {} failed: {}", what, url, curl_easy_strerror(res)));
    }

    log::debug("HTTP {} {} -> {}", what, url, response.status);
    return {};
}

HttpClient::HttpClient(): _impl(std::make_unique<Impl>())
{
    ensureCurlInitialized();
    _impl->curl = curl_easy_init();
}

HttpClient::~HttpClient()
{
    if (_impl->curl)
        curl_easy_cleanup(_impl->curl);
}

void HttpClient::setTimeout(std::chrono::milliseconds timeout)
{
    auto lock = std::lock_guard(_impl->mutex);
    _impl->timeout = timeout;
}

void HttpClient::setConnectTimeout(std::chrono::milliseconds timeout)
{
    auto lock = std::lock_guard(_impl->mutex);
    _impl->connectTimeout = timeout;
}

auto HttpClient::get(const std::string& url, const HttpHeaders& headers) -> Result<HttpResponse>
{
    auto lock = std::lock_guard(_impl->mutex);
    if (!_impl->curl)
        return makeError(ErrorCode::IoError, "libcurl handle not initialized");

    auto response = HttpResponse {};
    _impl->configure(url, true);
    curl_easy_setopt(_impl->curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(_impl->curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(_impl->curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(_impl->curl, CURLOPT_HEADERDATA, &response);

    return _impl->perform("GET", url, makeHeaderList(headers), response).transform([&] {
        return std::move(response);
    });
}

auto HttpClient::post(const std::string& url, std::string_view body, const HttpHeaders& headers)
    -> Result<HttpResponse>
{
    auto lock = std::lock_guard(_impl->mutex);
    if (!_impl->curl)
        return makeError(ErrorCode::IoError, "libcurl handle not initialized");

    auto response = HttpResponse {};
    _impl->configure(url, true);
    curl_easy_setopt(_impl->curl, CURLOPT_POST, 1L);
    curl_easy_setopt(_impl->curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(_impl->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(_impl->curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(_impl->curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(_impl->curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(_impl->curl, CURLOPT_HEADERDATA, &response);

    return _impl->perform("POST", url, makeHeaderList(headers), response).transform([&] {
        return std::move(response);
    });
}

auto HttpClient::getStream(const std::string& url,
                           const HttpHeaders& headers,
                           ChunkCallback onChunk,
                           std::stop_token stopToken) -> Result<HttpResponse>
{
    auto lock = std::lock_guard(_impl->mutex);
    if (!_impl->curl)
        return makeError(ErrorCode::IoError, "libcurl handle not initialized");

    auto response = HttpResponse {};
    auto state = StreamState { .onChunk = &onChunk, .stopToken = stopToken, .keepGoing = true };

    _impl->configure(url, false);
    curl_easy_setopt(_impl->curl, CURLOPT_WRITEFUNCTION, streamCallback);
    curl_easy_setopt(_impl->curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(_impl->curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(_impl->curl, CURLOPT_HEADERDATA, &response);
    curl_easy_setopt(_impl->curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(_impl->curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(_impl->curl, CURLOPT_XFERINFODATA, &state);

    auto result = _impl->perform("GET (stream)", url, makeHeaderList(headers), response);

    // Aborting from our side is a normal end of the stream.
    if (!result && (!state.keepGoing || stopToken.stop_requested()))
        return response;
    if (!result)
        return std::unexpected(result.error());
    return response;
}

} // namespace mcpbridge
