// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace mcpbridge
{

using HttpHeaders = std::map<std::string, std::string>;

/// @brief A completed HTTP exchange.
struct HttpResponse
{
    long status = 0;
    std::string body;
    HttpHeaders headers;

    [[nodiscard]] auto isSuccess() const -> bool { return status >= 200 && status < 300; }
};

/// @brief Blocking HTTP client over a single libcurl easy handle.
///
/// Calls on one instance are serialized. Use separate instances for a
/// long-running stream and concurrent requests.
class HttpClient
{
  public:
    /// @brief Receives each body chunk of a streamed response; return false to abort.
    using ChunkCallback = std::function<bool(std::string_view chunk)>;

    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// @brief Sets the total transfer timeout of get() and post(); zero disables it.
    void setTimeout(std::chrono::milliseconds timeout);

    /// @brief Sets the connection establishment timeout.
    void setConnectTimeout(std::chrono::milliseconds timeout);

    /// @brief Performs a GET request.
    /// @return The response (any status), or an IoError if no response was received.
    [[nodiscard]] auto get(const std::string& url, const HttpHeaders& headers = {}) -> Result<HttpResponse>;

    /// @brief Performs a POST request.
    /// @return The response (any status), or an IoError if no response was received.
    [[nodiscard]] auto post(const std::string& url, std::string_view body, const HttpHeaders& headers = {})
        -> Result<HttpResponse>;

    /// @brief Performs a GET request and delivers the body incrementally.
    ///
    /// Blocks until the server ends the stream, the callback returns false,
    /// or stop is requested on @p stopToken. The transfer has no total timeout.
    /// @return The response status and headers (empty body), or an IoError.
    [[nodiscard]] auto getStream(const std::string& url,
                                 const HttpHeaders& headers,
                                 ChunkCallback onChunk,
                                 std::stop_token stopToken = {}) -> Result<HttpResponse>;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpbridge
