// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>

namespace mcpbridge
{

/// @brief Outstanding requests of one connection, keyed by request id.
///
/// Each entry is removed exactly once: by its correlated response, by its
/// deadline, or by rejectAll(). Whoever removes an entry fulfills its promise.
/// Promises are always fulfilled outside the internal lock.
class PendingRequests
{
  public:
    PendingRequests();
    ~PendingRequests();

    PendingRequests(const PendingRequests&) = delete;
    PendingRequests& operator=(const PendingRequests&) = delete;

    /// @brief Registers a request and arms its deadline.
    /// @param id The request id.
    /// @param timeout Time until the request fails with RequestTimeoutError.
    /// @return The future the response is delivered to, or a ProtocolError if the id is in use.
    [[nodiscard]] auto add(int64_t id, std::chrono::milliseconds timeout)
        -> Result<std::future<Result<nlohmann::json>>>;

    /// @brief Completes a request.
    /// @return false if no request with that id is outstanding (late or unknown reply).
    auto complete(int64_t id, Result<nlohmann::json> result) -> bool;

    /// @brief Fails every outstanding request with the given error.
    void rejectAll(const Error& error);

    [[nodiscard]] auto contains(int64_t id) const -> bool;
    [[nodiscard]] auto size() const -> size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpbridge
