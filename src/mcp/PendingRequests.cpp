// SPDX-License-Identifier: Apache-2.0
#include "PendingRequests.hpp"

#include <core/Log.hpp>

#include <condition_variable>
#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace mcpbridge
{

namespace
{
    using Clock = std::chrono::steady_clock;

    struct Entry
    {
        std::promise<Result<nlohmann::json>> promise;
        Clock::time_point deadline;
    };
} // namespace

struct PendingRequests::Impl
{
    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::map<int64_t, Entry> entries;
    uint64_t generation = 0; // bumped on every change to entries
    std::jthread deadlineThread;

    void deadlineLoop(std::stop_token stopToken);
    auto takeExpired(Clock::time_point now) -> std::vector<std::pair<int64_t, Entry>>;
    [[nodiscard]] auto nextDeadline() const -> std::optional<Clock::time_point>;
};

auto PendingRequests::Impl::nextDeadline() const -> std::optional<Clock::time_point>
{
    auto earliest = std::optional<Clock::time_point> {};
    for (const auto& [id, entry]: entries)
    {
        if (!earliest || entry.deadline < *earliest)
            earliest = entry.deadline;
    }
    return earliest;
}

auto PendingRequests::Impl::takeExpired(Clock::time_point now) -> std::vector<std::pair<int64_t, Entry>>
{
    auto expired = std::vector<std::pair<int64_t, Entry>> {};
    for (auto it = entries.begin(); it != entries.end();)
    {
        if (it->second.deadline <= now)
        {
            expired.emplace_back(it->first, std::move(it->second));
            it = entries.erase(it);
        }
        else
            ++it;
    }
    return expired;
}

void PendingRequests::Impl::deadlineLoop(std::stop_token stopToken)
{
    while (!stopToken.stop_requested())
    {
        auto expired = std::vector<std::pair<int64_t, Entry>> {};
        {
            auto lock = std::unique_lock(mutex);
            auto const deadline = nextDeadline();
            if (!deadline)
            {
                cv.wait(lock, stopToken, [this] { return !entries.empty(); });
                continue;
            }

            // Re-evaluates the earliest deadline whenever the set of entries changes.
            auto const seen = generation;
            cv.wait_until(lock, stopToken, *deadline, [&] { return generation != seen; });
            expired = takeExpired(Clock::now());
        }

        for (auto& [id, entry]: expired)
        {
            log::debug("Request {} timed out", id);
            entry.promise.set_value(
                makeError(ErrorCode::RequestTimeoutError, std::format("Request {} timed out", id)));
        }
    }
}

PendingRequests::PendingRequests(): _impl(std::make_unique<Impl>())
{
    _impl->deadlineThread = std::jthread([this](std::stop_token stopToken) { _impl->deadlineLoop(stopToken); });
}

PendingRequests::~PendingRequests()
{
    _impl->deadlineThread.request_stop();
    if (_impl->deadlineThread.joinable())
        _impl->deadlineThread.join();
    rejectAll(Error { ErrorCode::ConnectionError, "Connection closed" });
}

auto PendingRequests::add(int64_t id, std::chrono::milliseconds timeout)
    -> Result<std::future<Result<nlohmann::json>>>
{
    auto future = std::future<Result<nlohmann::json>> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->entries.contains(id))
            return makeError(ErrorCode::ProtocolError, std::format("Request id {} is already pending", id));

        auto entry = Entry { .promise = {}, .deadline = Clock::now() + timeout };
        future = entry.promise.get_future();
        _impl->entries.emplace(id, std::move(entry));
        ++_impl->generation;
    }
    _impl->cv.notify_all();
    return future;
}

auto PendingRequests::complete(int64_t id, Result<nlohmann::json> result) -> bool
{
    auto promise = std::promise<Result<nlohmann::json>> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        auto const it = _impl->entries.find(id);
        if (it == _impl->entries.end())
            return false;
        promise = std::move(it->second.promise);
        _impl->entries.erase(it);
        ++_impl->generation;
    }
    _impl->cv.notify_all();
    promise.set_value(std::move(result));
    return true;
}

void PendingRequests::rejectAll(const Error& error)
{
    auto drained = std::map<int64_t, Entry> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        drained.swap(_impl->entries);
        ++_impl->generation;
    }
    _impl->cv.notify_all();

    for (auto& [id, entry]: drained)
        entry.promise.set_value(std::unexpected(error));
}

auto PendingRequests::contains(int64_t id) const -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->entries.contains(id);
}

auto PendingRequests::size() const -> size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->entries.size();
}

} // namespace mcpbridge
