// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

/// @brief A single dispatched server-sent event.
struct SseEvent
{
    std::string type; ///< Empty for data-only events ("message" by convention).
    std::string data; ///< Data lines joined with '\n'.
    std::string id;
};

/// @brief Incremental parser for text/event-stream bodies.
///
/// Chunks may split lines and events at arbitrary byte positions.
class SseParser
{
  public:
    /// @brief Receives each complete event; return false to stop parsing.
    using EventCallback = std::function<bool(const SseEvent& event)>;

    /// @brief Feeds a chunk of the stream.
    /// @return false if the callback asked to stop.
    auto feed(std::string_view chunk, const EventCallback& callback) -> bool;

    /// @brief Discards buffered input and the partially accumulated event.
    void reset();

    [[nodiscard]] auto hasBufferedData() const -> bool { return !_buffer.empty(); }

  private:
    auto processLine(std::string_view line, const EventCallback& callback) -> bool;
    auto dispatch(const EventCallback& callback) -> bool;

    std::string _buffer;
    std::string _eventType;
    std::string _eventId;
    std::vector<std::string> _dataLines;
};

} // namespace mcpbridge
