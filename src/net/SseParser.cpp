// SPDX-License-Identifier: Apache-2.0
#include "SseParser.hpp"

#include <core/Log.hpp>

namespace mcpbridge
{

auto SseParser::feed(std::string_view chunk, const EventCallback& callback) -> bool
{
    _buffer.append(chunk);

    auto pos = size_t { 0 };
    auto newlinePos = _buffer.find('\n', pos);
    while (newlinePos != std::string::npos)
    {
        auto lineEnd = newlinePos;
        if (lineEnd > pos && _buffer[lineEnd - 1] == '\r')
            --lineEnd;

        auto const keepGoing = processLine(std::string_view(_buffer).substr(pos, lineEnd - pos), callback);
        pos = newlinePos + 1;
        if (!keepGoing)
        {
            _buffer.erase(0, pos);
            return false;
        }
        newlinePos = _buffer.find('\n', pos);
    }

    _buffer.erase(0, pos);
    return true;
}

void SseParser::reset()
{
    _buffer.clear();
    _eventType.clear();
    _eventId.clear();
    _dataLines.clear();
}

auto SseParser::processLine(std::string_view line, const EventCallback& callback) -> bool
{
    if (line.empty())
        return dispatch(callback);

    if (line.front() == ':')
        return true; // comment / keep-alive

    auto field = line;
    auto value = std::string_view {};
    if (auto const colon = line.find(':'); colon != std::string_view::npos)
    {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ')
            value.remove_prefix(1);
    }

    if (field == "event")
        _eventType = value;
    else if (field == "data")
        _dataLines.emplace_back(value);
    else if (field == "id")
        _eventId = value;
    else if (field != "retry")
        log::debug("Ignoring unknown SSE field: {}", field);

    return true;
}

auto SseParser::dispatch(const EventCallback& callback) -> bool
{
    if (_dataLines.empty() && _eventType.empty())
        return true;

    auto event = SseEvent { .type = std::move(_eventType), .data = {}, .id = std::move(_eventId) };
    for (size_t i = 0; i < _dataLines.size(); ++i)
    {
        if (i > 0)
            event.data += '\n';
        event.data += _dataLines[i];
    }

    _eventType.clear();
    _eventId.clear();
    _dataLines.clear();

    return callback(event);
}

} // namespace mcpbridge
