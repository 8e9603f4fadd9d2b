// SPDX-License-Identifier: Apache-2.0
#include "FrameCodec.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

namespace webchat
{

auto FrameCodec::feed(std::string_view chunk) -> std::vector<nlohmann::json>
{
    auto frames = std::vector<nlohmann::json> {};

    _buffer.append(chunk);

    auto start = size_t { 0 };
    while (true)
    {
        auto const newlinePos = _buffer.find('\n', start);
        if (newlinePos == std::string::npos)
            break;

        auto line = std::string_view(_buffer).substr(start, newlinePos - start);
        start = newlinePos + 1;

        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (line.empty())
            continue;

        auto parsed = json::parse(line);
        if (!parsed)
        {
            ++_droppedLines;
            log::warning("Dropping non-JSON line ({} bytes): {}", line.size(), json::preview(line));
            continue;
        }

        frames.push_back(std::move(*parsed));
    }

    _buffer.erase(0, start);
    return frames;
}

void FrameCodec::reset()
{
    _buffer.clear();
}

} // namespace webchat
