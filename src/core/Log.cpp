// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <mutex>
#include <print>

namespace webchat::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};
} // namespace

void setCallback(LogCallback callback)
{
    auto const lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "unknown";
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    constexpr auto levels = std::array { Level::Error, Level::Warning, Level::Info, Level::Debug, Level::Trace };
    for (auto const level: levels)
        if (name == levelName(level))
            return level;
    if (name == "warn")
        return Level::Warning;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    // Sessions log from their reader and init threads; keep lines whole.
    auto const lock = std::lock_guard(globalMutex);

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    constexpr auto levelPrefix = [](Level l) -> std::string_view {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    };

    auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    std::println(stderr, "{:%FT%T}Z [{}] {}", now, levelPrefix(level), message);
}

} // namespace webchat::log
