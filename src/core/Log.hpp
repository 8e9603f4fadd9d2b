// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace webchat::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receives log messages instead of stderr.
/// @param message The formatted message, without level prefix or timestamp.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Routes log messages to @p callback; an empty callback reverts to stderr.
void setCallback(LogCallback callback);

void setLevel(Level level);

[[nodiscard]] auto getLevel() -> Level;

/// @brief Returns the lower-case name of @p level, as accepted by levelFromString().
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Parses a level name ("error", "warning", "info", "debug", "trace").
/// @param name The level name, case-sensitive.
/// @return The level, or std::nullopt if the name is not recognized.
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

/// @brief Writes a log message at the given level.
///
/// Without a callback the line goes to stderr as
/// "2024-05-01T12:00:00.123Z [INFO ] message".
/// Safe to call from multiple threads; lines are never interleaved.
void write(Level level, std::string_view message);

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Warning)
        write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Info)
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Debug)
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Trace)
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace webchat::log
