// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <string_view>
#include <utility>

namespace podbuddy::log
{

/// @brief Verbosity level, ordered from most to least severe.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receives every message that passes the level filter, without prefix.
using Sink = std::function<void(Level level, std::string_view message)>;

/// @brief Routes messages to @p sink instead of stderr. An empty sink restores stderr.
///
/// The sink is called under a lock, possibly from the generation and playback threads.
void setSink(Sink sink);

void setLevel(Level level);

[[nodiscard]] auto level() -> Level;

/// @brief Returns true if messages at @p messageLevel are currently written.
[[nodiscard]] inline auto enabled(Level messageLevel) -> bool
{
    return messageLevel <= level();
}

/// @brief Five-character label used in the stderr prefix.
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Writes a preformatted message. Without a sink: "HH:MM:SS [LEVEL] message" on stderr.
void write(Level level, std::string_view message);

/// @brief Formats and writes a message; formatting is skipped when the level is filtered out.
template <typename... Args>
void print(Level messageLevel, std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(messageLevel))
        write(messageLevel, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Debug, fmt, std::forward<Args>(args)...);
}

/// @brief Per-token and per-sample chatter; off unless explicitly enabled.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace podbuddy::log
