// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <print>

namespace podbuddy::log
{

namespace
{

    auto currentLevel = std::atomic<Level> { Level::Info };

    // Guards the sink and keeps lines from different threads from interleaving.
    auto sinkMutex = std::mutex {};
    auto currentSink = Sink {};

} // namespace

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "ERROR";
        case Level::Warning: return "WARN ";
        case Level::Info: return "INFO ";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?????";
}

void setSink(Sink sink)
{
    auto lock = std::lock_guard(sinkMutex);
    currentSink = std::move(sink);
}

void setLevel(Level level)
{
    currentLevel.store(level, std::memory_order_relaxed);
}

auto level() -> Level
{
    return currentLevel.load(std::memory_order_relaxed);
}

void write(Level messageLevel, std::string_view message)
{
    if (!enabled(messageLevel))
        return;

    auto lock = std::lock_guard(sinkMutex);
    if (currentSink)
    {
        currentSink(messageLevel, message);
        return;
    }

    auto const now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    std::println(stderr, "{:%H:%M:%S} [{}] {}", now, levelName(messageLevel), message);
}

} // namespace podbuddy::log
