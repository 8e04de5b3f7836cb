// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <print>
#include <string>

namespace parley::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto sinkMutex = std::mutex {};
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(sinkMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    auto lower = std::string(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "error")
        return Level::Error;
    if (lower == "warning" || lower == "warn")
        return Level::Warning;
    if (lower == "info")
        return Level::Info;
    if (lower == "debug")
        return Level::Debug;
    if (lower == "trace")
        return Level::Trace;
    return std::nullopt;
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
    return "info";
}

void write(Level level, std::string_view message)
{
    if (level > getLevel())
        return;

    auto lock = std::unique_lock(sinkMutex);

    // Invoked unlocked, so the callback may log or replace itself.
    if (auto callback = globalCallback)
    {
        lock.unlock();
        callback(level, message);
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

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace parley::log
