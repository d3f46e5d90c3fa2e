// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <array>
#include <atomic>
#include <mutex>
#include <print>
#include <utility>

namespace novamind::log
{

namespace
{
    struct LevelEntry
    {
        Level level;
        std::string_view name;
        std::string_view prefix;
    };

    constexpr auto Levels = std::array<LevelEntry, 5> { {
        { .level = Level::Error, .name = "error", .prefix = "ERROR" },
        { .level = Level::Warning, .name = "warning", .prefix = "WARN " },
        { .level = Level::Info, .name = "info", .prefix = "INFO " },
        { .level = Level::Debug, .name = "debug", .prefix = "DEBUG" },
        { .level = Level::Trace, .name = "trace", .prefix = "TRACE" },
    } };

    // The pipeline may run from several sessions at once; only the sink needs guarding.
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto callbackMutex = std::mutex {};

    auto entryFor(Level level) -> LevelEntry const&
    {
        for (auto const& entry: Levels)
            if (entry.level == level)
                return entry;
        return Levels.front();
    }
} // namespace

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    for (auto const& entry: Levels)
        if (entry.name == name)
            return entry.level;
    return std::nullopt;
}

auto levelName(Level level) -> std::string_view
{
    return entryFor(level).name;
}

void setCallback(LogCallback callback)
{
    auto const lock = std::lock_guard { callbackMutex };
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

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto const lock = std::lock_guard { callbackMutex };
    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    std::println(stderr, "[{}] {}", entryFor(level).prefix, message);
}

} // namespace novamind::log
