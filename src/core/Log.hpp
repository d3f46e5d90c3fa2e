// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace novamind::log
{

/// @brief Message severity, ordered from most to least important.
///
/// A message is emitted when its level is at or above the configured one,
/// i.e. when `level <= getLevel()`.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Sink that replaces stderr output, e.g. to capture messages in tests.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Parses the lowercase level name used in config files ("error" ... "trace").
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Inverse of parseLevel().
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Installs @p callback as the sink; an empty callback restores stderr.
void setCallback(LogCallback callback);

void setLevel(Level level);

[[nodiscard]] auto getLevel() -> Level;

/// @brief True if a message at @p level passes the current level filter.
[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Emits an already formatted message to the sink (stderr with a level tag by default).
void write(Level level, std::string_view message);

/// @brief Formats and emits a message, skipping the formatting when @p level is filtered out.
template <typename... Args>
void message(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(level))
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Info, fmt, std::forward<Args>(args)...);
}

/// @brief Pipeline heuristics report here when they fire.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Debug, fmt, std::forward<Args>(args)...);
}

/// @brief Per-line and per-token detail.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace novamind::log
