// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace novamind
{

/// @brief Error codes for the failures that can occur at the edges of the pipeline.
///
/// The pipeline stages themselves never fail; only loading configuration and
/// reading input can.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
};

/// @brief Returns a short human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::ConfigError: return "config error";
    }
    return "unknown";
}

/// @brief A failure at the edge of the program: what kind, and a message naming the offending path or value.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Either the value of a fallible operation or the Error that prevented it.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result of a fallible operation that produces nothing on success.
using VoidResult = std::expected<void, Error>;

/// @brief Shorthand for `std::unexpected(Error { code, message })`, so fallible functions can
///        `return makeError(ErrorCode::IoError, ...);` directly.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace novamind

template <>
struct std::formatter<novamind::Error>: std::formatter<std::string>
{
    auto format(const novamind::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", novamind::errorCodeName(error.code), error.message), ctx);
    }
};
