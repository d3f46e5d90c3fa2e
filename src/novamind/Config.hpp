// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <pipeline/OutputPipeline.hpp>

#include <string>
#include <string_view>

namespace novamind
{

/// @brief Top-level application configuration.
///
/// Every section of the config file is optional; missing keys keep their defaults.
/// @code{.json}
/// {
///     "logLevel": "info",
///     "sanitizer": {
///         "tokens": ["<|im_start|>", "<|im_end|>"],
///         "forbiddenPhrases": [{ "phrase": "System:", "scope": "prefix" }],
///         "rolePrefixes": ["Assistant", "User"],
///         "finalAnswerMarker": "final answer:"
///     },
///     "repetition": { "minWords": 20, "minSegmentLength": 30, "halfPrefixLength": 100, "thirdPrefixLength": 80 },
///     "box": { "width": 70, "minInnerWidth": 20, "margin": 2, "paddingLeft": 2, "paddingRight": 1,
///              "border": "rounded", "title": "NovaMind" }
/// }
/// @endcode
struct AppConfig
{
    PipelineConfig pipeline;
    log::Level logLevel = log::Level::Info;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file is not an error: the defaults are returned.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration, or a ConfigError for an unreadable file, malformed
///         JSON or an unknown border style, phrase scope or log level.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses the application configuration from a JSON document.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating its directory.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Checks that the configuration can drive the pipeline.
/// @return Success, or a ConfigError naming the first unusable value.
[[nodiscard]] auto validate(const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path.
/// $XDG_CONFIG_HOME/novamind, or ~/.config/novamind.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace novamind
