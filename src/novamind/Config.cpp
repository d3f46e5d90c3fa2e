// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/StringUtils.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace novamind
{

namespace
{
    /// @brief Reads a non-negative integer field.
    auto getSizeOr(const nlohmann::json& obj, std::string_view key, std::size_t defaultValue)
        -> Result<std::size_t>
    {
        auto const value = json::getIntOr(obj, key, static_cast<int>(defaultValue));
        if (value < 0)
            return makeError(ErrorCode::ConfigError, std::format("'{}' must not be negative, got {}", key, value));
        return static_cast<std::size_t>(value);
    }

    auto parseSanitizer(const nlohmann::json& sanitizer, PipelineConfig& pipeline) -> VoidResult
    {
        if (auto tokens = json::getStringList(sanitizer, "tokens"))
            pipeline.tokens = std::move(*tokens);

        if (auto roles = json::getStringList(sanitizer, "rolePrefixes"))
            pipeline.roles = std::move(*roles);

        pipeline.finalAnswerMarker =
            json::getStringOr(sanitizer, "finalAnswerMarker", AnswerExtractor::DefaultMarker);

        auto const* phrases = json::getArray(sanitizer, "forbiddenPhrases");
        if (!phrases)
            return {};

        pipeline.forbiddenPhrases.clear();
        for (auto const& entry: *phrases)
        {
            // A bare string is a prefix phrase.
            if (entry.is_string())
            {
                pipeline.forbiddenPhrases.push_back(
                    ForbiddenPhrase { .phrase = entry.get<std::string>(), .scope = PhraseScope::Prefix });
                continue;
            }
            if (!entry.is_object())
                continue;

            auto const scopeName = json::getStringOr(entry, "scope", "prefix");
            auto const scope = parsePhraseScope(scopeName);
            if (!scope)
                return makeError(ErrorCode::ConfigError, std::format("Unknown phrase scope: '{}'", scopeName));

            pipeline.forbiddenPhrases.push_back(
                ForbiddenPhrase { .phrase = json::getStringOr(entry, "phrase", ""), .scope = *scope });
        }
        return {};
    }

    auto parseRepetition(const nlohmann::json& repetition, RepetitionThresholds& thresholds) -> VoidResult
    {
        auto const defaults = RepetitionThresholds {};

        auto minWords = getSizeOr(repetition, "minWords", defaults.minWords);
        if (!minWords)
            return std::unexpected(minWords.error());
        auto minSegmentLength = getSizeOr(repetition, "minSegmentLength", defaults.minSegmentLength);
        if (!minSegmentLength)
            return std::unexpected(minSegmentLength.error());
        auto halfPrefixLength = getSizeOr(repetition, "halfPrefixLength", defaults.halfPrefixLength);
        if (!halfPrefixLength)
            return std::unexpected(halfPrefixLength.error());
        auto thirdPrefixLength = getSizeOr(repetition, "thirdPrefixLength", defaults.thirdPrefixLength);
        if (!thirdPrefixLength)
            return std::unexpected(thirdPrefixLength.error());

        thresholds = RepetitionThresholds {
            .minWords = *minWords,
            .minSegmentLength = *minSegmentLength,
            .halfPrefixLength = *halfPrefixLength,
            .thirdPrefixLength = *thirdPrefixLength,
        };
        return {};
    }

    auto parseBox(const nlohmann::json& box, tui::BoxConfig& config) -> VoidResult
    {
        auto const defaults = tui::BoxConfig {};
        config.width = json::getIntOr(box, "width", defaults.width);
        config.minInnerWidth = json::getIntOr(box, "minInnerWidth", defaults.minInnerWidth);
        config.margin = json::getIntOr(box, "margin", defaults.margin);
        config.paddingLeft = json::getIntOr(box, "paddingLeft", defaults.paddingLeft);
        config.paddingRight = json::getIntOr(box, "paddingRight", defaults.paddingRight);

        auto const borderName = json::getStringOr(box, "border", tui::borderStyleName(defaults.border));
        auto const border = tui::parseBorderStyle(borderName);
        if (!border)
            return makeError(ErrorCode::ConfigError, std::format("Unknown border style: '{}'", borderName));
        config.border = *border;

        if (auto title = json::getOptionalString(box, "title"))
            config.title = std::move(*title);
        return {};
    }
} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/novamind";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/novamind";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    auto const levelName = json::getStringOr(root, "logLevel", log::levelName(config.logLevel));
    auto const level = log::parseLevel(levelName);
    if (!level)
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level: '{}'", levelName));
    config.logLevel = *level;

    // Sanitizer section
    if (auto const* section = json::getObject(root, "sanitizer"))
    {
        if (auto result = parseSanitizer(*section, config.pipeline); !result)
            return std::unexpected(result.error());
    }

    // Repetition section
    if (auto const* section = json::getObject(root, "repetition"))
    {
        if (auto result = parseRepetition(*section, config.pipeline.repetition); !result)
            return std::unexpected(result.error());
    }

    // Box section
    if (auto const* section = json::getObject(root, "box"))
    {
        if (auto result = parseBox(*section, config.pipeline.box); !result)
            return std::unexpected(result.error());
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (config)
        log::debug("Loaded config from {}", path);
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    auto const& pipeline = config.pipeline;

    root["logLevel"] = log::levelName(config.logLevel);

    // Sanitizer section
    auto sanitizer = nlohmann::json::object();
    sanitizer["tokens"] = pipeline.tokens;
    auto phrases = nlohmann::json::array();
    for (auto const& entry: pipeline.forbiddenPhrases)
        phrases.push_back(nlohmann::json { { "phrase", entry.phrase }, { "scope", phraseScopeName(entry.scope) } });
    sanitizer["forbiddenPhrases"] = std::move(phrases);
    sanitizer["rolePrefixes"] = pipeline.roles;
    sanitizer["finalAnswerMarker"] = pipeline.finalAnswerMarker;
    root["sanitizer"] = std::move(sanitizer);

    // Repetition section
    auto repetition = nlohmann::json::object();
    repetition["minWords"] = pipeline.repetition.minWords;
    repetition["minSegmentLength"] = pipeline.repetition.minSegmentLength;
    repetition["halfPrefixLength"] = pipeline.repetition.halfPrefixLength;
    repetition["thirdPrefixLength"] = pipeline.repetition.thirdPrefixLength;
    root["repetition"] = std::move(repetition);

    // Box section
    auto box = nlohmann::json::object();
    box["width"] = pipeline.box.width;
    box["minInnerWidth"] = pipeline.box.minInnerWidth;
    box["margin"] = pipeline.box.margin;
    box["paddingLeft"] = pipeline.box.paddingLeft;
    box["paddingRight"] = pipeline.box.paddingRight;
    box["border"] = tui::borderStyleName(pipeline.box.border);
    if (pipeline.box.title)
        box["title"] = *pipeline.box.title;
    root["box"] = std::move(box);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write config file: {}", path));
    return {};
}

auto validate(const AppConfig& config) -> VoidResult
{
    auto const& box = config.pipeline.box;

    if (box.width < 1)
        return makeError(ErrorCode::ConfigError, std::format("box.width must be positive, got {}", box.width));
    if (box.minInnerWidth < 2)
        return makeError(ErrorCode::ConfigError,
                         std::format("box.minInnerWidth must be at least 2, got {}", box.minInnerWidth));
    if (box.margin < 0)
        return makeError(ErrorCode::ConfigError, std::format("box.margin must not be negative, got {}", box.margin));
    if (box.paddingLeft < 0 || box.paddingRight < 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("box paddings must not be negative, got {} and {}",
                                     box.paddingLeft,
                                     box.paddingRight));

    if (trim(config.pipeline.finalAnswerMarker).empty())
        return makeError(ErrorCode::ConfigError, "sanitizer.finalAnswerMarker must not be empty");

    for (auto const& entry: config.pipeline.forbiddenPhrases)
    {
        if (entry.phrase.empty())
            return makeError(ErrorCode::ConfigError, "sanitizer.forbiddenPhrases must not contain empty phrases");
    }

    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace novamind
