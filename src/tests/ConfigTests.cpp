// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <novamind/App.hpp>
#include <novamind/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace novamind;

namespace
{
/// @brief Writes @p content to a file in the temp directory and returns its path.
auto writeTempFile(std::string_view name, std::string_view content) -> std::filesystem::path
{
    auto const path = std::filesystem::temp_directory_path() / name;
    auto file = std::ofstream(path);
    file << content;
    return path;
}
} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.logLevel == log::Level::Info);
    CHECK(config.pipeline.tokens.size() == 14);
    CHECK(config.pipeline.tokens.front() == "<|im_start|>system");
    CHECK(config.pipeline.forbiddenPhrases.size() == 12);
    CHECK(config.pipeline.roles.size() == 6);
    CHECK(config.pipeline.finalAnswerMarker == "final answer:");
    CHECK(config.pipeline.repetition.minWords == 20);
    CHECK(config.pipeline.repetition.halfPrefixLength == 100);
    CHECK(config.pipeline.box.width == 70);
    CHECK(config.pipeline.box.minInnerWidth == 20);
    CHECK(config.pipeline.box.border == tui::BorderStyle::Rounded);
    CHECK_FALSE(config.pipeline.box.title.has_value());
    CHECK(validate(config).has_value());
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = writeTempFile("novamind_test_config.json", R"({
        "logLevel": "debug",
        "sanitizer": {
            "tokens": ["<eos>", "<bos>"],
            "forbiddenPhrases": [
                { "phrase": "Note to self", "scope": "prefix" },
                { "phrase": "[internal]", "scope": "anywhere" },
                "Bare:"
            ],
            "rolePrefixes": ["Bot"],
            "finalAnswerMarker": "answer:"
        },
        "repetition": {
            "minWords": 10,
            "minSegmentLength": 15,
            "halfPrefixLength": 50,
            "thirdPrefixLength": 40
        },
        "box": {
            "width": 90,
            "minInnerWidth": 30,
            "margin": 1,
            "paddingLeft": 1,
            "paddingRight": 0,
            "border": "double",
            "title": "Nova"
        }
    })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;
    auto const& pipeline = config.pipeline;

    SECTION("log level")
    {
        CHECK(config.logLevel == log::Level::Debug);
    }

    SECTION("sanitizer")
    {
        CHECK(pipeline.tokens == std::vector<std::string> { "<eos>", "<bos>" });
        REQUIRE(pipeline.forbiddenPhrases.size() == 3);
        CHECK(pipeline.forbiddenPhrases[0] == ForbiddenPhrase { .phrase = "Note to self", .scope = PhraseScope::Prefix });
        CHECK(pipeline.forbiddenPhrases[1] == ForbiddenPhrase { .phrase = "[internal]", .scope = PhraseScope::Anywhere });
        CHECK(pipeline.forbiddenPhrases[2] == ForbiddenPhrase { .phrase = "Bare:", .scope = PhraseScope::Prefix });
        CHECK(pipeline.roles == std::vector<std::string> { "Bot" });
        CHECK(pipeline.finalAnswerMarker == "answer:");
    }

    SECTION("repetition")
    {
        CHECK(pipeline.repetition.minWords == 10);
        CHECK(pipeline.repetition.minSegmentLength == 15);
        CHECK(pipeline.repetition.halfPrefixLength == 50);
        CHECK(pipeline.repetition.thirdPrefixLength == 40);
    }

    SECTION("box")
    {
        CHECK(pipeline.box.width == 90);
        CHECK(pipeline.box.minInnerWidth == 30);
        CHECK(pipeline.box.margin == 1);
        CHECK(pipeline.box.paddingLeft == 1);
        CHECK(pipeline.box.paddingRight == 0);
        CHECK(pipeline.box.border == tui::BorderStyle::Double);
        CHECK(pipeline.box.title == "Nova");
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile keeps defaults for missing keys", "[config]")
{
    auto const tempPath = writeTempFile("novamind_test_partial.json", R"({ "box": { "width": 50 } })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(result->pipeline.box.width == 50);
    CHECK(result->pipeline.box.minInnerWidth == 20);
    CHECK(result->pipeline.roles == LineFilter::defaultRoles());
    CHECK(result->pipeline.forbiddenPhrases == LineFilter::defaultForbiddenPhrases());
    CHECK(result->logLevel == log::Level::Info);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile returns error for missing file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("parseConfig rejects malformed or unknown values", "[config]")
{
    SECTION("invalid JSON")
    {
        auto result = parseConfig("{ not valid json }");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("root is not an object")
    {
        CHECK(!parseConfig("[1, 2, 3]").has_value());
    }

    SECTION("unknown border style")
    {
        auto result = parseConfig(R"({ "box": { "border": "dotted" } })");
        REQUIRE(!result.has_value());
        CHECK(result.error().message.find("dotted") != std::string::npos);
    }

    SECTION("unknown phrase scope")
    {
        CHECK(!parseConfig(R"({ "sanitizer": { "forbiddenPhrases": [{ "phrase": "x", "scope": "suffix" }] } })")
                   .has_value());
    }

    SECTION("unknown log level")
    {
        CHECK(!parseConfig(R"({ "logLevel": "chatty" })").has_value());
    }

    SECTION("negative threshold")
    {
        CHECK(!parseConfig(R"({ "repetition": { "minWords": -1 } })").has_value());
    }
}

TEST_CASE("validate rejects unusable values", "[config]")
{
    auto config = AppConfig {};

    SECTION("minimum inner width below two")
    {
        config.pipeline.box.minInnerWidth = 1;
        auto const result = validate(config);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("negative padding")
    {
        config.pipeline.box.paddingLeft = -1;
        CHECK(!validate(config).has_value());
    }

    SECTION("negative margin")
    {
        config.pipeline.box.margin = -2;
        CHECK(!validate(config).has_value());
    }

    SECTION("empty final answer marker")
    {
        config.pipeline.finalAnswerMarker = "  ";
        CHECK(!validate(config).has_value());
    }

    SECTION("empty forbidden phrase")
    {
        config.pipeline.forbiddenPhrases.push_back(ForbiddenPhrase {});
        CHECK(!validate(config).has_value());
    }
}

TEST_CASE("saveConfigToFile writes a loadable file", "[config]")
{
    auto const tempDir = std::filesystem::temp_directory_path() / "novamind_test_save";
    auto const tempPath = tempDir / "config.json";
    std::filesystem::remove_all(tempDir);

    auto config = AppConfig {};
    config.logLevel = log::Level::Trace;
    config.pipeline.tokens = { "<x>" };
    config.pipeline.forbiddenPhrases = { { .phrase = "[meta]", .scope = PhraseScope::Anywhere } };
    config.pipeline.repetition.thirdPrefixLength = 60;
    config.pipeline.box.border = tui::BorderStyle::Heavy;
    config.pipeline.box.title = "Saved";
    config.pipeline.box.width = 80;

    auto const saveResult = saveConfigToFile(tempPath.string(), config);
    REQUIRE(saveResult.has_value());

    auto loaded = loadConfigFromFile(tempPath.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->logLevel == log::Level::Trace);
    CHECK(loaded->pipeline.tokens == config.pipeline.tokens);
    CHECK(loaded->pipeline.forbiddenPhrases == config.pipeline.forbiddenPhrases);
    CHECK(loaded->pipeline.roles == config.pipeline.roles);
    CHECK(loaded->pipeline.finalAnswerMarker == config.pipeline.finalAnswerMarker);
    CHECK(loaded->pipeline.repetition == config.pipeline.repetition);
    CHECK(loaded->pipeline.box.border == tui::BorderStyle::Heavy);
    CHECK(loaded->pipeline.box.title == "Saved");
    CHECK(loaded->pipeline.box.width == 80);

    std::filesystem::remove_all(tempDir);
}

TEST_CASE("log level names", "[config][log]")
{
    CHECK(log::parseLevel("warning") == log::Level::Warning);
    CHECK(log::parseLevel("trace") == log::Level::Trace);
    CHECK_FALSE(log::parseLevel("verbose").has_value());
    CHECK(log::levelName(log::Level::Error) == "error");
}

TEST_CASE("log callback receives messages at or above the level", "[config][log]")
{
    auto received = std::vector<std::string> {};
    log::setCallback([&](log::Level, std::string_view message) { received.emplace_back(message); });
    auto const previous = log::getLevel();
    log::setLevel(log::Level::Info);

    log::info("shown {}", 1);
    log::debug("hidden {}", 2);
    log::error("shown {}", 3);

    log::setCallback({});
    log::setLevel(previous);

    CHECK(received == std::vector<std::string> { "shown 1", "shown 3" });
}

TEST_CASE("readInput reads a file", "[config][app]")
{
    auto const tempPath = writeTempFile("novamind_test_input.txt", "Assistant: hello\n");

    auto const content = readInput(tempPath.string());
    REQUIRE(content.has_value());
    CHECK(*content == "Assistant: hello\n");

    auto const missing = readInput("/nonexistent/input.txt");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::IoError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("App initialize rejects an invalid configuration", "[config][app]")
{
    auto config = AppConfig {};
    config.pipeline.box.minInnerWidth = 0;

    auto app = App(std::move(config));
    auto const result = app.initialize();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}
