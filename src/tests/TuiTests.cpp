// SPDX-License-Identifier: Apache-2.0
#include <core/StringUtils.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <format>
#include <string>
#include <vector>

#include <tui/Box.hpp>
#include <tui/MarkdownRenderer.hpp>
#include <tui/TerminalOutput.hpp>
#include <tui/Text.hpp>

using namespace novamind::tui;

// =============================================================================
// Helper functions
// =============================================================================

namespace
{
/// @brief Splits rendered output into rows, dropping the empty piece after the final newline.
auto renderedRows(std::string_view buffer) -> std::vector<std::string>
{
    auto rows = std::vector<std::string> {};
    for (auto const row: novamind::splitLines(buffer))
        rows.emplace_back(row);
    if (!rows.empty() && rows.back().empty())
        rows.pop_back();
    return rows;
}

/// @brief Renders @p text in a box and returns the rows.
auto renderBoxRows(BoxConfig config, std::string_view text) -> std::vector<std::string>
{
    auto output = TerminalOutput { -1 };
    auto const box = Box { std::move(config) };
    box.render(output, box.layout(text));
    return renderedRows(output.buffer());
}
} // namespace

// =============================================================================
// Escape sequence and width tests
// =============================================================================

TEST_CASE("Text: escapeSequenceLength", "[tui][text]")
{
    CHECK(escapeSequenceLength("plain", 0) == 0);
    CHECK(escapeSequenceLength("\033[1m", 0) == 4);
    CHECK(escapeSequenceLength("\033[38;5;6mx", 0) == 9);
    CHECK(escapeSequenceLength("\033]8;;http://x\007", 0) == 14);
    CHECK(escapeSequenceLength("\033]0;title\033\\", 0) == 11);
    CHECK(escapeSequenceLength("\033M", 0) == 2);
    CHECK(escapeSequenceLength("\033[", 0) == 1);
    CHECK(escapeSequenceLength("\033", 0) == 1);
}

TEST_CASE("Text: stripAnsi", "[tui][text]")
{
    CHECK(stripAnsi("\033[1mbold\033[0m") == "bold");
    CHECK(stripAnsi("\033]8;;http://x\007link\033]8;;\007") == "link");
    CHECK(stripAnsi("no escapes") == "no escapes");
}

TEST_CASE("Text: displayWidth", "[tui][text]")
{
    SECTION("ASCII")
    {
        CHECK(displayWidth("") == 0);
        CHECK(displayWidth("abc") == 3);
    }

    SECTION("escape sequences have no width")
    {
        CHECK(displayWidth("\033[1mabc\033[0m") == 3);
        CHECK(displayWidth("\033[38;2;1;2;3m") == 0);
    }

    SECTION("East Asian wide characters")
    {
        CHECK(displayWidth("日本") == 4);
    }

    SECTION("combining marks join the base character")
    {
        CHECK(displayWidth("e\u0301") == 1);
    }

    SECTION("emoji")
    {
        CHECK(displayWidth("\U0001F44D") == 2);
        CHECK(displayWidth("\u2764\uFE0F") == 2); // heart with emoji presentation
    }

    SECTION("control characters")
    {
        CHECK(displayWidth("a\tb") == 2);
    }
}

// =============================================================================
// Word wrap tests
// =============================================================================

TEST_CASE("Text: wordWrap keeps words whole", "[tui][wrap]")
{
    auto const lines = wordWrap("Hello world foo bar", 10);
    CHECK(lines == std::vector<std::string> { "Hello", "world foo", "bar" });
}

TEST_CASE("Text: wordWrap keeps every line within the width", "[tui][wrap]")
{
    auto const text = std::string { "The quick brown fox jumps over the lazy dog and keeps running far away" };
    for (auto const width: { 5, 10, 17, 40 })
    {
        for (auto const& line: wordWrap(text, width))
        {
            INFO("width " << width << ": " << line);
            CHECK(displayWidth(line) <= width);
        }
    }
}

TEST_CASE("Text: wordWrap splits over-long words", "[tui][wrap]")
{
    SECTION("ASCII")
    {
        CHECK(wordWrap("abcdefghij", 4) == std::vector<std::string> { "abcd", "efgh", "ij" });
    }

    SECTION("preceding line is flushed first")
    {
        CHECK(wordWrap("ab cdefgh", 4) == std::vector<std::string> { "ab", "cdef", "gh" });
    }

    SECTION("wide characters")
    {
        CHECK(wordWrap("日本語", 3) == std::vector<std::string> { "日", "本", "語" });
    }

    SECTION("a grapheme wider than the width is taken alone")
    {
        auto const lines = wordWrap("日本", 1);
        CHECK(lines == std::vector<std::string> { "日", "本" });
    }

    SECTION("escape sequences are never split")
    {
        auto const lines = wordWrap("\033[1mabcdef\033[0m", 3);
        CHECK(lines == std::vector<std::string> { "\033[1mabc", "def\033[0m" });
    }
}

TEST_CASE("Text: wordWrap paragraphs", "[tui][wrap]")
{
    CHECK(wordWrap("a\n\n  \nb", 10) == std::vector<std::string> { "a", "", "", "b" });
    CHECK(wordWrap("", 10) == std::vector<std::string> { "" });
}

TEST_CASE("Text: wordWrap width of zero or less uses the default", "[tui][wrap]")
{
    auto const text = std::string(45, 'x');
    auto const lines = wordWrap(text, 0);
    REQUIRE(lines.size() == 2);
    CHECK(displayWidth(lines[0]) == DefaultWrapWidth);
    CHECK(wordWrap(text, -5) == lines);
}

TEST_CASE("Text: truncate", "[tui][text]")
{
    CHECK(truncate("short", 10) == "short");
    CHECK(truncate("Hello world", 8) == "Hello w\u2026");
    CHECK(displayWidth(truncate("日本語日本", 6)) <= 6);
    CHECK(truncate("anything", 0).empty());
}

// =============================================================================
// Bold markdown tests
// =============================================================================

TEST_CASE("MarkdownRenderer: bold spans become SGR bold", "[tui][markdown]")
{
    auto const rendered = renderBold("This is **bold** text");
    CHECK(rendered == std::format("This is {}bold{} text", SgrBold, SgrReset));
    CHECK(rendered.find("**") == std::string::npos);
    CHECK(countBoldSpans("This is **bold** text") == 1);
}

TEST_CASE("MarkdownRenderer: several spans", "[tui][markdown]")
{
    CHECK(renderBold("**a** and **b**") == std::format("{0}a{1} and {0}b{1}", SgrBold, SgrReset));
    CHECK(countBoldSpans("**a** and **b**") == 2);
}

TEST_CASE("MarkdownRenderer: unbalanced or empty markers are left alone", "[tui][markdown]")
{
    CHECK(renderBold("**") == "**");
    CHECK(renderBold("****") == "****");
    CHECK(renderBold("a ** b") == "a ** b");
    CHECK(renderBold("**open\nclose**") == "**open\nclose**");
    CHECK(countBoldSpans("**open\nclose**") == 0);
}

TEST_CASE("MarkdownRenderer: shortest span wins", "[tui][markdown]")
{
    CHECK(renderBold("**a**b**") == std::format("{}a{}b**", SgrBold, SgrReset));
    CHECK(renderBold("***a**") == std::format("{}*a{}", SgrBold, SgrReset));
}

// =============================================================================
// Box tests
// =============================================================================

TEST_CASE("Box: geometry", "[tui][box]")
{
    SECTION("defaults")
    {
        auto const box = Box { BoxConfig {} };
        CHECK(box.chrome() == 7);
        CHECK(box.innerWidth() == 63);
        CHECK(box.outerWidth() == 70);
    }

    SECTION("minimum inner width")
    {
        CHECK(computeInnerWidth(20, 7, 20) == 20);
        CHECK(computeInnerWidth(100, 7, 20) == 93);

        auto config = BoxConfig {};
        config.width = 10;
        auto const box = Box { config };
        CHECK(box.innerWidth() == 20);
        CHECK(box.outerWidth() == 27);
    }
}

TEST_CASE("Box: layout pads every line to the inner width", "[tui][box]")
{
    auto const box = Box { BoxConfig {} };
    auto const layout = box.layout("This is **bold** text and a rather long sentence that needs to wrap across "
                                   "more than one line of the bubble.\n\nSecond paragraph with 日本.");

    REQUIRE(layout.lines.size() > 2);
    CHECK(layout.innerWidth == box.innerWidth());
    for (auto const& line: layout.lines)
    {
        INFO(line.text);
        CHECK(displayWidth(line.text) + line.padding == layout.innerWidth);
    }
}

TEST_CASE("Box: layoutLines carries bold across wrapped lines", "[tui][box]")
{
    auto const layout = layoutLines(std::format("{}aaa bbb{}", SgrBold, SgrReset), 3);

    REQUIRE(layout.lines.size() == 2);
    CHECK(layout.lines[0].text == std::format("{}aaa{}", SgrBold, SgrReset));
    CHECK(layout.lines[1].text == std::format("{}bbb{}", SgrBold, SgrReset));
    CHECK(layout.lines[0].padding == 0);
    CHECK(layout.lines[1].padding == 0);
}

TEST_CASE("Box: every rendered row has the outer width", "[tui][box]")
{
    auto config = BoxConfig {};
    config.title = "NovaMind";

    auto const rows = renderBoxRows(config, "Hello there!\nThis is **bold** and 日本 text.");

    REQUIRE(rows.size() == 2 + 4);
    for (auto const& row: rows)
    {
        INFO(row);
        CHECK(displayWidth(row) == 70);
    }

    CHECK(rows.front().starts_with("  ╭─ NovaMind ─"));
    CHECK(rows.front().ends_with("╮"));
    CHECK(rows[1] == "  │" + std::string(66, ' ') + "│");
    CHECK(rows[2].starts_with("  │  Hello there!"));
    CHECK(rows.back().starts_with("  ╰─"));
    CHECK(rows.back().ends_with("╯"));
}

TEST_CASE("Box: border styles and titles", "[tui][box]")
{
    SECTION("without title")
    {
        auto expected = std::string { "  ╭" };
        for (auto i = 0; i < 66; ++i)
            expected += "─";
        expected += "╮";

        auto const rows = renderBoxRows(BoxConfig {}, "x");
        CHECK(rows.front() == expected);
    }

    SECTION("long title is truncated")
    {
        auto config = BoxConfig {};
        config.title = std::string(200, 't');
        for (auto const& row: renderBoxRows(config, "x"))
            CHECK(displayWidth(row) == 70);
    }

    SECTION("styled borders keep the width")
    {
        auto config = BoxConfig {};
        config.border = BorderStyle::Heavy;
        config.borderStyle.fg = static_cast<std::uint8_t>(6);
        config.titleStyle.bold = true;
        config.title = "T";

        auto const rows = renderBoxRows(config, "styled");
        for (auto const& row: rows)
            CHECK(displayWidth(row) == 70);
        CHECK(stripAnsi(rows.back()).starts_with("  ┗"));
    }

    SECTION("style names")
    {
        CHECK(parseBorderStyle("double") == BorderStyle::Double);
        CHECK(parseBorderStyle("Heavy") == BorderStyle::Heavy);
        CHECK_FALSE(parseBorderStyle("dashed").has_value());
        CHECK(borderStyleName(BorderStyle::Rounded) == "rounded");
        CHECK(BorderChars::fromStyle(BorderStyle::Single).topLeft == "┌");
    }
}

// =============================================================================
// TerminalOutput tests
// =============================================================================

TEST_CASE("TerminalOutput: styled writes are reset", "[tui][output]")
{
    auto output = TerminalOutput { -1 };

    output.write("plain");
    CHECK(output.buffer() == "plain");

    auto style = Style {};
    style.bold = true;
    style.fg = static_cast<std::uint8_t>(2);
    output.write("x", style);
    CHECK(output.buffer() == "plain\033[1;38;5;2mx\033[m");

    style = Style {};
    style.fg = RgbColor { .r = 1, .g = 2, .b = 3 };
    output.writeRaw("|");
    output.write("y", style);
    CHECK(output.buffer().ends_with("|\033[38;2;1;2;3my\033[m"));
}

TEST_CASE("TerminalOutput: defaults without a terminal", "[tui][output]")
{
    auto output = TerminalOutput { -1 };
    auto const result = output.initialize();
    CHECK(result.has_value());
    CHECK_FALSE(output.isTerminal());
    CHECK(output.columns() == TerminalOutput::DefaultColumns);
    CHECK(output.rows() == TerminalOutput::DefaultRows);
}

TEST_CASE("TerminalOutput: flush to an invalid descriptor fails", "[tui][output]")
{
    auto output = TerminalOutput { -1 };
    output.writeRaw("data");
    auto const result = output.flush();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == novamind::ErrorCode::IoError);
    CHECK(output.buffer().empty());
}
