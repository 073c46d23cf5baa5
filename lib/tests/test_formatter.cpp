// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_formatter.cpp
 * @brief Unit tests for themes and the built-in formatters
 *
 * The wall clock prefix depends on the local time zone, so the column layout
 * is checked on what follows it.
 */

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <picojson/picojson.h>
#include <redlog/Formatter.hpp>
#include <redlog/Sink.hpp>
#include <redlog/Theme.hpp>

using namespace redlog;

namespace
{
    // 2023-11-14T22:13:20.250Z
    Timepoint fixedTime()
    {
        return Timepoint{std::chrono::seconds{1'700'000'000}} + std::chrono::milliseconds{250};
    }

    LogEntry makeEntry(std::vector<Field> fields)
    {
        return LogEntry{Level::Error, "app.db", "conn failed", std::move(fields), fixedTime()};
    }
}

/**
 * @brief Built-in themes and lookup by name
 */
TEST_CASE("Themes", "[formatter][theme]")
{
    REQUIRE(themes::plain().isPlain());
    REQUIRE_FALSE(themes::colorized().isPlain());
    REQUIRE(themes::plain().name == "plain");

    REQUIRE(themes::byName("plain").has_value());
    REQUIRE(themes::byName("default")->name == themes::colorized().name);
    REQUIRE_FALSE(themes::byName("solarized").has_value());

    for (auto const level : ALL_LEVELS)
    {
        REQUIRE(themes::colorized().colorFor(level).foreground != Color::None);
    }
}

/**
 * @brief colorize() only emits escape sequences when asked to and when a color is set
 */
TEST_CASE("Colorize", "[formatter]")
{
    REQUIRE(colorize("text", ColorPair{Color::Red, Color::None}, true) == "\x1b[31mtext\x1b[0m");
    REQUIRE(colorize("text", ColorPair{Color::Red, Color::None}, false) == "text");
    REQUIRE(colorize("text", ColorPair{}, true) == "text");
    REQUIRE(colorize("text", ColorPair{Color::None, Color::Blue}, true).find("\x1b[") != std::string::npos);
}

/**
 * @brief Default layout: badge, padded source, message padded only when fields follow
 */
TEST_CASE("DefaultFormatter layout", "[formatter]")
{
    auto const formatter = DefaultFormatter{};

    auto const withFields = formatter.format(makeEntry({field("retry", 3), field("host", "db 1")}), themes::plain(), false);
    REQUIRE(withFields.size() > 13U);
    REQUIRE(withFields[2] == ':');
    REQUIRE(withFields[8] == '.');
    REQUIRE(withFields.substr(13) == "[err] [app.db]     conn failed" + std::string(33, ' ') + "retry=3 host=\"db 1\"");

    auto const withoutFields = formatter.format(makeEntry({}), themes::plain(), false);
    REQUIRE(withoutFields.substr(13) == "[err] [app.db]     conn failed");

    auto entry = makeEntry({});
    entry.source = "";
    REQUIRE(formatter.format(entry, themes::plain(), false).substr(13) == "[err]" + std::string(14, ' ') + "conn failed");

    // A message longer than the column is still separated from its fields
    auto const longMessage = std::string(60, 'm');
    entry.message = longMessage;
    entry.fields = {field("k", "v")};
    auto const longLine = formatter.format(entry, themes::plain(), false);
    REQUIRE(longLine.find(std::string(60, 'm') + " k=v") != std::string::npos);
}

/**
 * @brief A colorized theme renders exactly like the plain one when color is off
 */
TEST_CASE("DefaultFormatter color flag", "[formatter]")
{
    auto const formatter = DefaultFormatter{};
    auto const entry = makeEntry({field("retry", 3)});

    auto const plain = formatter.format(entry, themes::plain(), true);
    auto const colorOff = formatter.format(entry, themes::colorized(), false);
    auto const colorOn = formatter.format(entry, themes::colorized(), true);

    REQUIRE(plain.find('\x1b') == std::string::npos);
    REQUIRE(colorOff == plain);
    REQUIRE(colorOn.find("\x1b[") != std::string::npos);
    REQUIRE(colorOn != plain);
}

/**
 * @brief Compact layout with bracketed, comma separated fields
 */
TEST_CASE("TimestampedFormatter layout", "[formatter]")
{
    auto const formatter = TimestampedFormatter{};

    auto const line = formatter.format(makeEntry({field("retry", 3), field("ok", true)}), themes::plain(), false);
    REQUIRE(line.front() == '[');
    REQUIRE(line[9] == ']');
    REQUIRE(line.substr(10) == " app.db err: conn failed [retry=3, ok=true]");

    REQUIRE(formatter.format(makeEntry({}), themes::plain(), false).substr(10) == " app.db err: conn failed");
}

/**
 * @brief One JSON object per line, field kinds preserved
 */
TEST_CASE("JsonFormatter", "[formatter]")
{
    auto const formatter = JsonFormatter{};
    auto const line = formatter.format(makeEntry({field("retry", 3), field("ratio", 0.5), field("ok", true), field("none", nullptr), field("host", "db 1")}),
        themes::colorized(),
        true);

    REQUIRE(line.find('\n') == std::string::npos);
    REQUIRE(line.find('\x1b') == std::string::npos);

    auto value = picojson::value{};
    REQUIRE(picojson::parse(value, line).empty());
    REQUIRE(value.is<picojson::object>());

    auto const& root = value.get<picojson::object>();
    REQUIRE(root.at("timestamp").get<std::string>() == "2023-11-14T22:13:20.250Z");
    REQUIRE(root.at("level").get<std::string>() == "error");
    REQUIRE(root.at("source").get<std::string>() == "app.db");
    REQUIRE(root.at("message").get<std::string>() == "conn failed");

    auto const& fields = root.at("fields").get<picojson::object>();
    REQUIRE(fields.size() == 5U);
    REQUIRE(fields.at("retry").get<std::int64_t>() == 3);
    REQUIRE(fields.at("ratio").get<double>() == 0.5);
    REQUIRE(fields.at("ok").get<bool>());
    REQUIRE(fields.at("none").is<picojson::null>());
    REQUIRE(fields.at("host").get<std::string>() == "db 1");

    auto const bare = formatter.format(makeEntry({}), themes::plain(), false);
    REQUIRE(bare.find("\"fields\"") == std::string::npos);
}

/**
 * @brief Line breaks in a message never split the rendered line
 */
TEST_CASE("Formatters escape line breaks", "[formatter]")
{
    auto entry = makeEntry({field("k", "v")});
    entry.message = "first\nsecond\r\tthird";

    auto const line = DefaultFormatter{}.format(entry, themes::plain(), false);
    REQUIRE(line.find('\n') == std::string::npos);
    REQUIRE(line.find('\r') == std::string::npos);
    REQUIRE(line.find(R"(first\nsecond\r\tthird)") != std::string::npos);
    REQUIRE(line.find(R"(third)" + std::string(22, ' ') + "k=v") != std::string::npos);

    auto const compact = TimestampedFormatter{}.format(entry, themes::plain(), false);
    REQUIRE(compact.substr(10) == R"( app.db err: first\nsecond\r\tthird [k=v])");

    // One emit, one physical line, whatever the sink
    auto stream = std::ostringstream{};
    auto sink = ConsoleSink{stream};
    sink.write(line);
    REQUIRE(stream.str() == line + "\n");
}

/**
 * @brief JSON output keeps the fixed key order and the order of the fields
 */
TEST_CASE("JsonFormatter field order", "[formatter]")
{
    auto const formatter = JsonFormatter{};

    auto const line = formatter.format(makeEntry({field("zeta", 1), field("alpha", 2), field("mid", "x")}), themes::plain(), false);
    REQUIRE(line ==
            R"({"timestamp":"2023-11-14T22:13:20.250Z","level":"error","source":"app.db","message":"conn failed",)"
            R"("fields":{"zeta":1,"alpha":2,"mid":"x"}})");

    auto entry = makeEntry({});
    entry.message = "say \"hi\"\n";
    auto const escaped = formatter.format(entry, themes::plain(), false);
    REQUIRE(escaped.find(R"("message":"say \"hi\"\n")") != std::string::npos);

    auto value = picojson::value{};
    REQUIRE(picojson::parse(value, escaped).empty());
    REQUIRE(value.get<picojson::object>().at("message").get<std::string>() == "say \"hi\"\n");
}
