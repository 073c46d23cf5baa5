// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Formatter.cpp
 * @brief The built-in formatters
 *
 * All three formatters render fields in the order given by the LogEntry; the
 * Logger has already collapsed duplicate keys. Escape sequences come from
 * fmt/color.h and are only produced through colorize(), which is the single
 * place that honors the color flag.
 */

#include "redlog/Formatter.hpp"
#include <algorithm>
#include <cstdint>
#include <ctime>
#include <fmt/color.h>
#include <fmt/format.h>
#include <picojson/picojson.h>
#include "internal/VariantUtils.hpp"

namespace redlog
{
    namespace
    {
        struct BrokenDownTime
        {
            std::tm tm;
            int milliseconds;
        };

        BrokenDownTime breakDown(Timepoint timestamp, bool utc) noexcept
        {
            auto const time = std::chrono::system_clock::to_time_t(timestamp);
            auto const sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch());

            auto result = BrokenDownTime{};
            if (utc)
            {
                ::gmtime_r(&time, &result.tm);
            }
            else
            {
                ::localtime_r(&time, &result.tm);
            }
            result.milliseconds = static_cast<int>(((sinceEpoch.count() % 1000) + 1000) % 1000);
            return result;
        }

        /** Local wall clock, "HH:MM:SS.mmm" or "HH:MM:SS". */
        std::string formatClock(Timepoint timestamp, bool withMilliseconds)
        {
            auto const t = breakDown(timestamp, false);
            if (withMilliseconds)
            {
                return fmt::format("{:02}:{:02}:{:02}.{:03}", t.tm.tm_hour, t.tm.tm_min, t.tm.tm_sec, t.milliseconds);
            }
            return fmt::format("{:02}:{:02}:{:02}", t.tm.tm_hour, t.tm.tm_min, t.tm.tm_sec);
        }

        /** ISO-8601 in UTC with millisecond precision, e.g. "2026-10-19T08:15:02.250Z". */
        std::string formatIsoTimestamp(Timepoint timestamp)
        {
            auto const t = breakDown(timestamp, true);
            return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                t.tm.tm_year + 1900,
                t.tm.tm_mon + 1,
                t.tm.tm_mday,
                t.tm.tm_hour,
                t.tm.tm_min,
                t.tm.tm_sec,
                t.milliseconds);
        }

        std::string renderField(Field const& field, Theme const& theme, bool colorEnabled)
        {
            return colorize(field.key(), theme.fieldKeyColor, colorEnabled) + "=" + colorize(field.renderedValue(), theme.fieldValueColor, colorEnabled);
        }

        /** Replace line breaks and tabs by their escapes so a message never spans several lines. */
        std::string escapeLineBreaks(std::string_view text)
        {
            auto result = std::string{};
            result.reserve(text.size());
            for (auto const c : text)
            {
                switch (c)
                {
                    case '\n': result.append("\\n"); break;
                    case '\r': result.append("\\r"); break;
                    case '\t': result.append("\\t"); break;
                    default:   result.push_back(c); break;
                }
            }
            return result;
        }

        std::string toJsonString(std::string_view text)
        {
            return picojson::value{std::string{text}}.serialize();
        }

        picojson::value toJson(FieldValue const& value)
        {
            return std::visit(
                internal::overloaded{
                    [](std::nullptr_t) { return picojson::value{}; },
                    [](bool b) { return picojson::value{b}; },
                    [](std::int64_t i) { return picojson::value{i}; },
                    [](double d) { return picojson::value{d}; },
                    [](std::string const& s) { return picojson::value{s}; },
                },
                value);
        }
    }

    Formatter::~Formatter() = default;

    std::string colorize(std::string_view text, ColorPair colors, bool colorEnabled)
    {
        if (!colorEnabled || ((colors.foreground == Color::None) && (colors.background == Color::None)))
        {
            return std::string{text};
        }

        auto style = fmt::text_style{};
        if (colors.foreground != Color::None)
        {
            style |= fmt::fg(static_cast<fmt::terminal_color>(colors.foreground));
        }
        if (colors.background != Color::None)
        {
            style |= fmt::bg(static_cast<fmt::terminal_color>(colors.background));
        }
        return fmt::format(style, "{}", text);
    }

    std::string DefaultFormatter::format(LogEntry const& entry, Theme const& theme, bool colorEnabled) const
    {
        auto line = colorize(formatClock(entry.timestamp, true), theme.timestampColor, colorEnabled);
        line.push_back(' ');

        line += colorize(fmt::format("[{}]", levelShortName(entry.level)), theme.colorFor(entry.level), colorEnabled);
        line.push_back(' ');

        // Padding is computed on the visible text, escape sequences excluded.
        if (!entry.source.empty())
        {
            auto const source = fmt::format("[{}]", escapeLineBreaks(entry.source));
            line += colorize(source, theme.sourceColor, colorEnabled);
            line.append(theme.sourceWidth > source.size() ? theme.sourceWidth - source.size() : 0U, ' ');
        }
        else
        {
            line.append(theme.sourceWidth, ' ');
        }
        line.push_back(' ');

        auto const message = escapeLineBreaks(entry.message);
        line += colorize(message, theme.messageColor, colorEnabled);

        if (!entry.fields.empty())
        {
            line.append(std::max<std::size_t>(1U, theme.messageWidth > message.size() ? theme.messageWidth - message.size() : 0U), ' ');

            auto first = true;
            for (auto const& field : entry.fields)
            {
                if (!first)
                {
                    line.push_back(' ');
                }
                first = false;
                line += renderField(field, theme, colorEnabled);
            }
        }

        return line;
    }

    std::string TimestampedFormatter::format(LogEntry const& entry, Theme const& theme, bool colorEnabled) const
    {
        auto line = fmt::format("[{}]", formatClock(entry.timestamp, false));

        if (!entry.source.empty())
        {
            line.push_back(' ');
            line += colorize(escapeLineBreaks(entry.source), theme.sourceColor, colorEnabled);
        }

        line.push_back(' ');
        line += colorize(levelShortName(entry.level), theme.colorFor(entry.level), colorEnabled);
        line += ": ";
        line += colorize(escapeLineBreaks(entry.message), theme.messageColor, colorEnabled);

        if (!entry.fields.empty())
        {
            line += " [";
            auto first = true;
            for (auto const& field : entry.fields)
            {
                if (!first)
                {
                    line += ", ";
                }
                first = false;
                line += renderField(field, theme, colorEnabled);
            }
            line.push_back(']');
        }

        return line;
    }

    std::string JsonFormatter::format(LogEntry const& entry, Theme const&, bool) const
    {
        // Written by hand: picojson::object is ordered by key, fields must keep their order.
        auto line = fmt::format(R"({{"timestamp":{},"level":{},"source":{},"message":{})",
            toJsonString(formatIsoTimestamp(entry.timestamp)),
            toJsonString(levelName(entry.level)),
            toJsonString(entry.source),
            toJsonString(entry.message));

        if (!entry.fields.empty())
        {
            line += R"(,"fields":{)";
            auto first = true;
            for (auto const& field : entry.fields)
            {
                if (!first)
                {
                    line.push_back(',');
                }
                first = false;
                line += toJsonString(field.key());
                line.push_back(':');
                line += toJson(field.value()).serialize();
            }
            line.push_back('}');
        }

        line.push_back('}');
        return line;
    }
}
