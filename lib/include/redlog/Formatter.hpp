// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Formatter.hpp
 * @brief Rendering of a log event into one line of text
 *
 * A Formatter is a pure function of its inputs: the event (LogEntry), the
 * active Theme and the color flag. It never writes anything itself; the
 * Logger hands the returned line to a Sink.
 *
 * The fields of a LogEntry are already shadow-resolved by the Logger (one
 * occurrence per key, ordered by last occurrence), so every formatter,
 * including user supplied ones, observes the same field order.
 *
 * Built-in formatters:
 * - DefaultFormatter     : aligned columns, used unless a logger overrides it
 *     12:04:05.123 [inf] [app.db]     connected                                    retry=3
 * - TimestampedFormatter : compact single-space layout
 *     [12:04:05] app.db inf: connected [retry=3]
 * - JsonFormatter        : one JSON object per line
 *     {"timestamp":"...","level":"info","source":"app.db","message":"connected","fields":{"retry":3}}
 *
 * The text formatters escape line breaks and tabs in the message and the
 * source ("\n", "\r", "\t"), so one event always renders as one line.
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>
#include "redlog/Field.hpp"
#include "redlog/Level.hpp"
#include "redlog/Theme.hpp"
#include "redlog/platform.hpp"

namespace redlog
{
    using Timepoint = std::chrono::system_clock::time_point;

    /**
     * Everything a formatter needs to render one line.
     * The views are only valid for the duration of the format() call.
     */
    struct LogEntry
    {
        Level level;
        std::string_view source;
        std::string_view message;
        std::vector<Field> fields;
        Timepoint timestamp;
    };

    /**
     * Formatter interface.
     *
     * Implementations must be safe to call concurrently from several threads
     * (the built-in ones hold no state).
     */
    class REDLOG_EXPORT Formatter
    {
    public:
        virtual ~Formatter();

        /**
         * Render entry as a single line, without line terminator.
         *
         * @param entry The event to render
         * @param theme Colors and layout to apply
         * @param colorEnabled When false no escape sequence may be produced,
         *        whatever colors the theme assigns.
         */
        [[nodiscard]]
        virtual std::string format(LogEntry const& entry, Theme const& theme, bool colorEnabled) const = 0;
    };

    /**
     * Column layout: timestamp, level badge, source, message, fields.
     * The source column is padded to Theme::sourceWidth, the message to
     * Theme::messageWidth when fields follow.
     */
    class REDLOG_EXPORT DefaultFormatter final : public Formatter
    {
    public:
        [[nodiscard]]
        std::string format(LogEntry const& entry, Theme const& theme, bool colorEnabled) const override;
    };

    class REDLOG_EXPORT TimestampedFormatter final : public Formatter
    {
    public:
        [[nodiscard]]
        std::string format(LogEntry const& entry, Theme const& theme, bool colorEnabled) const override;
    };

    /**
     * Compact JSON object per line. Field values keep their kind (numbers,
     * booleans and null are not quoted) and their order in the entry. The
     * theme and color flag are ignored.
     */
    class REDLOG_EXPORT JsonFormatter final : public Formatter
    {
    public:
        [[nodiscard]]
        std::string format(LogEntry const& entry, Theme const& theme, bool colorEnabled) const override;
    };

    /**
     * Wrap text in the escape sequences for colors, unless color is disabled
     * or both colors are Color::None, in which case text is returned as is.
     */
    REDLOG_EXPORT
    std::string colorize(std::string_view text, ColorPair colors, bool colorEnabled);
}
