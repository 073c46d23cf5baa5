// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Theme.hpp
 * @brief Colors and column layout used to render log lines
 *
 * A Theme is plain data: one color pair per level, colors for the other
 * columns and the column widths. Formatters read it, nothing mutates it once
 * it is installed in the Registry.
 *
 * Two themes are built in:
 * - colorized : level badges and columns colored with ANSI escape sequences
 * - plain     : identical layout, every color set to Color::None
 *
 * Whether escape sequences are actually written also depends on the color
 * capability flag held by the Registry: a colorized theme renders exactly like
 * the plain theme when color is disabled.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "redlog/Level.hpp"
#include "redlog/platform.hpp"

namespace redlog
{
    /**
     * ANSI palette. The underlying values are the SGR foreground codes; the
     * same color is used as a background by adding 10.
     */
    enum class Color : std::uint8_t
    {
        None = 0,
        Black = 30,
        Red = 31,
        Green = 32,
        Yellow = 33,
        Blue = 34,
        Magenta = 35,
        Cyan = 36,
        White = 37,
        BrightBlack = 90,
        BrightRed = 91,
        BrightGreen = 92,
        BrightYellow = 93,
        BrightBlue = 94,
        BrightMagenta = 95,
        BrightCyan = 96,
        BrightWhite = 97,
    };

    /** Foreground and background color of a column. */
    struct ColorPair
    {
        Color foreground = Color::None;
        Color background = Color::None;
    };

    struct REDLOG_EXPORT Theme
    {
        /** Name used to select the theme from configuration. */
        std::string name;

        /** Badge colors, indexed by the underlying value of Level. */
        std::array<ColorPair, ALL_LEVELS.size()> levelColors{};

        ColorPair timestampColor{};
        ColorPair sourceColor{};
        ColorPair messageColor{};
        ColorPair fieldKeyColor{};
        ColorPair fieldValueColor{};

        /** Width of the "[source]" column, padded with spaces. */
        std::size_t sourceWidth = 12;

        /** Width the message is padded to when fields follow it. */
        std::size_t messageWidth = 44;

        [[nodiscard]]
        ColorPair const& colorFor(Level level) const noexcept
        {
            return levelColors[static_cast<std::size_t>(level)];
        }

        /** True if the theme assigns no color at all. */
        [[nodiscard]]
        bool isPlain() const noexcept;
    };

    namespace themes
    {
        /** The colorized theme (also known as "default"). */
        REDLOG_EXPORT
        Theme const& colorized();

        /** Same layout as colorized(), without any color. */
        REDLOG_EXPORT
        Theme const& plain();

        /**
         * Look a built-in theme up by name: "colorized", "default" or "plain".
         * @return The theme, or std::nullopt for an unknown name.
         */
        REDLOG_EXPORT
        std::optional<Theme> byName(std::string_view name);
    }
}
