// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Theme.cpp
 * @brief The built-in themes
 *
 * Level palette of the colorized theme:
 *
 *   critical  bright magenta      verbose   blue
 *   error     red                 trace     white
 *   warn      yellow              debug     bright black
 *   info      green               pedantic  bright black
 *                                 annoying  bright black
 */

#include "redlog/Theme.hpp"
#include <algorithm>

namespace redlog
{
    namespace
    {
        Theme makeColorizedTheme()
        {
            auto theme = Theme{};
            theme.name = "colorized";

            auto const setLevelColor = [&theme](Level level, Color color)
            {
                theme.levelColors[static_cast<std::size_t>(level)] = ColorPair{color, Color::None};
            };
            setLevelColor(Level::Critical, Color::BrightMagenta);
            setLevelColor(Level::Error, Color::Red);
            setLevelColor(Level::Warn, Color::Yellow);
            setLevelColor(Level::Info, Color::Green);
            setLevelColor(Level::Verbose, Color::Blue);
            setLevelColor(Level::Trace, Color::White);
            setLevelColor(Level::Debug, Color::BrightBlack);
            setLevelColor(Level::Pedantic, Color::BrightBlack);
            setLevelColor(Level::Annoying, Color::BrightBlack);

            theme.timestampColor = ColorPair{Color::BrightBlack, Color::None};
            theme.sourceColor = ColorPair{Color::Cyan, Color::None};
            theme.messageColor = ColorPair{Color::White, Color::None};
            theme.fieldKeyColor = ColorPair{Color::BrightCyan, Color::None};
            theme.fieldValueColor = ColorPair{Color::White, Color::None};
            return theme;
        }

        Theme makePlainTheme()
        {
            // Default-constructed ColorPairs are all Color::None.
            auto theme = Theme{};
            theme.name = "plain";
            return theme;
        }

        constexpr bool hasColor(ColorPair const& pair) noexcept
        {
            return (pair.foreground != Color::None) || (pair.background != Color::None);
        }
    }

    bool Theme::isPlain() const noexcept
    {
        return std::none_of(levelColors.begin(), levelColors.end(), hasColor) && !hasColor(timestampColor) && !hasColor(sourceColor) &&
               !hasColor(messageColor) && !hasColor(fieldKeyColor) && !hasColor(fieldValueColor);
    }

    namespace themes
    {
        Theme const& colorized()
        {
            static auto const theme = makeColorizedTheme();
            return theme;
        }

        Theme const& plain()
        {
            static auto const theme = makePlainTheme();
            return theme;
        }

        std::optional<Theme> byName(std::string_view name)
        {
            if ((name == "colorized") || (name == "default"))
            {
                return colorized();
            }
            if (name == "plain")
            {
                return plain();
            }
            return std::nullopt;
        }
    }
}
