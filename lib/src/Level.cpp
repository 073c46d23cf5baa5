// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Level.cpp
 * @brief Level names and parsing
 */

#include "redlog/Level.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace redlog
{
    std::string_view levelName(Level level) noexcept
    {
        switch (level)
        {
            case Level::Annoying: return "annoying";
            case Level::Pedantic: return "pedantic";
            case Level::Debug:    return "debug";
            case Level::Trace:    return "trace";
            case Level::Verbose:  return "verbose";
            case Level::Info:     return "info";
            case Level::Warn:     return "warn";
            case Level::Error:    return "error";
            case Level::Critical: return "critical";
            default:              return "unknown";
        }
    }

    std::string_view levelShortName(Level level) noexcept
    {
        switch (level)
        {
            case Level::Annoying: return "ayg";
            case Level::Pedantic: return "ped";
            case Level::Debug:    return "dbg";
            case Level::Trace:    return "trc";
            case Level::Verbose:  return "vrb";
            case Level::Info:     return "inf";
            case Level::Warn:     return "wrn";
            case Level::Error:    return "err";
            case Level::Critical: return "crt";
            default:              return "unk";
        }
    }

    std::optional<Level> parseLevel(std::string_view text) noexcept
    {
        auto const equalsIgnoreCase = [text](std::string_view name)
        {
            return std::equal(text.begin(), text.end(), name.begin(), name.end(), [](char lhs, char rhs)
                { return std::tolower(static_cast<unsigned char>(lhs)) == rhs; });
        };

        for (auto const level : ALL_LEVELS)
        {
            if (equalsIgnoreCase(levelName(level)) || equalsIgnoreCase(levelShortName(level)))
            {
                return level;
            }
        }

        if (equalsIgnoreCase("warning"))
        {
            return Level::Warn;
        }
        return std::nullopt;
    }
}
