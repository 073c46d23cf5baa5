// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Level.hpp
 * @brief Ordered log severities and their textual forms
 *
 * Levels are ordered from the most verbose to the most severe:
 *
 *   ANNOYING < PEDANTIC < DEBUG < TRACE < VERBOSE < INFO < WARN < ERROR < CRITICAL
 *
 * A message is emitted when its level is greater than or equal to the
 * process-wide minimum level held by the Registry. Because Level is a scoped
 * enumeration with increasing underlying values, the built-in relational
 * operators implement exactly this ordering.
 *
 * Each level has two spellings:
 * - a long name ("critical", "error", ...) used in JSON output and configuration
 * - a three letter short code ("crt", "err", ...) used for the level badge
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include "redlog/platform.hpp"

namespace redlog
{
    enum class Level : std::uint8_t
    {
        Annoying = 0, ///< ayg - maximum verbosity
        Pedantic,     ///< ped - extremely detailed debugging
        Debug,        ///< dbg - debugging information
        Trace,        ///< trc - detailed execution tracing
        Verbose,      ///< vrb - detailed operational information
        Info,         ///< inf - general informational messages (default minimum)
        Warn,         ///< wrn - warnings and potential issues
        Error,        ///< err - recoverable errors
        Critical,     ///< crt - system-breaking errors
    };

    /** All levels, from the most verbose to the most severe. */
    constexpr std::array<Level, 9> ALL_LEVELS = {
        Level::Annoying,
        Level::Pedantic,
        Level::Debug,
        Level::Trace,
        Level::Verbose,
        Level::Info,
        Level::Warn,
        Level::Error,
        Level::Critical,
    };

    /** The minimum level in effect until something reconfigures the Registry. */
    constexpr auto DEFAULT_LEVEL = Level::Info;

    /** Full lower-case name of a level, e.g. "warn". */
    REDLOG_EXPORT
    std::string_view levelName(Level level) noexcept;

    /** Three letter badge code of a level, e.g. "wrn". */
    REDLOG_EXPORT
    std::string_view levelShortName(Level level) noexcept;

    /**
     * Parse a level from its long name or its short code, ignoring case.
     * "warning" is accepted as an alias for Level::Warn.
     *
     * @return The level, or std::nullopt if the text names no level.
     */
    REDLOG_EXPORT
    std::optional<Level> parseLevel(std::string_view text) noexcept;
}
