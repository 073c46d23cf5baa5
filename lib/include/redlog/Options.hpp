// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Options.hpp
 * @brief Parse redlog configuration from a JSON document
 *
 * Example options JSON:
 * {
 *   "level": "debug",             // minimum level, long name or short code
 *   "theme": "plain",             // "colorized", "default" or "plain"
 *   "color": "auto",              // "auto", "always" or "never"
 *   "formatErrors": "inline",     // "raise" or "inline"
 *   "fields": {                   // fields meant for root loggers
 *     "service": "billing",
 *     "replica": 2
 *   }
 * }
 *
 * Design:
 * - std::optional members (no value = leave the current setting alone)
 * - Immutable after construction (thread-safe for reads)
 * - Validated during parsing (throws on invalid values)
 *
 * Options are applied with Registry::apply(). The "fields" object is not
 * applied globally; attach it explicitly with Logger::withFields(options.fields()).
 */

#pragma once

#include <optional>
#include <string>
#include "redlog/Field.hpp"
#include "redlog/Level.hpp"
#include "redlog/Theme.hpp"
#include "redlog/platform.hpp"

namespace redlog
{
    /** How the color capability flag is decided when options are applied. */
    enum class ColorMode
    {
        Auto,   ///< Ask the terminal capability probe
        Always, ///< Force escape sequences on
        Never,  ///< Force escape sequences off
    };

    /** What the printf-style emit methods do when format and arguments disagree. */
    enum class FormatErrorPolicy
    {
        Raise,  ///< Throw FormatMismatch to the caller
        Inline, ///< Emit the line anyway with an inline "[format error: ...]" marker
    };

    class REDLOG_EXPORT Options
    {
    public:
        /** No options: applying them changes nothing. */
        Options() = default;

        /**
         * Parse a JSON object of options. An empty string means no options.
         *
         * @throws std::invalid_argument if the JSON is malformed or a value is invalid
         * @throws InvalidFieldValue if a "fields" value is an array or an object
         */
        explicit Options(std::string const& in_options);

        [[nodiscard]]
        std::optional<Level> level() const;

        [[nodiscard]]
        std::optional<Theme> const& theme() const;

        [[nodiscard]]
        std::optional<ColorMode> colorMode() const;

        [[nodiscard]]
        std::optional<FormatErrorPolicy> formatErrorPolicy() const;

        /** Fields listed under "fields", ordered by key. */
        [[nodiscard]]
        FieldSet const& fields() const;

    private:
        std::optional<Level> _level;
        std::optional<Theme> _theme;
        std::optional<ColorMode> _colorMode;
        std::optional<FormatErrorPolicy> _formatErrorPolicy;
        FieldSet _fields;
    };
}
