// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Options.cpp
 * @brief Parses redlog configuration options from JSON
 *
 * Every key is optional. Unknown keys are ignored so that a configuration
 * file may carry settings for other components.
 *
 * Example JSON:
 * @code
 * {
 *   "level": "wrn",
 *   "color": "never",
 *   "fields": { "service": "billing" }
 * }
 * @endcode
 */

#include "redlog/Options.hpp"
#include <cstdint>
#include <stdexcept>
#include <picojson/picojson.h>
#include "internal/Logging.hpp"
#include "redlog/Exception.hpp"

namespace redlog
{
    namespace
    {
        /** The string value of key, or nullptr if key is absent. Throws if it is not a string. */
        std::string const* findString(picojson::object const& root, std::string const& key)
        {
            auto const it = root.find(key);
            if (it == root.end())
            {
                return nullptr;
            }
            if (!it->second.is<std::string>())
            {
                throw std::invalid_argument{key + " must be a string."};
            }
            return &it->second.get<std::string>();
        }

        FieldValue jsonToFieldValue(std::string const& key, picojson::value const& value)
        {
            if (value.is<picojson::null>())
            {
                return nullptr;
            }
            if (value.is<bool>())
            {
                return value.get<bool>();
            }
            // Integers are checked first, every int64 also satisfies is<double>().
            if (value.is<std::int64_t>())
            {
                return value.get<std::int64_t>();
            }
            if (value.is<double>())
            {
                return value.get<double>();
            }
            if (value.is<std::string>())
            {
                return value.get<std::string>();
            }
            throw InvalidFieldValue::make("field '{}' must be null, a boolean, a number or a string", key);
        }
    }

    /**
     * @param in_options JSON string containing the options (may be empty)
     *
     * Validation rules:
     * - level: a level name or short code ("warn", "warning", "wrn", ...)
     * - theme: a built-in theme name
     * - color: "auto", "always" or "never"
     * - formatErrors: "raise" or "inline"
     * - fields: an object of primitive values
     */
    Options::Options(std::string const& in_options)
    {
        // Empty options string means no change at all
        if (in_options.empty())
        {
            return;
        }

        auto jsonValue = picojson::value{};
        auto const err = picojson::parse(jsonValue, in_options);
        if (!err.empty())
        {
            throw std::invalid_argument{"Invalid JSON options. " + err};
        }

        if (!jsonValue.is<picojson::object>())
        {
            throw std::invalid_argument{"Expected a JSON object"};
        }
        auto const& root = jsonValue.get<picojson::object>();

        if (auto const level = findString(root, "level"); level != nullptr)
        {
            _level = parseLevel(*level);
            if (!_level)
            {
                throw std::invalid_argument{"Unknown level '" + *level + "'."};
            }
        }

        if (auto const theme = findString(root, "theme"); theme != nullptr)
        {
            _theme = themes::byName(*theme);
            if (!_theme)
            {
                throw std::invalid_argument{"Unknown theme '" + *theme + "'."};
            }
        }

        if (auto const color = findString(root, "color"); color != nullptr)
        {
            if (*color == "auto")
            {
                _colorMode = ColorMode::Auto;
            }
            else if (*color == "always")
            {
                _colorMode = ColorMode::Always;
            }
            else if (*color == "never")
            {
                _colorMode = ColorMode::Never;
            }
            else
            {
                throw std::invalid_argument{"color must be one of 'auto', 'always' or 'never'."};
            }
        }

        if (auto const policy = findString(root, "formatErrors"); policy != nullptr)
        {
            if (*policy == "raise")
            {
                _formatErrorPolicy = FormatErrorPolicy::Raise;
            }
            else if (*policy == "inline")
            {
                _formatErrorPolicy = FormatErrorPolicy::Inline;
            }
            else
            {
                throw std::invalid_argument{"formatErrors must be either 'raise' or 'inline'."};
            }
        }

        auto const fieldsIt = root.find("fields");
        if (fieldsIt != root.end())
        {
            if (!fieldsIt->second.is<picojson::object>())
            {
                throw std::invalid_argument{"fields must be a JSON object."};
            }
            for (auto const& [key, value] : fieldsIt->second.get<picojson::object>())
            {
                _fields = _fields.with(Field{key, jsonToFieldValue(key, value)});
            }
        }

        REDLOG_DEBUG("Parsed options: level set: {}, theme set: {}, {} field(s)", _level.has_value(), _theme.has_value(), _fields.size());
    }

    std::optional<Level> Options::level() const
    {
        return _level;
    }

    std::optional<Theme> const& Options::theme() const
    {
        return _theme;
    }

    std::optional<ColorMode> Options::colorMode() const
    {
        return _colorMode;
    }

    std::optional<FormatErrorPolicy> Options::formatErrorPolicy() const
    {
        return _formatErrorPolicy;
    }

    FieldSet const& Options::fields() const
    {
        return _fields;
    }
}
