// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Field.cpp
 * @brief Field validation, value rendering and shadow resolution
 */

#include "redlog/Field.hpp"
#include <cmath>
#include <cctype>
#include <unordered_set>
#include <fmt/format.h>
#include "internal/VariantUtils.hpp"

namespace redlog
{
    namespace
    {
        bool needsQuoting(std::string_view text) noexcept
        {
            if (text.empty())
            {
                return true;
            }
            for (auto const c : text)
            {
                if ((std::isspace(static_cast<unsigned char>(c)) != 0) || (c == '"') || (c == '='))
                {
                    return true;
                }
            }
            return false;
        }

        /** Keys render bare, so they must not contain a separator of the key=value syntax. */
        bool isValidKey(std::string_view key) noexcept
        {
            return !key.empty() && !needsQuoting(key);
        }

        std::string quote(std::string_view text)
        {
            auto result = std::string{};
            result.reserve(text.size() + 2U);
            result.push_back('"');
            for (auto const c : text)
            {
                switch (c)
                {
                    case '"':  result.append("\\\""); break;
                    case '\\': result.append("\\\\"); break;
                    case '\n': result.append("\\n"); break;
                    case '\r': result.append("\\r"); break;
                    case '\t': result.append("\\t"); break;
                    default:   result.push_back(c); break;
                }
            }
            result.push_back('"');
            return result;
        }

        std::string renderFloat(double value)
        {
            auto result = fmt::format("{}", value);
            // Keep integral floats distinguishable from integers: 2.0, not 2.
            if (result.find_first_of(".eEn") == std::string::npos)
            {
                result.append(".0");
            }
            return result;
        }
    }

    Field::Field(std::string key, FieldValue value)
        : _key{std::move(key)}
        , _value{std::move(value)}
    {
        if (!isValidKey(_key))
        {
            throw InvalidFieldValue::make("field key '{}' must be non-empty and free of whitespace, '\"' and '='", _key);
        }
        if (auto const number = std::get_if<double>(&_value); (number != nullptr) && !std::isfinite(*number))
        {
            throw InvalidFieldValue::make("field '{}' has a non-finite floating point value", _key);
        }
    }

    std::string const& Field::key() const noexcept
    {
        return _key;
    }

    FieldValue const& Field::value() const noexcept
    {
        return _value;
    }

    std::string Field::renderedValue() const
    {
        return renderFieldValue(_value);
    }

    bool Field::operator==(Field const& other) const
    {
        return (_key == other._key) && (_value == other._value);
    }

    bool Field::operator!=(Field const& other) const
    {
        return !(*this == other);
    }

    std::string renderFieldValue(FieldValue const& value)
    {
        return std::visit(
            internal::overloaded{
                [](std::nullptr_t) { return std::string{"null"}; },
                [](bool b) { return std::string{b ? "true" : "false"}; },
                [](std::int64_t i) { return fmt::format("{}", i); },
                [](double d) { return renderFloat(d); },
                [](std::string const& s) { return needsQuoting(s) ? quote(s) : s; },
            },
            value);
    }

    std::vector<Field> resolveShadowing(std::vector<Field> fields)
    {
        // Walk backwards so the first sighting of a key is its last occurrence.
        auto keep = std::vector<bool>(fields.size(), false);
        auto seen = std::unordered_set<std::string_view>{};
        for (auto i = fields.size(); i > 0U; --i)
        {
            keep[i - 1U] = seen.insert(fields[i - 1U].key()).second;
        }

        if (seen.size() == fields.size())
        {
            return fields;
        }

        auto result = std::vector<Field>{};
        result.reserve(seen.size());
        for (auto i = std::size_t{0}; i < fields.size(); ++i)
        {
            if (keep[i])
            {
                result.push_back(std::move(fields[i]));
            }
        }
        return result;
    }

    FieldSet FieldSet::with(Field field) const
    {
        auto result = FieldSet{};
        result._fields = _fields.append(std::move(field));
        return result;
    }

    FieldSet FieldSet::with(FieldSet const& other) const
    {
        auto result = *this;
        for (auto& field : other.fields())
        {
            result._fields = result._fields.append(std::move(field));
        }
        return result;
    }

    std::size_t FieldSet::size() const noexcept
    {
        return _fields.size();
    }

    bool FieldSet::empty() const noexcept
    {
        return _fields.empty();
    }

    std::vector<Field> FieldSet::fields() const
    {
        return _fields.toVector();
    }

    std::vector<Field> FieldSet::resolved() const
    {
        return resolveShadowing(_fields.toVector());
    }

    bool FieldSet::operator==(FieldSet const& other) const
    {
        return _fields == other._fields;
    }

    bool FieldSet::operator!=(FieldSet const& other) const
    {
        return !(*this == other);
    }
}
