// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Field.hpp
 * @brief Structured key/value attributes attached to log lines
 *
 * A Field pairs a key with a value from a deliberately small domain:
 *
 *   null | bool | std::int64_t | double | std::string
 *
 * The domain is a closed std::variant so that every renderer handles all five
 * kinds exhaustively. Values are converted when the Field is built:
 * - any signed integral type -> std::int64_t
 * - unsigned integral types  -> std::int64_t (InvalidFieldValue above INT64_MAX)
 * - floating point types     -> double (InvalidFieldValue for NaN / infinity)
 * - anything convertible to std::string_view -> std::string
 * - any other C++ type is rejected at compile time
 *
 * Duplicate keys are allowed. Storage is append-only and keeps every
 * occurrence; the last occurrence wins only when a line is rendered
 * (see resolveShadowing()).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include "redlog/AppendList.hpp"
#include "redlog/Exception.hpp"
#include "redlog/platform.hpp"

namespace redlog
{
    /** The closed set of value kinds a Field can hold. */
    using FieldValue = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string>;

    namespace detail
    {
        template<typename T>
        constexpr bool always_false = false;

        /**
         * Convert a primitive C++ value into the FieldValue domain.
         * Unsupported static types fail to compile.
         */
        template<typename T>
        FieldValue toFieldValue(T&& value)
        {
            using V = std::decay_t<T>;

            if constexpr (std::is_same_v<V, FieldValue>)
            {
                return std::forward<T>(value);
            }
            else if constexpr (std::is_same_v<V, std::nullptr_t>)
            {
                return nullptr;
            }
            else if constexpr (std::is_same_v<V, bool>)
            {
                return static_cast<bool>(value);
            }
            else if constexpr (std::is_same_v<V, char>)
            {
                return std::string(1U, value);
            }
            else if constexpr (std::is_integral_v<V> && std::is_signed_v<V>)
            {
                return static_cast<std::int64_t>(value);
            }
            else if constexpr (std::is_integral_v<V>)
            {
                if constexpr (sizeof(V) >= sizeof(std::int64_t))
                {
                    if (value > static_cast<V>(std::numeric_limits<std::int64_t>::max()))
                    {
                        throw InvalidFieldValue::make("unsigned value {} does not fit a signed 64 bit integer", value);
                    }
                }
                return static_cast<std::int64_t>(value);
            }
            else if constexpr (std::is_floating_point_v<V>)
            {
                return static_cast<double>(value);
            }
            else if constexpr (std::is_same_v<V, std::string>)
            {
                return std::string{std::forward<T>(value)};
            }
            else if constexpr (std::is_convertible_v<T const&, std::string_view>)
            {
                return std::string{std::string_view{value}};
            }
            else
            {
                static_assert(always_false<V>, "field values must be null, bool, integral, floating point or string-like");
            }
        }
    }

    /**
     * @class Field
     * @brief An immutable key/value pair.
     *
     * Equality is structural: same key and same value (including kind).
     */
    class REDLOG_EXPORT Field
    {
    public:
        /**
         * Build a field from a value already in the FieldValue domain.
         *
         * @throws InvalidFieldValue if value holds a non-finite double, or if
         *         key is empty or contains whitespace, '"' or '='.
         */
        Field(std::string key, FieldValue value);

        /**
         * Build a field from any supported primitive value.
         *
         * @throws InvalidFieldValue for unsigned values above INT64_MAX, for
         *         non-finite floating point values and for invalid keys.
         */
        template<typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, FieldValue>>>
        Field(std::string key, T&& value)
            : Field(std::move(key), detail::toFieldValue(std::forward<T>(value)))
        {}

        [[nodiscard]]
        std::string const& key() const noexcept;

        [[nodiscard]]
        FieldValue const& value() const noexcept;

        /** The value in its rendered form, see renderFieldValue(). */
        [[nodiscard]]
        std::string renderedValue() const;

        [[nodiscard]]
        bool operator==(Field const& other) const;

        [[nodiscard]]
        bool operator!=(Field const& other) const;

    private:
        std::string _key;
        FieldValue _value;
    };

    /**
     * Render a value for the `key=value` text form:
     * - strings are quoted (with \" \\ \n \r \t escapes) when empty or when
     *   they contain whitespace, a double quote or '=', verbatim otherwise
     * - booleans as true / false
     * - integers in decimal
     * - floats as the shortest decimal that round-trips; integral floats keep
     *   a trailing ".0" so they stay distinguishable from integers
     * - null as null
     */
    REDLOG_EXPORT
    std::string renderFieldValue(FieldValue const& value);

    /**
     * Collapse duplicate keys, keeping only the last occurrence of each key.
     * Surviving fields keep the relative order of their last occurrence.
     *
     * Example: [host=a, port=1, host=b] -> [port=1, host=b]
     */
    REDLOG_EXPORT
    std::vector<Field> resolveShadowing(std::vector<Field> fields);

    /**
     * @class FieldSet
     * @brief Immutable, append-only sequence of fields.
     *
     * Backed by an AppendList, so with() is O(1) and never affects the set it
     * was called on.
     */
    class REDLOG_EXPORT FieldSet
    {
    public:
        FieldSet() = default;

        /** Return a new set with field appended. */
        [[nodiscard]]
        FieldSet with(Field field) const;

        /** Return a new set with all fields of other appended, in order. */
        [[nodiscard]]
        FieldSet with(FieldSet const& other) const;

        [[nodiscard]]
        std::size_t size() const noexcept;

        [[nodiscard]]
        bool empty() const noexcept;

        /** All fields in accumulation order, duplicates included. */
        [[nodiscard]]
        std::vector<Field> fields() const;

        /** Fields after shadow resolution, see resolveShadowing(). */
        [[nodiscard]]
        std::vector<Field> resolved() const;

        [[nodiscard]]
        bool operator==(FieldSet const& other) const;

        [[nodiscard]]
        bool operator!=(FieldSet const& other) const;

    private:
        AppendList<Field> _fields;
    };

    /** Convenience factory mirroring the Field constructor. */
    template<typename T>
    Field field(std::string key, T&& value)
    {
        return Field{std::move(key), std::forward<T>(value)};
    }
}
