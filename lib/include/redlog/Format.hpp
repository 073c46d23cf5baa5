// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Format.hpp
 * @brief fmt library specializations for redlog types
 *
 * USAGE:
 * ```cpp
 * fmt::format("{}", Level::Warn);               // "warn"
 * fmt::format("{}", field("user", "ada lovelace")); // user="ada lovelace"
 * ```
 */

#pragma once

#include <fmt/format.h>
#include "redlog/Field.hpp"
#include "redlog/Level.hpp"

/**
 * @brief fmt::formatter specialization for redlog::Level
 *
 * Formats the long level name.
 */
template<>
struct fmt::formatter<redlog::Level>
{
    constexpr auto parse(fmt::format_parse_context& ctx)
    {
        return ctx.begin(); // No format specifiers
    }

    template<typename Context>
    auto format(redlog::Level const& level, Context& ctx) const
    {
        auto const name = redlog::levelName(level);
        return fmt::format_to(ctx.out(), "{}", fmt::string_view{name.data(), name.size()});
    }
};

/**
 * @brief fmt::formatter specialization for redlog::Field
 *
 * Formats the field as key=value, the value rendered by renderFieldValue().
 */
template<>
struct fmt::formatter<redlog::Field>
{
    constexpr auto parse(fmt::format_parse_context& ctx)
    {
        return ctx.begin(); // No format specifiers
    }

    template<typename Context>
    auto format(redlog::Field const& field, Context& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}={}", field.key(), field.renderedValue());
    }
};
