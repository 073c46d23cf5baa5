// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Printf.hpp
 * @brief Static inspection of printf-style format strings
 *
 * fmt::sprintf reports missing arguments but silently ignores surplus ones.
 * Counting the arguments a format consumes lets the logger reject both.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace redlog::internal
{
    /**
     * Number of arguments consumed by a printf-style format.
     *
     * Each conversion consumes one argument, plus one for every '*' width or
     * precision. "%%" consumes none.
     *
     * @return The count, or std::nullopt if the format uses positional
     *         arguments ("%1$d"), for which no count can be inferred.
     */
    std::optional<std::size_t> countPrintfArguments(std::string_view format) noexcept;
}
