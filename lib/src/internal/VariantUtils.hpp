// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file VariantUtils.hpp
 * @brief Template utilities for working with std::variant
 */

#pragma once

namespace redlog::internal
{
    /**
     * @struct overloaded
     * @brief Build an inline visitor for std::variant out of lambdas.
     *
     * USAGE EXAMPLE:
     * ```cpp
     * std::visit(overloaded{
     *     [](std::int64_t i) { ... },
     *     [](std::string const& s) { ... }
     * }, fieldValue);
     * ```
     *
     * Used by the field renderers so that a missing alternative is a compile error.
     */
    template<class... Ts>
    struct overloaded : Ts...
    {
        using Ts::operator()...;
    };

    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}
