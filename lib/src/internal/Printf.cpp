// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

#include "internal/Printf.hpp"

namespace redlog::internal
{
    namespace
    {
        constexpr auto const FLAG_CHARACTERS = std::string_view{"-+ #0'"};
        constexpr auto const LENGTH_CHARACTERS = std::string_view{"hlLqjzt"};

        constexpr bool isDigit(char c) noexcept
        {
            return (c >= '0') && (c <= '9');
        }
    }

    std::optional<std::size_t> countPrintfArguments(std::string_view format) noexcept
    {
        auto count = std::size_t{0};
        auto const size = format.size();

        for (auto i = std::size_t{0}; i < size; ++i)
        {
            if (format[i] != '%')
            {
                continue;
            }

            ++i;
            if (i >= size)
            {
                // Dangling '%', fmt reports it.
                break;
            }
            if (format[i] == '%')
            {
                continue;
            }

            // Positional argument ("%2$s")
            auto j = i;
            while ((j < size) && isDigit(format[j]))
            {
                ++j;
            }
            if ((j > i) && (j < size) && (format[j] == '$'))
            {
                return std::nullopt;
            }

            while ((i < size) && (FLAG_CHARACTERS.find(format[i]) != std::string_view::npos))
            {
                ++i;
            }

            // Width
            if ((i < size) && (format[i] == '*'))
            {
                ++count;
                ++i;
            }
            else
            {
                while ((i < size) && isDigit(format[i]))
                {
                    ++i;
                }
            }

            // Precision
            if ((i < size) && (format[i] == '.'))
            {
                ++i;
                if ((i < size) && (format[i] == '*'))
                {
                    ++count;
                    ++i;
                }
                else
                {
                    while ((i < size) && isDigit(format[i]))
                    {
                        ++i;
                    }
                }
            }

            while ((i < size) && (LENGTH_CHARACTERS.find(format[i]) != std::string_view::npos))
            {
                ++i;
            }

            // Conversion character, skipped by the loop increment.
            if (i < size)
            {
                ++count;
            }
        }

        return count;
    }
}
