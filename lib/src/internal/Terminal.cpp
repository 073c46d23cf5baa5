// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

#include "internal/Terminal.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <unistd.h>

namespace redlog::internal
{
    namespace
    {
        bool isSet(char const* name) noexcept
        {
            auto const value = std::getenv(name);
            return (value != nullptr) && (*value != '\0');
        }
    }

    bool stderrSupportsColor() noexcept
    {
        if (isSet("NO_COLOR") || isSet("REDLOG_NO_COLOR"))
        {
            return false;
        }
        if (isSet("FORCE_COLOR") || isSet("REDLOG_FORCE_COLOR"))
        {
            return true;
        }

        if (auto const term = std::getenv("TERM"); (term != nullptr) && (std::strcmp(term, "dumb") == 0))
        {
            return false;
        }
        return isTerminal(std::cerr);
    }

    bool isTerminal(std::ostream& os) noexcept
    {
        if (&os == &std::cout)
        {
            return ::isatty(::fileno(stdout)) != 0;
        }
        if ((&os == &std::cerr) || (&os == &std::clog))
        {
            return ::isatty(::fileno(stderr)) != 0;
        }
        return false; // treat all other ostreams as non-terminal
    }
}
