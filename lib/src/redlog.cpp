// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

#include "redlog/redlog.hpp"
#include <utility>

namespace redlog
{
    Logger getLogger(std::string name)
    {
        return Logger{std::move(name)};
    }

    Logger getLogger(std::string name, FormatErrorPolicy policy)
    {
        return Logger{std::move(name), policy};
    }

    void setLevel(Level level) noexcept
    {
        Registry::instance().setLevel(level);
    }

    Level getLevel() noexcept
    {
        return Registry::instance().getLevel();
    }

    void setTheme(Theme theme)
    {
        Registry::instance().setTheme(std::move(theme));
    }

    Theme getTheme()
    {
        return Registry::instance().getTheme();
    }

    void configure(std::string const& jsonOptions)
    {
        Registry::instance().apply(Options{jsonOptions});
    }
}
