// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Registry.cpp
 * @brief Process-wide logging configuration
 *
 * Readers on the emit path only take _mutex long enough to copy a shared_ptr,
 * so a concurrent setTheme() or setSink() never blocks on a slow sink. The
 * writer lock is separate and is the only lock held while a sink runs.
 */

#include "redlog/Registry.hpp"
#include <cstdlib>
#include <string>
#include <utility>
#include "internal/Logging.hpp"
#include "internal/Terminal.hpp"

namespace redlog
{
    namespace
    {
        constexpr auto const LEVEL_ENV = "REDLOG_LEVEL";

        Level initialLevel()
        {
            auto const env = std::getenv(LEVEL_ENV);
            if ((env == nullptr) || (*env == '\0'))
            {
                return DEFAULT_LEVEL;
            }

            if (auto const level = parseLevel(env); level)
            {
                return *level;
            }

            REDLOG_WARN("Ignoring invalid {}='{}', using level '{}'.", LEVEL_ENV, env, levelName(DEFAULT_LEVEL));
            return DEFAULT_LEVEL;
        }
    }

    Registry& Registry::instance()
    {
        static Registry registry;
        return registry;
    }

    Registry::Registry()
        : _level{initialLevel()}
        , _colorEnabled{internal::stderrSupportsColor()}
        , _formatErrorPolicy{FormatErrorPolicy::Raise}
        , _theme{std::make_shared<Theme const>(defaultThemeFor(_colorEnabled.load()))}
        , _sink{std::make_shared<ConsoleSink>()}
    {
        REDLOG_DEBUG("Registry initialized: level '{}', color {}, theme '{}'.", levelName(_level.load()), _colorEnabled.load(), _theme->name);
    }

    void Registry::setLevel(Level level) noexcept
    {
        _level.store(level, std::memory_order_relaxed);
    }

    Level Registry::getLevel() const noexcept
    {
        return _level.load(std::memory_order_relaxed);
    }

    void Registry::setTheme(Theme theme)
    {
        auto next = std::make_shared<Theme const>(std::move(theme));

        auto const lock = std::lock_guard{_mutex};
        _theme = std::move(next);
    }

    Theme Registry::getTheme() const
    {
        return *theme();
    }

    std::shared_ptr<Theme const> Registry::theme() const
    {
        auto const lock = std::lock_guard{_mutex};
        return _theme;
    }

    void Registry::setSink(std::shared_ptr<Sink> sink)
    {
        // A null sink restores the standard error console.
        if (!sink)
        {
            sink = std::make_shared<ConsoleSink>();
        }

        auto const lock = std::lock_guard{_mutex};
        _sink = std::move(sink);
    }

    std::shared_ptr<Sink> Registry::getSink() const
    {
        auto const lock = std::lock_guard{_mutex};
        return _sink;
    }

    void Registry::setColorEnabled(bool enabled) noexcept
    {
        _colorEnabled.store(enabled, std::memory_order_relaxed);
    }

    bool Registry::colorEnabled() const noexcept
    {
        return _colorEnabled.load(std::memory_order_relaxed);
    }

    bool Registry::refreshColorSupport()
    {
        auto const supported = internal::stderrSupportsColor();
        setColorEnabled(supported);
        setTheme(defaultThemeFor(supported));

        REDLOG_DEBUG("Color support refreshed: {}", supported);
        return supported;
    }

    void Registry::setFormatErrorPolicy(FormatErrorPolicy policy) noexcept
    {
        _formatErrorPolicy.store(policy, std::memory_order_relaxed);
    }

    FormatErrorPolicy Registry::formatErrorPolicy() const noexcept
    {
        return _formatErrorPolicy.load(std::memory_order_relaxed);
    }

    void Registry::apply(Options const& options)
    {
        if (auto const mode = options.colorMode(); mode)
        {
            switch (*mode)
            {
                case ColorMode::Auto:   refreshColorSupport(); break;
                case ColorMode::Always: setColorEnabled(true); break;
                case ColorMode::Never:  setColorEnabled(false); break;
            }
        }

        if (auto const& theme = options.theme(); theme)
        {
            setTheme(*theme);
        }

        if (auto const level = options.level(); level)
        {
            setLevel(*level);
        }

        if (auto const policy = options.formatErrorPolicy(); policy)
        {
            setFormatErrorPolicy(*policy);
        }

        REDLOG_DEBUG("Applied options: level '{}', color {}, theme '{}'.", levelName(getLevel()), colorEnabled(), theme()->name);
    }

    void Registry::write(Sink& sink, std::string_view line)
    {
        auto const lock = std::lock_guard{_writeMutex};
        sink.write(line);
    }

    Theme const& Registry::defaultThemeFor(bool colorSupported) noexcept
    {
        return colorSupported ? themes::colorized() : themes::plain();
    }
}
