// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Registry.hpp
 * @brief Process-wide logging configuration
 *
 * The Registry is the single holder of mutable, process-wide logging state:
 *
 *   - minimum level      (std::atomic, read on every emit)
 *   - active theme       (shared_ptr cell behind _mutex)
 *   - default sink       (shared_ptr cell behind _mutex)
 *   - color flag         (std::atomic)
 *   - format error policy picked up by getLogger()
 *   - the writer lock that serializes every sink write
 *
 * Loggers never cache any of it: a change is visible to every logger,
 * including those created before the change, on their next emit.
 *
 * THREAD SAFETY:
 * - Every member function may be called concurrently from any thread
 * - Level and theme are independent cells; each is read and replaced
 *   atomically, a reader sees either the old or the new value
 * - Critical sections only copy or swap a shared_ptr
 *
 * INITIALIZATION:
 * Created on first use of instance(). At that point:
 *   - REDLOG_LEVEL is parsed (an invalid value is reported and ignored)
 *   - the terminal probe decides the color flag and the default theme
 *     (colorized if color is supported, plain otherwise)
 *   - the default sink writes to standard error
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>
#include "redlog/Level.hpp"
#include "redlog/Options.hpp"
#include "redlog/Sink.hpp"
#include "redlog/Theme.hpp"
#include "redlog/platform.hpp"

namespace redlog
{
    class REDLOG_EXPORT Registry
    {
    public:
        /** The process-wide instance, created on first call. */
        static Registry& instance();

        Registry(Registry const&) = delete;
        Registry& operator=(Registry const&) = delete;

        void setLevel(Level level) noexcept;

        [[nodiscard]]
        Level getLevel() const noexcept;

        /** True if a message at level passes the current minimum. */
        [[nodiscard]]
        bool isEnabled(Level level) const noexcept
        {
            return level >= _level.load(std::memory_order_relaxed);
        }

        void setTheme(Theme theme);

        /** A copy of the active theme. */
        [[nodiscard]]
        Theme getTheme() const;

        /** The active theme without copying it; stays valid after a later setTheme(). */
        [[nodiscard]]
        std::shared_ptr<Theme const> theme() const;

        /** Replace the sink used by loggers that have none of their own. */
        void setSink(std::shared_ptr<Sink> sink);

        [[nodiscard]]
        std::shared_ptr<Sink> getSink() const;

        void setColorEnabled(bool enabled) noexcept;

        [[nodiscard]]
        bool colorEnabled() const noexcept;

        /**
         * Query the terminal probe again, update the color flag and install the
         * matching default theme.
         *
         * @return The new color flag.
         */
        bool refreshColorSupport();

        void setFormatErrorPolicy(FormatErrorPolicy policy) noexcept;

        [[nodiscard]]
        FormatErrorPolicy formatErrorPolicy() const noexcept;

        /**
         * Install every setting present in options. The color mode is applied
         * before the theme, so an explicit theme always wins over the default
         * chosen by ColorMode::Auto.
         */
        void apply(Options const& options);

        /**
         * Write one line to sink while holding the process-wide writer lock.
         * Exceptions thrown by the sink propagate to the caller.
         */
        void write(Sink& sink, std::string_view line);

        /** The theme installed by default for the given color capability. */
        [[nodiscard]]
        static Theme const& defaultThemeFor(bool colorSupported) noexcept;

    private:
        Registry();

        std::atomic<Level> _level;
        std::atomic<bool> _colorEnabled;
        std::atomic<FormatErrorPolicy> _formatErrorPolicy;

        /** Protects _theme and _sink. */
        mutable std::mutex _mutex;
        std::shared_ptr<Theme const> _theme;
        std::shared_ptr<Sink> _sink;

        /** Serializes sink writes across all loggers. */
        std::mutex _writeMutex;
    };
}
