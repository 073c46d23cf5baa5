// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logger.hpp
 * @brief Immutable, scoped loggers
 *
 * A Logger is a value: a name path ("app", "db" -> displayed "app.db"), an
 * accumulated FieldSet, and optionally its own Sink and Formatter. Every
 * with*() call returns a new Logger; the receiver is never modified and stays
 * usable. Name path and fields live in AppendLists, so derivation is O(1) and
 * derived loggers share storage with their parents.
 *
 * Loggers hold no lock and no cached configuration. They may be copied and
 * used from any number of threads.
 *
 * EMISSION:
 *   log.info("connected", field("host", "db1"), field("port", 5432));
 *   log.infof("retry %d of %d", attempt, maxAttempts);
 *
 * 1. The level is compared with Registry::getLevel(); a disabled call returns
 *    before any formatting or allocation.
 * 2. Accumulated fields ++ call-site fields are shadow-resolved (last key wins).
 * 3. The formatter renders the line with the Registry's current theme and
 *    color flag.
 * 4. The line is written to the sink under the Registry's writer lock.
 *
 * Method families, one per level:
 *   critical / crt / criticalf / crtf
 *   error    / err / errorf    / errf
 *   warn     / wrn / warnf     / wrnf
 *   info     / inf / infof     / inff
 *   verbose  / vrb / verbosef  / vrbf
 *   trace    / trc / tracef    / trcf
 *   debug    / dbg / debugf    / dbgf
 *   pedantic / ped / pedanticf / pedf
 *   annoying / ayg / annoyingf / aygf
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include <fmt/printf.h>
#include "redlog/AppendList.hpp"
#include "redlog/Field.hpp"
#include "redlog/Formatter.hpp"
#include "redlog/Level.hpp"
#include "redlog/Options.hpp"
#include "redlog/Registry.hpp"
#include "redlog/Sink.hpp"
#include "redlog/platform.hpp"

namespace redlog
{
    class REDLOG_EXPORT Logger
    {
    public:
        /**
         * Root logger with name path [name], no fields, the Registry's sink and
         * the shared DefaultFormatter. Uses the Registry's current format error policy.
         */
        explicit Logger(std::string name = {});

        /** Same as above with an explicit format error policy. */
        Logger(std::string name, FormatErrorPolicy policy);

        /** New logger whose name path has name appended. */
        [[nodiscard]]
        Logger withName(std::string name) const;

        /** New logger whose fields have field appended. */
        [[nodiscard]]
        Logger withField(Field field) const;

        template<typename T>
        [[nodiscard]]
        Logger withField(std::string key, T&& value) const
        {
            return withField(Field{std::move(key), std::forward<T>(value)});
        }

        /** New logger whose fields have all of fields appended, in order. */
        [[nodiscard]]
        Logger withFields(FieldSet const& fields) const;

        /** New logger writing to sink instead of the Registry's sink. */
        [[nodiscard]]
        Logger withSink(std::shared_ptr<Sink> sink) const;

        /** New logger rendering with formatter instead of the DefaultFormatter. */
        [[nodiscard]]
        Logger withFormatter(std::shared_ptr<Formatter const> formatter) const;

        [[nodiscard]]
        Logger withFormatErrorPolicy(FormatErrorPolicy policy) const;

        /** The name path joined with '.', empty segments skipped. */
        [[nodiscard]]
        std::string const& name() const noexcept;

        [[nodiscard]]
        std::vector<std::string> namePath() const;

        [[nodiscard]]
        FieldSet const& fields() const noexcept;

        [[nodiscard]]
        FormatErrorPolicy formatErrorPolicy() const noexcept;

        [[nodiscard]]
        bool isEnabled(Level level) const noexcept
        {
            return Registry::instance().isEnabled(level);
        }

        /** Loggers are equal when their name paths and fields are equal. */
        [[nodiscard]]
        bool operator==(Logger const& other) const;

        [[nodiscard]]
        bool operator!=(Logger const& other) const;

        /**
         * Emit message at level with additional call-site fields.
         * Call-site fields render after, and therefore shadow, accumulated ones.
         *
         * @throws Exception (Status::IoError) if the sink fails.
         */
        template<typename... Fields>
        void log(Level level, std::string_view message, Fields&&... fields) const
        {
            static_assert((std::is_convertible_v<Fields, Field> && ...), "call-site fields must be redlog::Field values");

            if (!isEnabled(level))
            {
                return;
            }

            if constexpr (sizeof...(Fields) == 0)
            {
                emit(level, message, nullptr, 0U);
            }
            else
            {
                Field const callFields[] = {Field(std::forward<Fields>(fields))...};
                emit(level, message, callFields, sizeof...(Fields));
            }
        }

        /**
         * Emit a printf-style formatted message at level.
         * Nothing is formatted if level is disabled.
         *
         * @throws FormatMismatch if args do not match format and the policy is
         *         FormatErrorPolicy::Raise.
         * @throws Exception (Status::IoError) if the sink fails.
         */
        template<typename... Args>
        void logf(Level level, std::string_view format, Args const&... args) const
        {
            if (!isEnabled(level))
            {
                return;
            }

            auto const message = formatMessage(format, fmt::make_printf_args(args...), sizeof...(Args));
            emit(level, message, nullptr, 0U);
        }

        // clang-format off
        template<typename... Fields> void critical(std::string_view message, Fields&&... fields) const { log(Level::Critical, message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void error(std::string_view message, Fields&&... fields) const    { log(Level::Error, message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void warn(std::string_view message, Fields&&... fields) const     { log(Level::Warn, message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void info(std::string_view message, Fields&&... fields) const     { log(Level::Info, message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void verbose(std::string_view message, Fields&&... fields) const  { log(Level::Verbose, message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void trace(std::string_view message, Fields&&... fields) const    { log(Level::Trace, message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void debug(std::string_view message, Fields&&... fields) const    { log(Level::Debug, message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void pedantic(std::string_view message, Fields&&... fields) const { log(Level::Pedantic, message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void annoying(std::string_view message, Fields&&... fields) const { log(Level::Annoying, message, std::forward<Fields>(fields)...); }

        template<typename... Fields> void crt(std::string_view message, Fields&&... fields) const { critical(message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void err(std::string_view message, Fields&&... fields) const { error(message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void wrn(std::string_view message, Fields&&... fields) const { warn(message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void inf(std::string_view message, Fields&&... fields) const { info(message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void vrb(std::string_view message, Fields&&... fields) const { verbose(message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void trc(std::string_view message, Fields&&... fields) const { trace(message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void dbg(std::string_view message, Fields&&... fields) const { debug(message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void ped(std::string_view message, Fields&&... fields) const { pedantic(message, std::forward<Fields>(fields)...); }
        template<typename... Fields> void ayg(std::string_view message, Fields&&... fields) const { annoying(message, std::forward<Fields>(fields)...); }

        template<typename... Args> void criticalf(std::string_view format, Args const&... args) const { logf(Level::Critical, format, args...); }
        template<typename... Args> void errorf(std::string_view format, Args const&... args) const    { logf(Level::Error, format, args...); }
        template<typename... Args> void warnf(std::string_view format, Args const&... args) const     { logf(Level::Warn, format, args...); }
        template<typename... Args> void infof(std::string_view format, Args const&... args) const     { logf(Level::Info, format, args...); }
        template<typename... Args> void verbosef(std::string_view format, Args const&... args) const  { logf(Level::Verbose, format, args...); }
        template<typename... Args> void tracef(std::string_view format, Args const&... args) const    { logf(Level::Trace, format, args...); }
        template<typename... Args> void debugf(std::string_view format, Args const&... args) const    { logf(Level::Debug, format, args...); }
        template<typename... Args> void pedanticf(std::string_view format, Args const&... args) const { logf(Level::Pedantic, format, args...); }
        template<typename... Args> void annoyingf(std::string_view format, Args const&... args) const { logf(Level::Annoying, format, args...); }

        template<typename... Args> void crtf(std::string_view format, Args const&... args) const { criticalf(format, args...); }
        template<typename... Args> void errf(std::string_view format, Args const&... args) const { errorf(format, args...); }
        template<typename... Args> void wrnf(std::string_view format, Args const&... args) const { warnf(format, args...); }
        template<typename... Args> void inff(std::string_view format, Args const&... args) const { infof(format, args...); }
        template<typename... Args> void vrbf(std::string_view format, Args const&... args) const { verbosef(format, args...); }
        template<typename... Args> void trcf(std::string_view format, Args const&... args) const { tracef(format, args...); }
        template<typename... Args> void dbgf(std::string_view format, Args const&... args) const { debugf(format, args...); }
        template<typename... Args> void pedf(std::string_view format, Args const&... args) const { pedanticf(format, args...); }
        template<typename... Args> void aygf(std::string_view format, Args const&... args) const { annoyingf(format, args...); }
        // clang-format on

    private:
        /**
         * Format a printf-style message, applying this logger's format error policy.
         * @param argCount Number of arguments packed into args.
         */
        std::string formatMessage(std::string_view format, fmt::printf_args args, std::size_t argCount) const;

        /**
         * Render and write one line. The caller has already checked the level.
         * @param callFields Array of count call-site fields (may be null when count is 0).
         */
        void emit(Level level, std::string_view message, Field const* callFields, std::size_t count) const;

        AppendList<std::string> _namePath;
        std::string _name;
        FieldSet _fields;
        std::shared_ptr<Formatter const> _formatter;
        std::shared_ptr<Sink> _sink;
        FormatErrorPolicy _formatErrorPolicy;
    };
}
