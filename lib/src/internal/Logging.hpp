// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.hpp
 * @brief Diagnostics about redlog itself
 *
 * redlog reports its own problems (ignored environment values, failing
 * children of a MultiplexSink, ...) through a dedicated spdlog logger named
 * "redlog" that writes to standard error. This keeps library diagnostics out
 * of the user's sinks, which may be the very thing that is failing.
 *
 * - In debug builds (NDEBUG not defined), TRACE and DEBUG calls are compiled in
 * - In release builds, TRACE and DEBUG calls compile to nothing
 * - The runtime level comes from the REDLOG_DIAGNOSTICS environment variable
 *   (spdlog level names, default "warn")
 *
 * Each macro is wrapped in try/catch so that a diagnostic can never escape
 * into library code, including the first call that creates the logger.
 */

#pragma once

// See : https://github.com/gabime/spdlog/wiki/0.-FAQ#how-to-remove-all-debug-statements-at-compile-time-
#ifndef SPDLOG_ACTIVE_LEVEL
#   ifndef NDEBUG
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#   else
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#   endif
#endif

#include <spdlog/spdlog.h>

namespace redlog::internal
{
    /** Name of the environment variable holding the diagnostics level. */
    constexpr auto const DIAGNOSTICS_LEVEL_ENV = "REDLOG_DIAGNOSTICS";

    /** The diagnostics logger, created on first use. */
    spdlog::logger& diagnostics();
}

#define REDLOG_TRACE(...)                                                             \
    do                                                                               \
    {                                                                                \
        try                                                                          \
        {                                                                            \
            SPDLOG_LOGGER_TRACE(&::redlog::internal::diagnostics(), __VA_ARGS__);      \
        }                                                                            \
        catch (...)                                                                  \
        {}                                                                           \
    }                                                                                \
    while (false)

#define REDLOG_DEBUG(...)                                                             \
    do                                                                               \
    {                                                                                \
        try                                                                          \
        {                                                                            \
            SPDLOG_LOGGER_DEBUG(&::redlog::internal::diagnostics(), __VA_ARGS__);      \
        }                                                                            \
        catch (...)                                                                  \
        {}                                                                           \
    }                                                                                \
    while (false)

#define REDLOG_INFO(...)                                                             \
    do                                                                               \
    {                                                                                \
        try                                                                          \
        {                                                                            \
            SPDLOG_LOGGER_INFO(&::redlog::internal::diagnostics(), __VA_ARGS__);       \
        }                                                                            \
        catch (...)                                                                  \
        {}                                                                           \
    }                                                                                \
    while (false)

#define REDLOG_WARN(...)                                                             \
    do                                                                               \
    {                                                                                \
        try                                                                          \
        {                                                                            \
            SPDLOG_LOGGER_WARN(&::redlog::internal::diagnostics(), __VA_ARGS__);       \
        }                                                                            \
        catch (...)                                                                  \
        {}                                                                           \
    }                                                                                \
    while (false)

#define REDLOG_ERROR(...)                                                             \
    do                                                                               \
    {                                                                                \
        try                                                                          \
        {                                                                            \
            SPDLOG_LOGGER_ERROR(&::redlog::internal::diagnostics(), __VA_ARGS__);      \
        }                                                                            \
        catch (...)                                                                  \
        {}                                                                           \
    }                                                                                \
    while (false)
