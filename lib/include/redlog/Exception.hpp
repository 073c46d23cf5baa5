// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.hpp
 * @brief Exception types raised by redlog
 *
 * ERROR HANDLING STRATEGY:
 * - Every failure is reported by throwing a redlog::Exception carrying a Status
 * - The two failures a caller most often wants to single out have their own
 *   subclasses: InvalidFieldValue (raised while building a Field) and
 *   FormatMismatch (raised by the printf-style emit methods)
 * - Sink write failures surface as Exception with Status::IoError
 *
 * Level filtering, logger derivation and Registry reads/writes never throw.
 *
 * USAGE PATTERN:
 * ```cpp
 * throw InvalidFieldValue::make("unsigned value {} does not fit a signed 64 bit integer", value);
 * ```
 */

#pragma once

#include <exception>
#include <string>
#include <utility>
#include <fmt/format.h>
#include "redlog/platform.hpp"

namespace redlog
{
    /** Category of a redlog failure. */
    enum class Status
    {
        InvalidFieldValue, ///< A field value outside the supported primitive domain
        FormatMismatch,    ///< printf-style format and arguments disagree
        InvalidArgument,   ///< Any other invalid input (bad configuration value, ...)
        IoError,           ///< A sink could not be opened or written
    };

    /**
     * @class Exception
     * @brief Base exception class for redlog
     *
     * The factory methods use fmt::format for type-safe message formatting:
     * - invalidArgument() for Status::InvalidArgument
     * - ioError() for Status::IoError
     */
    class REDLOG_EXPORT Exception : public std::exception
    {
    public:
        Exception(std::string msg, Status status);

        /** \brief Make any type of exception.
         */
        template<typename... T>
        static Exception make(Status status, fmt::format_string<T...> fmt, T&&... args)
        {
            return Exception(fmt::format(fmt, std::forward<T>(args)...), status);
        }

        /** \brief Make a Status::InvalidArgument exception.
         */
        template<typename... T>
        static Exception invalidArgument(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(Status::InvalidArgument, fmt, std::forward<T>(args)...);
        }

        /** \brief Make a Status::IoError exception.
         */
        template<typename... T>
        static Exception ioError(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(Status::IoError, fmt, std::forward<T>(args)...);
        }

        /** \brief Return the status code that describes the condition
         * that led to the exception being thrown.
         */
        [[nodiscard]]
        Status status() const noexcept;

        /** \brief Implements std::exception, returns a descriptive string about the error.
         */
        [[nodiscard]]
        char const* what() const noexcept override;

    private:
        std::string _msg;
        Status _status;
    };

    /**
     * \brief Raised when a field is built from a value outside the supported
     * primitive domain (string, integer, float, boolean, null).
     */
    class REDLOG_EXPORT InvalidFieldValue : public Exception
    {
    public:
        explicit InvalidFieldValue(std::string msg);

        template<typename... T>
        static InvalidFieldValue make(fmt::format_string<T...> fmt, T&&... args)
        {
            return InvalidFieldValue(fmt::format(fmt, std::forward<T>(args)...));
        }
    };

    /**
     * \brief Raised by the printf-style emit methods when the arguments do not
     * satisfy the placeholders of the format string.
     */
    class REDLOG_EXPORT FormatMismatch : public Exception
    {
    public:
        explicit FormatMismatch(std::string msg);

        template<typename... T>
        static FormatMismatch make(fmt::format_string<T...> fmt, T&&... args)
        {
            return FormatMismatch(fmt::format(fmt, std::forward<T>(args)...));
        }
    };
}
