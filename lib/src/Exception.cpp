// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.cpp
 * @brief Implementation of the redlog exception classes
 */

#include "redlog/Exception.hpp"
#include <utility>

namespace redlog
{
    // Construct generic Exception with message and status code
    Exception::Exception(std::string msg, Status status)
        : _msg(std::move(msg))
        , _status(status)
    {}

    Status Exception::status() const noexcept
    {
        return _status;
    }

    // Implement std::exception::what() - return error message
    char const* Exception::what() const noexcept
    {
        return _msg.c_str();
    }

    InvalidFieldValue::InvalidFieldValue(std::string msg)
        : Exception(std::move(msg), Status::InvalidFieldValue)
    {}

    FormatMismatch::FormatMismatch(std::string msg)
        : Exception(std::move(msg), Status::FormatMismatch)
    {}
}
