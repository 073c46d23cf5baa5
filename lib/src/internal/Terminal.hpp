// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Terminal.hpp
 * @brief Color capability probe
 *
 * Decision order:
 *   1. NO_COLOR or REDLOG_NO_COLOR set and non-empty    -> no color
 *   2. FORCE_COLOR or REDLOG_FORCE_COLOR set and non-empty -> color
 *   3. standard error is a terminal and TERM is not "dumb" -> color
 *   4. otherwise                                        -> no color
 */

#pragma once

#include <iosfwd>

namespace redlog::internal
{
    /** Apply the decision order above to standard error. */
    bool stderrSupportsColor() noexcept;

    /**
     * Detect if an output stream is connected to a terminal.
     * Only std::cout, std::cerr and std::clog can be; every other stream is
     * treated as non-terminal.
     */
    bool isTerminal(std::ostream& os) noexcept;
}
