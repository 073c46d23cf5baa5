// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file redlog.hpp
 * @brief Single include for the redlog API
 *
 * Typical use:
 * ```cpp
 * #include <redlog/redlog.hpp>
 *
 * auto const log = redlog::getLogger("app").withName("db").withField("retry", 3);
 * log.error("conn failed");                       // ... [err] [app.db] conn failed ... retry=3
 * log.infof("pool of %d connections", poolSize);
 *
 * redlog::setLevel(redlog::Level::Debug);
 * redlog::setTheme(redlog::themes::plain());
 * ```
 */

#pragma once

#include <string>
#include "redlog/Exception.hpp"
#include "redlog/Field.hpp"
#include "redlog/Format.hpp"
#include "redlog/Formatter.hpp"
#include "redlog/Level.hpp"
#include "redlog/Logger.hpp"
#include "redlog/Options.hpp"
#include "redlog/Registry.hpp"
#include "redlog/Sink.hpp"
#include "redlog/Theme.hpp"
#include "redlog/platform.hpp"

namespace redlog
{
    /** Root logger named name. Repeated calls return independent, equal loggers. */
    REDLOG_EXPORT
    Logger getLogger(std::string name);

    /** Root logger named name with an explicit format error policy. */
    REDLOG_EXPORT
    Logger getLogger(std::string name, FormatErrorPolicy policy);

    REDLOG_EXPORT
    void setLevel(Level level) noexcept;

    REDLOG_EXPORT
    Level getLevel() noexcept;

    REDLOG_EXPORT
    void setTheme(Theme theme);

    REDLOG_EXPORT
    Theme getTheme();

    /** Parse options and install them in the Registry, see Options. */
    REDLOG_EXPORT
    void configure(std::string const& jsonOptions);
}
