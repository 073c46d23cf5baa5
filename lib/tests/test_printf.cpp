// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_printf.cpp
 * @brief Unit tests for the printf-style emit methods
 *
 * Mismatches between placeholders and arguments raise FormatMismatch by
 * default. Loggers using FormatErrorPolicy::Inline emit the raw format with an
 * inline marker instead. Filtered calls never format, so they never fail.
 */

#include <string>
#include <catch2/catch_test_macros.hpp>
#include <redlog/redlog.hpp>
#include "Utils.hpp"

using namespace redlog;

namespace
{
    bool endsWith(std::string const& text, std::string const& suffix)
    {
        return (text.size() >= suffix.size()) && (text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0);
    }
}

/**
 * @brief Placeholders are substituted with printf semantics
 */
TEST_CASE_PERSISTENT_FIXTURE(redlog::tests::RegistryFixture, "Printf formatting", "[printf]")
{
    auto const log = getLogger("fmt");

    log.infof("retry %d of %d", 2, 5);
    log.inff("%s=%.2f", "pi", 3.14159);
    log.warnf("100%% done");
    log.errf("%5s|%-3d|", "ab", 7);
    log.infof("%2$s %1$s", "world", "hello");

    auto const lines = sink->lines();
    REQUIRE(lines.size() == 5U);
    REQUIRE(endsWith(lines[0], "retry 2 of 5"));
    REQUIRE(endsWith(lines[1], "pi=3.14"));
    REQUIRE(endsWith(lines[2], "100% done"));
    REQUIRE(lines[2].find("[wrn]") != std::string::npos);
    REQUIRE(endsWith(lines[3], "   ab|7  |"));
    REQUIRE(endsWith(lines[4], "hello world"));
}

/**
 * @brief Too few or too many arguments raise FormatMismatch and write nothing
 */
TEST_CASE_PERSISTENT_FIXTURE(redlog::tests::RegistryFixture, "Printf mismatch raises", "[printf]")
{
    auto const log = getLogger("fmt");
    REQUIRE(log.formatErrorPolicy() == FormatErrorPolicy::Raise);

    REQUIRE_THROWS_AS(log.errorf("%d and %d", 1), FormatMismatch);
    REQUIRE_THROWS_AS(log.errorf("%d", 1, 2), FormatMismatch);
    REQUIRE_THROWS_AS(log.criticalf("no placeholders", 1), FormatMismatch);
    REQUIRE_THROWS_AS(log.crtf("%s"), FormatMismatch);

    try
    {
        log.errorf("%d and %d", 1);
        FAIL("expected FormatMismatch");
    }
    catch (Exception const& e)
    {
        REQUIRE(e.status() == Status::FormatMismatch);
        REQUIRE(std::string{e.what()}.find("%d and %d") != std::string::npos);
    }

    REQUIRE(sink->size() == 0U);
}

/**
 * @brief The inline policy emits the format with a marker instead of throwing
 */
TEST_CASE_PERSISTENT_FIXTURE(redlog::tests::RegistryFixture, "Printf mismatch inline", "[printf]")
{
    auto const log = getLogger("fmt").withFormatErrorPolicy(FormatErrorPolicy::Inline);

    REQUIRE_NOTHROW(log.errorf("%d and %d", 1));
    REQUIRE(sink->size() == 1U);
    REQUIRE(endsWith(sink->lines()[0], "%d and %d [format error: expected 2 argument(s), got 1]"));

    // The registry policy is picked up by loggers created afterwards
    Registry::instance().setFormatErrorPolicy(FormatErrorPolicy::Inline);
    auto const later = getLogger("later");
    REQUIRE(later.formatErrorPolicy() == FormatErrorPolicy::Inline);
    REQUIRE_NOTHROW(later.warnf("%s", "a", "b"));
    REQUIRE(sink->lines().back().find("[format error:") != std::string::npos);

    // An explicit policy wins over the registry's
    REQUIRE(getLogger("strict", FormatErrorPolicy::Raise).formatErrorPolicy() == FormatErrorPolicy::Raise);
    REQUIRE_THROWS_AS(getLogger("strict", FormatErrorPolicy::Raise).warnf("%s"), FormatMismatch);
}

/**
 * @brief A filtered call is never formatted, so a mismatch cannot surface
 */
TEST_CASE_PERSISTENT_FIXTURE(redlog::tests::RegistryFixture, "Printf filtered mismatch", "[printf]")
{
    setLevel(Level::Critical);
    auto const log = getLogger("fmt");

    REQUIRE_NOTHROW(log.errorf("%d and %d", 1));
    REQUIRE_NOTHROW(log.debugf("%s"));
    REQUIRE_NOTHROW(log.aygf("%d", 1, 2, 3));
    REQUIRE(sink->size() == 0U);
}

/**
 * @brief Every printf variant emits at its level
 */
TEST_CASE_PERSISTENT_FIXTURE(redlog::tests::RegistryFixture, "Printf level methods", "[printf]")
{
    setLevel(Level::Annoying);
    auto const log = getLogger("fmt");

    log.criticalf("%d", 1);
    log.errorf("%d", 1);
    log.warnf("%d", 1);
    log.infof("%d", 1);
    log.verbosef("%d", 1);
    log.tracef("%d", 1);
    log.debugf("%d", 1);
    log.pedanticf("%d", 1);
    log.annoyingf("%d", 1);
    log.crtf("%d", 1);
    log.wrnf("%d", 1);
    log.vrbf("%d", 1);
    log.trcf("%d", 1);
    log.dbgf("%d", 1);
    log.pedf("%d", 1);

    auto const lines = sink->lines();
    REQUIRE(lines.size() == 15U);
    REQUIRE(lines[0].find("[crt]") != std::string::npos);
    REQUIRE(lines[8].find("[ayg]") != std::string::npos);
    REQUIRE(lines[14].find("[ped]") != std::string::npos);
}
