// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_registry.cpp
 * @brief Unit tests for the process-wide Registry
 *
 * These tests use the RegistryFixture so that every test starts from the same
 * configuration and leaves the Registry as it found it.
 */

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <catch2/catch_test_macros.hpp>
#include <redlog/redlog.hpp>
#include "Utils.hpp"

using namespace redlog;

/**
 * @brief The minimum level is a single process-wide value
 */
TEST_CASE_PERSISTENT_FIXTURE(redlog::tests::RegistryFixture, "Registry level", "[registry]")
{
    auto& registry = Registry::instance();
    REQUIRE(&registry == &Registry::instance());
    REQUIRE(registry.getLevel() == Level::Info);

    setLevel(Level::Error);
    REQUIRE(getLevel() == Level::Error);
    REQUIRE(registry.getLevel() == Level::Error);
    REQUIRE(registry.isEnabled(Level::Critical));
    REQUIRE(registry.isEnabled(Level::Error));
    REQUIRE_FALSE(registry.isEnabled(Level::Warn));

    setLevel(Level::Annoying);
    for (auto const level : ALL_LEVELS)
    {
        REQUIRE(registry.isEnabled(level));
    }
}

/**
 * @brief Setting a theme replaces the previous one; old snapshots stay valid
 */
TEST_CASE_PERSISTENT_FIXTURE(redlog::tests::RegistryFixture, "Registry theme", "[registry]")
{
    auto& registry = Registry::instance();
    REQUIRE(getTheme().name == "plain");

    auto const before = registry.theme();

    auto custom = themes::plain();
    custom.name = "narrow";
    custom.sourceWidth = 4;
    setTheme(custom);

    REQUIRE(getTheme().name == "narrow");
    REQUIRE(registry.theme()->sourceWidth == 4U);
    REQUIRE(before->name == "plain");
}

/**
 * @brief The default sink can be replaced; a null sink restores the console
 */
TEST_CASE_PERSISTENT_FIXTURE(redlog::tests::RegistryFixture, "Registry sink", "[registry]")
{
    auto& registry = Registry::instance();
    REQUIRE(registry.getSink() == sink);

    getLogger("app").info("hello");
    REQUIRE(sink->size() == 1U);

    auto const other = std::make_shared<StringSink>();
    registry.setSink(other);
    getLogger("app").info("again");
    REQUIRE(sink->size() == 1U);
    REQUIRE(other->size() == 1U);

    registry.setSink(nullptr);
    REQUIRE(registry.getSink() != nullptr);
    REQUIRE(dynamic_cast<ConsoleSink*>(registry.getSink().get()) != nullptr);
}

/**
 * @brief Default theme follows the color capability
 */
TEST_CASE_PERSISTENT_FIXTURE(redlog::tests::RegistryFixture, "Registry color support", "[registry]")
{
    auto& registry = Registry::instance();

    REQUIRE(Registry::defaultThemeFor(true).name == "colorized");
    REQUIRE(Registry::defaultThemeFor(false).name == "plain");

    registry.setColorEnabled(true);
    REQUIRE(registry.colorEnabled());
    registry.setColorEnabled(false);
    REQUIRE_FALSE(registry.colorEnabled());

    ::setenv("NO_COLOR", "1", 1);
    REQUIRE_FALSE(registry.refreshColorSupport());
    REQUIRE_FALSE(registry.colorEnabled());
    REQUIRE(getTheme().isPlain());
    ::unsetenv("NO_COLOR");

    ::setenv("REDLOG_FORCE_COLOR", "1", 1);
    REQUIRE(registry.refreshColorSupport());
    REQUIRE(registry.colorEnabled());
    REQUIRE(getTheme().name == "colorized");
    ::unsetenv("REDLOG_FORCE_COLOR");
}

/**
 * @brief Options are applied field by field, absent keys leave settings alone
 */
TEST_CASE_PERSISTENT_FIXTURE(redlog::tests::RegistryFixture, "Registry apply options", "[registry]")
{
    auto& registry = Registry::instance();

    registry.apply(Options{});
    REQUIRE(registry.getLevel() == Level::Info);
    REQUIRE(getTheme().name == "plain");

    configure(R"({"level": "dbg", "color": "always", "theme": "colorized", "formatErrors": "inline"})");
    REQUIRE(registry.getLevel() == Level::Debug);
    REQUIRE(registry.colorEnabled());
    REQUIRE(getTheme().name == "colorized");
    REQUIRE(registry.formatErrorPolicy() == FormatErrorPolicy::Inline);
    REQUIRE(getLogger("app").formatErrorPolicy() == FormatErrorPolicy::Inline);

    configure(R"({"color": "never"})");
    REQUIRE_FALSE(registry.colorEnabled());
    REQUIRE(getTheme().name == "colorized");
    REQUIRE(registry.getLevel() == Level::Debug);

    // An explicit theme wins over the one picked by "auto"
    ::setenv("REDLOG_FORCE_COLOR", "1", 1);
    configure(R"({"color": "auto", "theme": "plain"})");
    ::unsetenv("REDLOG_FORCE_COLOR");
    REQUIRE(registry.colorEnabled());
    REQUIRE(getTheme().name == "plain");

    REQUIRE_THROWS_AS(configure(R"({"level": "loud"})"), std::invalid_argument);
    REQUIRE(registry.getLevel() == Level::Debug);
}
