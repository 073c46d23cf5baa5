// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <fmt/format.h>

namespace redlog::tests
{
    RegistryFixture::RegistryFixture()
        : sink{std::make_shared<StringSink>()}
        , _savedLevel{Registry::instance().getLevel()}
        , _savedTheme{Registry::instance().getTheme()}
        , _savedSink{Registry::instance().getSink()}
        , _savedColorEnabled{Registry::instance().colorEnabled()}
        , _savedPolicy{Registry::instance().formatErrorPolicy()}
    {
        auto& registry = Registry::instance();
        registry.setLevel(Level::Info);
        registry.setTheme(themes::plain());
        registry.setColorEnabled(false);
        registry.setFormatErrorPolicy(FormatErrorPolicy::Raise);
        registry.setSink(sink);
    }

    RegistryFixture::~RegistryFixture()
    {
        auto& registry = Registry::instance();
        registry.setLevel(_savedLevel);
        registry.setTheme(_savedTheme);
        registry.setSink(_savedSink);
        registry.setColorEnabled(_savedColorEnabled);
        registry.setFormatErrorPolicy(_savedPolicy);
    }

    std::string CountingFormatter::format(LogEntry const& entry, Theme const&, bool) const
    {
        ++_calls;
        return fmt::format("{} {}", levelShortName(entry.level), entry.message);
    }

    int CountingFormatter::calls() const noexcept
    {
        return _calls.load();
    }

    void FailingSink::write(std::string_view)
    {
        throw Exception::ioError("Simulated write failure.");
    }

    void FailingSink::flush()
    {}

    std::string readFile(std::filesystem::path const& filepath)
    {
        auto file = std::ifstream{filepath, std::ios::in | std::ios::binary};
        if (!file)
        {
            throw std::runtime_error("Failed to open file: " + filepath.string());
        }
        auto buffer = std::stringstream{};
        buffer << file.rdbuf();
        return buffer.str();
    }

    auto makeTempPath(std::string const& stem) -> std::filesystem::path
    {
        auto const stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        return std::filesystem::temp_directory_path() / fmt::format("redlog_{}_{}.log", stem, stamp);
    }
}
