// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <redlog/redlog.hpp>

namespace redlog::tests
{
    //
    // RAII helper that puts the Registry in a known state for the duration of a
    // test and restores the previous configuration afterwards.
    //
    class RegistryFixture
    {
    public:
        /// Install a StringSink, the plain theme, level info, color off and the raise policy.
        RegistryFixture();
        /// Restore level, theme, sink, color flag and format error policy.
        ~RegistryFixture();

    protected:
        /// Receives every line written through the Registry's sink
        std::shared_ptr<StringSink> sink;

    private:
        Level _savedLevel;
        Theme _savedTheme;
        std::shared_ptr<Sink> _savedSink;
        bool _savedColorEnabled;
        FormatErrorPolicy _savedPolicy;
    };

    //
    // Formatter that counts its invocations and renders "<lvl> <message>".
    //
    class CountingFormatter final : public Formatter
    {
    public:
        [[nodiscard]]
        std::string format(LogEntry const& entry, Theme const& theme, bool colorEnabled) const override;

        [[nodiscard]]
        int calls() const noexcept;

    private:
        mutable std::atomic<int> _calls{0};
    };

    //
    // Sink that fails every write with an IoError.
    //
    class FailingSink final : public Sink
    {
    public:
        void write(std::string_view line) override;
        void flush() override;
    };

    // Simple utility to read a file into a string
    std::string readFile(std::filesystem::path const& filepath);

    // Helper to make a unique path in the temporary directory
    auto makeTempPath(std::string const& stem) -> std::filesystem::path;

} // namespace redlog::tests
