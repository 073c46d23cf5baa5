// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Sink.hpp
 * @brief Append-only destinations for rendered log lines
 *
 * A Sink receives complete lines and appends each one followed by a line
 * terminator. Sinks do not lock: the Logger serializes every write through the
 * Registry's writer lock, so two emits never interleave inside a line even if
 * they target different Sink objects sharing one stream.
 *
 * Failures are not swallowed. A write that leaves the underlying stream in a
 * failed state throws Exception with Status::IoError.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include "redlog/platform.hpp"

namespace redlog
{
    class REDLOG_EXPORT Sink
    {
    public:
        virtual ~Sink();

        /**
         * Append line followed by a line terminator.
         *
         * Called with the Registry's writer lock held. An implementation must
         * not emit through a redlog Logger, the lock is not recursive and the
         * call would deadlock.
         *
         * @throws Exception (Status::IoError) if the line could not be written.
         */
        virtual void write(std::string_view line) = 0;

        /**
         * Push buffered output to its destination.
         * @throws Exception (Status::IoError) if buffered output was lost.
         */
        virtual void flush() = 0;
    };

    /**
     * Writes to a standard stream (std::cerr by default) and flushes after
     * every line. The stream must outlive the sink.
     */
    class REDLOG_EXPORT ConsoleSink final : public Sink
    {
    public:
        ConsoleSink();
        explicit ConsoleSink(std::ostream& stream);

        void write(std::string_view line) override;
        void flush() override;

    private:
        std::ostream* _stream;
    };

    /** Appends to a file, creating it if needed. Every line is flushed as it is written. */
    class REDLOG_EXPORT FileSink final : public Sink
    {
    public:
        /**
         * @throws Exception (Status::IoError) if the file cannot be opened.
         */
        explicit FileSink(std::filesystem::path path);

        void write(std::string_view line) override;
        void flush() override;

        [[nodiscard]]
        std::filesystem::path const& path() const noexcept;

    private:
        std::filesystem::path _path;
        std::ofstream _file;
    };

    /**
     * Captures lines in memory. Mostly useful in tests.
     * The accessors may be called while other threads are logging.
     */
    class REDLOG_EXPORT StringSink final : public Sink
    {
    public:
        void write(std::string_view line) override;
        void flush() override;

        /** Snapshot of the captured lines, without terminators. */
        [[nodiscard]]
        std::vector<std::string> lines() const;

        /** The captured lines joined with '\n'. */
        [[nodiscard]]
        std::string output() const;

        [[nodiscard]]
        std::size_t size() const;

        void clear();

    private:
        mutable std::mutex _mutex;
        std::vector<std::string> _lines;
    };

    /**
     * Fans every line out to several sinks.
     *
     * Every child is attempted even if an earlier one fails; the first failure
     * is rethrown once all children have been written.
     */
    class REDLOG_EXPORT MultiplexSink final : public Sink
    {
    public:
        MultiplexSink() = default;
        explicit MultiplexSink(std::vector<std::shared_ptr<Sink>> sinks);

        /** Add a child. Not synchronized with concurrent writes. */
        void addSink(std::shared_ptr<Sink> sink);

        void write(std::string_view line) override;
        void flush() override;

    private:
        std::vector<std::shared_ptr<Sink>> _sinks;
    };
}
