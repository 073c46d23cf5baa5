// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

#include "redlog/Sink.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>
#include <utility>
#include "internal/Logging.hpp"
#include "redlog/Exception.hpp"

namespace redlog
{
    Sink::~Sink() = default;

    ConsoleSink::ConsoleSink()
        : ConsoleSink{std::cerr}
    {}

    ConsoleSink::ConsoleSink(std::ostream& stream)
        : _stream{&stream}
    {}

    void ConsoleSink::write(std::string_view line)
    {
        _stream->write(line.data(), static_cast<std::streamsize>(line.size()));
        _stream->put('\n');
        _stream->flush();

        if (!*_stream)
        {
            throw Exception::ioError("Failed to write {} bytes to the console stream.", line.size() + 1U);
        }
    }

    void ConsoleSink::flush()
    {
        _stream->flush();
        if (!*_stream)
        {
            throw Exception::ioError("Failed to flush the console stream.");
        }
    }

    FileSink::FileSink(std::filesystem::path path)
        : _path{std::move(path)}
        , _file{_path, std::ios::out | std::ios::app}
    {
        if (!_file.is_open())
        {
            throw Exception::ioError("Failed to open log file '{}': {}", _path.string(), std::strerror(errno));
        }
        REDLOG_DEBUG("Opened log file '{}'", _path.string());
    }

    void FileSink::write(std::string_view line)
    {
        _file.write(line.data(), static_cast<std::streamsize>(line.size()));
        _file.put('\n');
        _file.flush();

        if (!_file)
        {
            // Clear the state so that later lines are attempted again.
            _file.clear();
            throw Exception::ioError("Failed to write to log file '{}'.", _path.string());
        }
    }

    void FileSink::flush()
    {
        _file.flush();
        if (!_file)
        {
            _file.clear();
            throw Exception::ioError("Failed to flush log file '{}'.", _path.string());
        }
    }

    std::filesystem::path const& FileSink::path() const noexcept
    {
        return _path;
    }

    void StringSink::write(std::string_view line)
    {
        auto const lock = std::lock_guard{_mutex};
        _lines.emplace_back(line);
    }

    void StringSink::flush()
    {}

    std::vector<std::string> StringSink::lines() const
    {
        auto const lock = std::lock_guard{_mutex};
        return _lines;
    }

    std::string StringSink::output() const
    {
        auto const lock = std::lock_guard{_mutex};

        auto result = std::string{};
        for (auto const& line : _lines)
        {
            if (!result.empty())
            {
                result.push_back('\n');
            }
            result += line;
        }
        return result;
    }

    std::size_t StringSink::size() const
    {
        auto const lock = std::lock_guard{_mutex};
        return _lines.size();
    }

    void StringSink::clear()
    {
        auto const lock = std::lock_guard{_mutex};
        _lines.clear();
    }

    MultiplexSink::MultiplexSink(std::vector<std::shared_ptr<Sink>> sinks)
        : _sinks{std::move(sinks)}
    {
        if (std::any_of(_sinks.begin(), _sinks.end(), [](auto const& sink) { return !sink; }))
        {
            throw Exception::invalidArgument("Cannot add a null sink to a multiplex sink.");
        }
    }

    void MultiplexSink::addSink(std::shared_ptr<Sink> sink)
    {
        if (!sink)
        {
            throw Exception::invalidArgument("Cannot add a null sink to a multiplex sink.");
        }
        _sinks.push_back(std::move(sink));
    }

    void MultiplexSink::write(std::string_view line)
    {
        auto firstFailure = std::exception_ptr{};
        for (auto const& sink : _sinks)
        {
            try
            {
                sink->write(line);
            }
            catch (std::exception const& e)
            {
                REDLOG_WARN("A multiplexed sink failed to write: {}", e.what());
                if (!firstFailure)
                {
                    firstFailure = std::current_exception();
                }
            }
        }

        if (firstFailure)
        {
            std::rethrow_exception(firstFailure);
        }
    }

    void MultiplexSink::flush()
    {
        for (auto const& sink : _sinks)
        {
            sink->flush();
        }
    }
}
