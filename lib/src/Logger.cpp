// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logger.cpp
 * @brief Derivation and emission for immutable loggers
 */

#include "redlog/Logger.hpp"
#include <chrono>
#include <fmt/format.h>
#include "internal/Logging.hpp"
#include "internal/Printf.hpp"
#include "redlog/Exception.hpp"

namespace redlog
{
    namespace
    {
        std::shared_ptr<Formatter const> const& defaultFormatter()
        {
            static auto const formatter = std::shared_ptr<Formatter const>{std::make_shared<DefaultFormatter>()};
            return formatter;
        }

        void appendSegment(std::string& joined, std::string const& segment)
        {
            if (segment.empty())
            {
                return;
            }
            if (!joined.empty())
            {
                joined.push_back('.');
            }
            joined += segment;
        }
    }

    Logger::Logger(std::string name)
        : Logger{std::move(name), Registry::instance().formatErrorPolicy()}
    {}

    Logger::Logger(std::string name, FormatErrorPolicy policy)
        : _namePath{}
        , _name{}
        , _fields{}
        , _formatter{defaultFormatter()}
        , _sink{}
        , _formatErrorPolicy{policy}
    {
        appendSegment(_name, name);
        _namePath = _namePath.append(std::move(name));
    }

    Logger Logger::withName(std::string name) const
    {
        auto result = *this;
        appendSegment(result._name, name);
        result._namePath = _namePath.append(std::move(name));
        return result;
    }

    Logger Logger::withField(Field field) const
    {
        auto result = *this;
        result._fields = _fields.with(std::move(field));
        return result;
    }

    Logger Logger::withFields(FieldSet const& fields) const
    {
        auto result = *this;
        result._fields = _fields.with(fields);
        return result;
    }

    Logger Logger::withSink(std::shared_ptr<Sink> sink) const
    {
        auto result = *this;
        result._sink = std::move(sink);
        return result;
    }

    Logger Logger::withFormatter(std::shared_ptr<Formatter const> formatter) const
    {
        auto result = *this;
        result._formatter = formatter ? std::move(formatter) : defaultFormatter();
        return result;
    }

    Logger Logger::withFormatErrorPolicy(FormatErrorPolicy policy) const
    {
        auto result = *this;
        result._formatErrorPolicy = policy;
        return result;
    }

    std::string const& Logger::name() const noexcept
    {
        return _name;
    }

    std::vector<std::string> Logger::namePath() const
    {
        return _namePath.toVector();
    }

    FieldSet const& Logger::fields() const noexcept
    {
        return _fields;
    }

    FormatErrorPolicy Logger::formatErrorPolicy() const noexcept
    {
        return _formatErrorPolicy;
    }

    bool Logger::operator==(Logger const& other) const
    {
        return (_namePath == other._namePath) && (_fields == other._fields);
    }

    bool Logger::operator!=(Logger const& other) const
    {
        return !(*this == other);
    }

    std::string Logger::formatMessage(std::string_view format, fmt::printf_args args, std::size_t argCount) const
    {
        auto reason = std::string{};

        // fmt reports missing arguments itself but silently ignores surplus ones.
        if (auto const expected = internal::countPrintfArguments(format); expected && (*expected != argCount))
        {
            reason = fmt::format("expected {} argument(s), got {}", *expected, argCount);
        }
        else
        {
            try
            {
                return fmt::vsprintf(fmt::string_view{format.data(), format.size()}, args);
            }
            catch (fmt::format_error const& e)
            {
                reason = e.what();
            }
        }

        if (_formatErrorPolicy == FormatErrorPolicy::Raise)
        {
            throw FormatMismatch::make("Format \"{}\" does not match its arguments: {}", format, reason);
        }

        REDLOG_DEBUG("Format \"{}\" does not match its arguments: {}", format, reason);
        return fmt::format("{} [format error: {}]", format, reason);
    }

    void Logger::emit(Level level, std::string_view message, Field const* callFields, std::size_t count) const
    {
        auto& registry = Registry::instance();

        auto fields = _fields.fields();
        if (count > 0U)
        {
            fields.insert(fields.end(), callFields, callFields + count);
        }

        auto const entry = LogEntry{level, _name, message, resolveShadowing(std::move(fields)), std::chrono::system_clock::now()};

        // Theme and color flag are read per emit so that changes reach existing loggers.
        auto const theme = registry.theme();
        auto const line = _formatter->format(entry, *theme, registry.colorEnabled());

        auto const sink = _sink ? _sink : registry.getSink();
        registry.write(*sink, line);
    }
}
