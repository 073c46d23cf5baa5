// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.cpp
 * @brief Creates the spdlog logger used for redlog's own diagnostics
 *
 * The logger is not registered in spdlog's global registry, so it neither
 * clashes with nor is reconfigured by an application that also uses spdlog.
 */

#include "internal/Logging.hpp"
#include <cstdlib>
#include <memory>
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace redlog::internal
{
    namespace
    {
        std::shared_ptr<spdlog::logger> makeDiagnosticsLogger()
        {
            auto logger = std::make_shared<spdlog::logger>("redlog", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

            auto level = spdlog::level::warn;
            if (auto const env = std::getenv(DIAGNOSTICS_LEVEL_ENV); (env != nullptr) && (*env != '\0'))
            {
                // from_str() maps unknown names to "off", which would silently
                // hide a typo. Only accept names spdlog actually knows.
                auto const parsed = spdlog::level::from_str(env);
                if ((parsed != spdlog::level::off) || (std::string{env} == "off"))
                {
                    level = parsed;
                }
            }
            logger->set_level(level);
            return logger;
        }
    }

    spdlog::logger& diagnostics()
    {
        static auto const logger = makeDiagnosticsLogger();
        return *logger;
    }
}
