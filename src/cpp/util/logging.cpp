/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/util/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>

//-------------------------------------------------------------------------

namespace ordprops::util
{

//-------------------------------------------------------------------------

spdlog::logger& logger()
{
    static const std::unique_ptr<spdlog::logger> s_logger = [] {
        auto logger = std::make_unique<spdlog::logger>(
            std::string{kLoggerName},
            std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        logger->set_level(spdlog::level::warn);
        logger->set_pattern(std::string{kLogPattern});
        return logger;
    }();
    return *s_logger;
}

//-------------------------------------------------------------------------

void setLogLevel(spdlog::level::level_enum level)
{
    logger().set_level(level);
}

//-------------------------------------------------------------------------

}  // namespace ordprops::util

//-------------------------------------------------------------------------
