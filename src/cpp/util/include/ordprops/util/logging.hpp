/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <spdlog/spdlog.h>

#include <string_view>

//-------------------------------------------------------------------------

namespace ordprops::util
{

//-------------------------------------------------------------------------

inline constexpr std::string_view kLoggerName = "ordprops";
inline constexpr std::string_view kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

// Shared library logger, writing to stderr at 'warn' unless reconfigured.
[[nodiscard]] spdlog::logger& logger();

void setLogLevel(spdlog::level::level_enum level);

//-------------------------------------------------------------------------

}  // namespace ordprops::util

//-------------------------------------------------------------------------
