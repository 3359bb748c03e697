/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace ordprops::util
{

//-------------------------------------------------------------------------

inline constexpr char32_t kReplacementChar = U'\uFFFD';

[[nodiscard]] bool isHighSurrogate(char32_t c) noexcept;
[[nodiscard]] bool isLowSurrogate(char32_t c) noexcept;

// Ill-formed sequences decode to U+FFFD.
[[nodiscard]] std::u32string utf8ToCodePoints(std::string_view str);

// Unpaired surrogates encode to U+FFFD.
[[nodiscard]] std::string codePointsToUtf8(std::u32string_view str);

// Joins high/low surrogate pairs left behind by \uXXXX escapes.
[[nodiscard]] std::u32string combineSurrogates(std::u32string_view str);

//-------------------------------------------------------------------------

}  // namespace ordprops::util

//-------------------------------------------------------------------------
