/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <istream>
#include <optional>
#include <string>
#include <utility>

//-------------------------------------------------------------------------

namespace ordprops::codec
{

//-------------------------------------------------------------------------
// Splits properties text into logical lines: blank and comment lines are
// skipped, leading whitespace is stripped, and a line ending in an odd
// number of backslashes is joined with the next one.

class LineReader
{
public:
    explicit LineReader(std::u32string text) noexcept : m_text{std::move(text)} {}

    // Bytes are taken as ISO-8859-1.
    [[nodiscard]] static LineReader fromStream(std::istream& is);
    [[nodiscard]] static LineReader fromStream(std::wistream& is);

    [[nodiscard]] std::optional<std::u32string> readLine();

    // 1-based natural line on which the last logical line began.
    [[nodiscard]] size_t lineNumber() const noexcept;

private:
    std::u32string m_text;
    size_t m_pos{};
    size_t m_line{1};
    size_t m_lineNumber{1};
};

//-------------------------------------------------------------------------

}  // namespace ordprops::codec

//-------------------------------------------------------------------------
