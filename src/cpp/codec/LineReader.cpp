/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/codec/LineReader.hpp"

#include "ordprops/base/PropertiesException.hpp"

#include <fmt/format.h>

#include <array>
#include <concepts>
#include <source_location>

//-------------------------------------------------------------------------

namespace ordprops::codec
{

//-------------------------------------------------------------------------

namespace
{

template<typename CharT>
[[nodiscard]] std::u32string readAll(std::basic_istream<CharT>& is)
{
    if (is.fail()) {
        throw IOError{fmt::format(
            "{}: input stream is not readable",
            std::source_location::current().function_name())};
    }

    std::u32string ret;
    std::array<CharT, 4096> buf;
    while (is.read(buf.data(), static_cast<std::streamsize>(buf.size())) || is.gcount() > 0) {
        for (std::streamsize i = 0; i < is.gcount(); ++i) {
            if constexpr (std::same_as<CharT, char>) {
                ret.push_back(static_cast<unsigned char>(buf[i]));
            } else {
                ret.push_back(static_cast<char32_t>(buf[i]));
            }
        }
    }

    if (is.bad()) {
        throw IOError{fmt::format(
            "{}: failed reading input stream after {} characters",
            std::source_location::current().function_name(),
            ret.size())};
    }

    return ret;
}

[[nodiscard]] constexpr bool isWhitespace(char32_t c) noexcept
{
    return c == U' ' || c == U'\t' || c == U'\f';
}

[[nodiscard]] constexpr bool isTerminator(char32_t c) noexcept
{
    return c == U'\n' || c == U'\r';
}

}  // namespace

//-------------------------------------------------------------------------

LineReader LineReader::fromStream(std::istream& is)
{
    return LineReader{readAll(is)};
}

//-------------------------------------------------------------------------

LineReader LineReader::fromStream(std::wistream& is)
{
    return LineReader{readAll(is)};
}

//-------------------------------------------------------------------------

std::optional<std::u32string> LineReader::readLine()
{
    std::u32string line;
    bool skipWhitespace = true;
    bool isNewLine = true;
    bool appendedLineBegin = false;
    bool precedingBackslash = false;

    while (m_pos < m_text.size()) {
        const char32_t c = m_text[m_pos++];

        if (skipWhitespace) {
            if (isWhitespace(c)) {
                continue;
            }
            if (!appendedLineBegin && isTerminator(c)) {
                if (c == U'\n' || m_pos == m_text.size() || m_text[m_pos] != U'\n') {
                    ++m_line;
                }
                continue;
            }
            skipWhitespace = false;
            appendedLineBegin = false;
        }

        if (isNewLine) {
            isNewLine = false;
            m_lineNumber = m_line;
            if (c == U'#' || c == U'!') {
                while (m_pos < m_text.size() && !isTerminator(m_text[m_pos])) {
                    ++m_pos;
                }
                isNewLine = true;
                skipWhitespace = true;
                continue;
            }
        }

        if (!isTerminator(c)) {
            line.push_back(c);
            precedingBackslash = c == U'\\' ? !precedingBackslash : false;
            continue;
        }

        if (c == U'\r' && m_pos < m_text.size() && m_text[m_pos] == U'\n') {
            ++m_pos;
        }
        ++m_line;

        if (!precedingBackslash) {
            return line;
        }

        line.pop_back();
        precedingBackslash = false;
        skipWhitespace = true;
        appendedLineBegin = true;
    }

    if (line.empty()) {
        return {};
    }
    if (precedingBackslash) {
        line.pop_back();
    }
    return line;
}

//-------------------------------------------------------------------------

size_t LineReader::lineNumber() const noexcept
{
    return m_lineNumber;
}

//-------------------------------------------------------------------------

}  // namespace ordprops::codec

//-------------------------------------------------------------------------
