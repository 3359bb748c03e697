/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/codec/TextSink.hpp"

#include "ordprops/base/PropertiesException.hpp"

#include <fmt/format.h>

#include <source_location>
#include <string>

//-------------------------------------------------------------------------

namespace ordprops::codec
{

//-------------------------------------------------------------------------

std::u32string_view lineSeparator() noexcept
{
#ifdef _WIN32
    return U"\r\n";
#else
    return U"\n";
#endif
}

//-------------------------------------------------------------------------

void ByteStreamSink::write(std::u32string_view chunk)
{
    std::string bytes;
    bytes.reserve(chunk.size());
    for (char32_t c : chunk) {
        bytes.push_back(c <= 0xFF ? static_cast<char>(c) : '?');
    }
    if (!m_os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()))) {
        throw IOError{fmt::format(
            "{}: failed writing {} bytes to output stream",
            std::source_location::current().function_name(),
            bytes.size())};
    }
}

//-------------------------------------------------------------------------

void ByteStreamSink::flush()
{
    if (!m_os.flush()) {
        throw IOError{fmt::format(
            "{}: failed flushing output stream",
            std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

void WideStreamSink::write(std::u32string_view chunk)
{
    std::wstring chars;
    chars.reserve(chunk.size());
    for (char32_t c : chunk) {
        chars.push_back(static_cast<wchar_t>(c));
    }
    if (!m_os.write(chars.data(), static_cast<std::streamsize>(chars.size()))) {
        throw IOError{fmt::format(
            "{}: failed writing {} characters to output stream",
            std::source_location::current().function_name(),
            chars.size())};
    }
}

//-------------------------------------------------------------------------

void WideStreamSink::flush()
{
    if (!m_os.flush()) {
        throw IOError{fmt::format(
            "{}: failed flushing output stream",
            std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

}  // namespace ordprops::codec

//-------------------------------------------------------------------------
