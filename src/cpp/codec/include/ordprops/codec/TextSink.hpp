/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <ostream>
#include <string_view>

//-------------------------------------------------------------------------

namespace ordprops::codec
{

//-------------------------------------------------------------------------

// Terminator the text codec ends every line with.
[[nodiscard]] std::u32string_view lineSeparator() noexcept;

//-------------------------------------------------------------------------
// Destination of the text codec's output, one write() per chunk.

class TextSink
{
public:
    virtual ~TextSink() noexcept = default;

    virtual void write(std::u32string_view chunk) = 0;
    virtual void flush() = 0;

protected:
    TextSink() noexcept = default;
};

//-------------------------------------------------------------------------
// ISO-8859-1 encoding onto a byte stream; unmappable code points become '?'.

class ByteStreamSink : public TextSink
{
public:
    explicit ByteStreamSink(std::ostream& os) noexcept : m_os{os} {}

    void write(std::u32string_view chunk) override;
    void flush() override;

private:
    std::ostream& m_os;
};

//-------------------------------------------------------------------------

class WideStreamSink : public TextSink
{
public:
    explicit WideStreamSink(std::wostream& os) noexcept : m_os{os} {}

    void write(std::u32string_view chunk) override;
    void flush() override;

private:
    std::wostream& m_os;
};

//-------------------------------------------------------------------------

}  // namespace ordprops::codec

//-------------------------------------------------------------------------
