/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/codec/TextCodec.hpp"

#include "ordprops/base/PropertiesException.hpp"
#include "ordprops/util/logging.hpp"
#include "ordprops/util/unicode.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <cstdint>
#include <source_location>

//-------------------------------------------------------------------------

namespace ordprops::codec
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] constexpr bool isWhitespace(char32_t c) noexcept
{
    return c == U' ' || c == U'\t' || c == U'\f';
}

[[nodiscard]] constexpr bool isSeparator(char32_t c) noexcept
{
    return c == U'=' || c == U':';
}

[[nodiscard]] int hexDigit(char32_t c) noexcept
{
    if (c >= U'0' && c <= U'9') return static_cast<int>(c - U'0');
    if (c >= U'a' && c <= U'f') return static_cast<int>(c - U'a') + 10;
    if (c >= U'A' && c <= U'F') return static_cast<int>(c - U'A') + 10;
    return -1;
}

[[nodiscard]] std::string unescape(std::u32string_view in, size_t lineNumber)
{
    std::u32string out;
    out.reserve(in.size());

    size_t i = 0;
    while (i < in.size()) {
        char32_t c = in[i++];
        if (c != U'\\') {
            out.push_back(c);
            continue;
        }
        if (i == in.size()) {
            break;
        }
        c = in[i++];
        switch (c) {
            case U'u': {
                if (i + 4 > in.size()) {
                    throw FormatError{fmt::format(
                        "{}: malformed \\uxxxx encoding on line {}",
                        std::source_location::current().function_name(),
                        lineNumber)};
                }
                char32_t value = 0;
                for (size_t j = 0; j < 4; ++j) {
                    const int digit = hexDigit(in[i++]);
                    if (digit < 0) {
                        throw FormatError{fmt::format(
                            "{}: malformed \\uxxxx encoding on line {}",
                            std::source_location::current().function_name(),
                            lineNumber)};
                    }
                    value = (value << 4) | static_cast<char32_t>(digit);
                }
                out.push_back(value);
                break;
            }
            case U't': out.push_back(U'\t'); break;
            case U'r': out.push_back(U'\r'); break;
            case U'n': out.push_back(U'\n'); break;
            case U'f': out.push_back(U'\f'); break;
            default: out.push_back(c); break;
        }
    }

    return util::codePointsToUtf8(util::combineSurrogates(out));
}

void appendUnicodeEscape(std::u32string& out, char32_t c)
{
    auto appendUnit = [&out](char32_t unit) {
        for (char ch : fmt::format("\\u{:04X}", static_cast<uint32_t>(unit))) {
            out.push_back(static_cast<char32_t>(ch));
        }
    };
    if (c > 0xFFFF) {
        const char32_t offset = c - 0x10000;
        appendUnit(0xD800 + (offset >> 10));
        appendUnit(0xDC00 + (offset & 0x3FF));
    }
    else {
        appendUnit(c);
    }
}

[[nodiscard]] std::u32string escape(std::string_view str, bool escapeSpace, bool escapeUnicode)
{
    const std::u32string in = util::utf8ToCodePoints(str);
    std::u32string out;
    out.reserve(in.size() * 2);

    for (size_t i = 0; i < in.size(); ++i) {
        const char32_t c = in[i];
        if (c > 61 && c < 127) {
            if (c == U'\\') {
                out.append(U"\\\\");
            } else {
                out.push_back(c);
            }
            continue;
        }
        switch (c) {
            case U' ':
                if (i == 0 || escapeSpace) {
                    out.push_back(U'\\');
                }
                out.push_back(U' ');
                break;
            case U'\t': out.append(U"\\t"); break;
            case U'\n': out.append(U"\\n"); break;
            case U'\r': out.append(U"\\r"); break;
            case U'\f': out.append(U"\\f"); break;
            case U'=':
            case U':':
            case U'#':
            case U'!':
                out.push_back(U'\\');
                out.push_back(c);
                break;
            default:
                if (escapeUnicode && (c < 0x20 || c > 0x7E)) {
                    appendUnicodeEscape(out, c);
                } else {
                    out.push_back(c);
                }
                break;
        }
    }

    return out;
}

// Embedded line breaks open a new comment line unless the text already
// carries a comment marker there.
void writeComment(TextSink& sink, std::u32string_view comment)
{
    sink.write(U"#");

    const size_t len = comment.size();
    size_t last = 0;
    for (size_t current = 0; current < len; ++current) {
        const char32_t c = comment[current];
        if (c <= 0xFF && c != U'\n' && c != U'\r') {
            continue;
        }
        if (last != current) {
            sink.write(comment.substr(last, current - last));
        }
        if (c > 0xFF) {
            std::u32string escaped;
            appendUnicodeEscape(escaped, c);
            sink.write(escaped);
        }
        else {
            sink.write(lineSeparator());
            if (c == U'\r' && current != len - 1 && comment[current + 1] == U'\n') {
                ++current;
            }
            if (current == len - 1
                || (comment[current + 1] != U'#' && comment[current + 1] != U'!')) {
                sink.write(U"#");
            }
        }
        last = current + 1;
    }
    if (last != len) {
        sink.write(comment.substr(last));
    }

    sink.write(lineSeparator());
}

}  // namespace

//-------------------------------------------------------------------------

TextCodec::TextCodec(IPropertyStorage& storage, Clock clock) noexcept
    : m_storage{storage}, m_clock{std::move(clock)}
{}

//-------------------------------------------------------------------------

void TextCodec::load(std::istream& is)
{
    auto reader = LineReader::fromStream(is);
    load(reader);
}

//-------------------------------------------------------------------------

void TextCodec::load(std::wistream& is)
{
    auto reader = LineReader::fromStream(is);
    load(reader);
}

//-------------------------------------------------------------------------

void TextCodec::load(LineReader& reader)
{
    size_t entryCount = 0;
    size_t overriddenCount = 0;

    while (const auto line = reader.readLine()) {
        const std::u32string_view view{*line};
        const size_t limit = view.size();

        size_t keyLen = 0;
        size_t valueStart = limit;
        bool hasSeparator = false;
        bool precedingBackslash = false;
        while (keyLen < limit) {
            const char32_t c = view[keyLen];
            if (isSeparator(c) && !precedingBackslash) {
                valueStart = keyLen + 1;
                hasSeparator = true;
                break;
            }
            if (isWhitespace(c) && !precedingBackslash) {
                valueStart = keyLen + 1;
                break;
            }
            precedingBackslash = c == U'\\' ? !precedingBackslash : false;
            ++keyLen;
        }
        while (valueStart < limit) {
            const char32_t c = view[valueStart];
            if (!isWhitespace(c)) {
                if (hasSeparator || !isSeparator(c)) {
                    break;
                }
                hasSeparator = true;
            }
            ++valueStart;
        }

        const auto lineNumber = reader.lineNumber();
        std::string key = unescape(view.substr(0, keyLen), lineNumber);
        std::string value = unescape(view.substr(valueStart), lineNumber);

        if (m_storage.contains(key)) {
            ++overriddenCount;
        }
        m_storage.put(key, std::move(value));
        ++entryCount;
    }

    util::logger().debug(
        "Loaded {} properties ({} overriding earlier keys)", entryCount, overriddenCount);
}

//-------------------------------------------------------------------------

void TextCodec::store(std::ostream& os, const std::optional<std::string>& comment)
{
    ByteStreamSink sink{os};
    store(sink, comment, true);
}

//-------------------------------------------------------------------------

void TextCodec::store(std::wostream& os, const std::optional<std::string>& comment)
{
    WideStreamSink sink{os};
    store(sink, comment, false);
}

//-------------------------------------------------------------------------

void TextCodec::store(
    TextSink& sink, const std::optional<std::string>& comment, bool escapeUnicode)
{
    if (comment.has_value()) {
        writeComment(sink, util::utf8ToCodePoints(*comment));
    }
    sink.write(U"#" + util::utf8ToCodePoints(formatTimestamp(m_clock())));
    sink.write(lineSeparator());

    size_t entryCount = 0;
    for (const std::string& key : m_storage.keys()) {
        const auto value = m_storage.get(key);
        if (!value.has_value()) {
            continue;
        }
        sink.write(escape(key, true, escapeUnicode) + U"=" + escape(*value, false, escapeUnicode));
        sink.write(lineSeparator());
        ++entryCount;
    }
    sink.flush();

    util::logger().debug("Stored {} properties", entryCount);
}

//-------------------------------------------------------------------------

std::string TextCodec::formatTimestamp(std::chrono::system_clock::time_point tp)
{
    return fmt::format("{:%a %b %d %H:%M:%S %Z %Y}", fmt::localtime(tp));
}

//-------------------------------------------------------------------------

}  // namespace ordprops::codec

//-------------------------------------------------------------------------
