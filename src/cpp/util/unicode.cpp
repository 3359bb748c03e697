/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/util/unicode.hpp"

//-------------------------------------------------------------------------

namespace ordprops::util
{

//-------------------------------------------------------------------------

bool isHighSurrogate(char32_t c) noexcept
{
    return c >= 0xD800 && c <= 0xDBFF;
}

//-------------------------------------------------------------------------

bool isLowSurrogate(char32_t c) noexcept
{
    return c >= 0xDC00 && c <= 0xDFFF;
}

//-------------------------------------------------------------------------

std::u32string utf8ToCodePoints(std::string_view str)
{
    std::u32string ret;
    ret.reserve(str.size());

    size_t i = 0;
    while (i < str.size()) {
        const auto lead = static_cast<unsigned char>(str[i]);
        size_t len;
        char32_t cp;
        if (lead < 0x80) {
            ret.push_back(lead);
            ++i;
            continue;
        }
        else if ((lead & 0xE0) == 0xC0) {
            len = 2;
            cp = lead & 0x1F;
        }
        else if ((lead & 0xF0) == 0xE0) {
            len = 3;
            cp = lead & 0x0F;
        }
        else if ((lead & 0xF8) == 0xF0) {
            len = 4;
            cp = lead & 0x07;
        }
        else {
            ret.push_back(kReplacementChar);
            ++i;
            continue;
        }

        if (i + len > str.size()) {
            ret.push_back(kReplacementChar);
            break;
        }

        bool valid = true;
        for (size_t j = 1; j < len; ++j) {
            const auto cont = static_cast<unsigned char>(str[i + j]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        static constexpr char32_t minForLength[]{0, 0, 0x80, 0x800, 0x10000};
        if (!valid
            || cp < minForLength[len]
            || cp > 0x10FFFF
            || isHighSurrogate(cp)
            || isLowSurrogate(cp)) {
            ret.push_back(kReplacementChar);
            ++i;
            continue;
        }

        ret.push_back(cp);
        i += len;
    }

    return ret;
}

//-------------------------------------------------------------------------

std::string codePointsToUtf8(std::u32string_view str)
{
    std::string ret;
    ret.reserve(str.size());

    for (char32_t cp : str) {
        if (isHighSurrogate(cp) || isLowSurrogate(cp) || cp > 0x10FFFF) {
            cp = kReplacementChar;
        }
        if (cp < 0x80) {
            ret.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800) {
            ret.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            ret.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000) {
            ret.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            ret.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            ret.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else {
            ret.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            ret.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            ret.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            ret.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    return ret;
}

//-------------------------------------------------------------------------

std::u32string combineSurrogates(std::u32string_view str)
{
    std::u32string ret;
    ret.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        const char32_t c = str[i];
        if (isHighSurrogate(c) && i + 1 < str.size() && isLowSurrogate(str[i + 1])) {
            ret.push_back(0x10000 + ((c - 0xD800) << 10) + (str[i + 1] - 0xDC00));
            ++i;
        }
        else {
            ret.push_back(c);
        }
    }

    return ret;
}

//-------------------------------------------------------------------------

}  // namespace ordprops::util

//-------------------------------------------------------------------------
