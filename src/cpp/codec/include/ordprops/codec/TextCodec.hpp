/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/codec/IPropertyStorage.hpp"
#include "ordprops/codec/LineReader.hpp"
#include "ordprops/codec/TextSink.hpp"

#include <chrono>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

//-------------------------------------------------------------------------

namespace ordprops::codec
{

//-------------------------------------------------------------------------
// Line-oriented properties format, reading and writing through the storage
// it is given.
//
// store() emits, each as a separate sink write:
//   "#" and the comment pieces, then a line separator (per comment line)
//   "#<timestamp>", then a line separator
//   "key=value", then a line separator (per entry, in storage key order)

class TextCodec
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit TextCodec(
        IPropertyStorage& storage, Clock clock = std::chrono::system_clock::now) noexcept;

    void load(std::istream& is);
    void load(std::wistream& is);
    void load(LineReader& reader);

    // Byte output escapes everything outside printable ASCII as \uXXXX.
    void store(std::ostream& os, const std::optional<std::string>& comment);
    void store(std::wostream& os, const std::optional<std::string>& comment);
    void store(TextSink& sink, const std::optional<std::string>& comment, bool escapeUnicode);

    // Local time as "Www Mmm dd hh:mm:ss zzz yyyy".
    [[nodiscard]] static std::string formatTimestamp(std::chrono::system_clock::time_point tp);

private:
    IPropertyStorage& m_storage;
    Clock m_clock;
};

//-------------------------------------------------------------------------

}  // namespace ordprops::codec

//-------------------------------------------------------------------------
