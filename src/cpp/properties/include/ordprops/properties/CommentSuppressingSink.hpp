/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/codec/TextSink.hpp"

#include <optional>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace ordprops
{

//-------------------------------------------------------------------------
// Drops the last of the comment lines leading the text codec's output,
// which is where the codec puts its timestamp. Everything else reaches the
// destination unchanged and in order.
//
// Relies on the codec's chunking: a comment line starts at a write() whose
// chunk begins with '#' or '!', and ends at a write() whose chunk ends with
// the line separator. The last completed comment line is held back until
// another one completes; once non-comment output starts it is discarded.

class CommentSuppressingSink : public codec::TextSink
{
public:
    explicit CommentSuppressingSink(
        codec::TextSink& destination,
        std::u32string_view lineSeparator = codec::lineSeparator()) noexcept
        : m_destination{destination}, m_lineSeparator{lineSeparator}
    {}

    void write(std::u32string_view chunk) override;
    void flush() override;

private:
    void completeLine();

    codec::TextSink& m_destination;
    std::u32string_view m_lineSeparator;
    std::optional<std::u32string> m_pending;
    std::optional<std::u32string> m_held;
    bool m_headerDone{};
};

//-------------------------------------------------------------------------

}  // namespace ordprops

//-------------------------------------------------------------------------
