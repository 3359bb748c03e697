/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/properties/CommentSuppressingSink.hpp"

//-------------------------------------------------------------------------

namespace ordprops
{

//-------------------------------------------------------------------------

void CommentSuppressingSink::write(std::u32string_view chunk)
{
    if (chunk.empty()) {
        return;
    }
    if (m_headerDone) {
        m_destination.write(chunk);
        return;
    }

    if (m_pending.has_value()) {
        m_pending->append(chunk);
        if (chunk.ends_with(m_lineSeparator)) {
            completeLine();
        }
    }
    else if ((chunk.front() == U'#' || chunk.front() == U'!')) {
        m_pending.emplace(chunk);
        if (chunk.ends_with(m_lineSeparator)) {
            completeLine();
        }
    }
    else {
        m_held.reset();
        m_headerDone = true;
        m_destination.write(chunk);
    }
}

//-------------------------------------------------------------------------

void CommentSuppressingSink::flush()
{
    m_destination.flush();
}

//-------------------------------------------------------------------------

void CommentSuppressingSink::completeLine()
{
    if (m_held.has_value()) {
        m_destination.write(*m_held);
    }
    m_held = std::move(m_pending);
    m_pending.reset();
}

//-------------------------------------------------------------------------

}  // namespace ordprops

//-------------------------------------------------------------------------
