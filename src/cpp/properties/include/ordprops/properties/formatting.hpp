/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/properties/OrderedProperties.hpp"

#include <fmt/format.h>

//-------------------------------------------------------------------------
// Renders as {k1=v1, k2=v2} in iteration order.

template<>
struct fmt::formatter<ordprops::OrderedProperties>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const ordprops::OrderedProperties& props, FormatContext& ctx) const
    {
        auto out = fmt::format_to(ctx.out(), "{{");
        bool first = true;
        for (const auto& [key, val] : props.entries()) {
            out = fmt::format_to(out, "{}{}={}", first ? "" : ", ", key, val);
            first = false;
        }
        return fmt::format_to(out, "}}");
    }
};

//-------------------------------------------------------------------------
