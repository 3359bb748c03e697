/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/container/OrderedMap.hpp"

#include <pugixml.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>

//-------------------------------------------------------------------------

namespace ordprops
{

//-------------------------------------------------------------------------

enum class KeyOrdering : uint32_t
{
    insertion,
    natural,
    reverse,
    caseInsensitive
};

[[nodiscard]] std::optional<container::KeyComparator> makeComparator(KeyOrdering ordering);

//-------------------------------------------------------------------------

struct OrderedPropertiesConfig
{
    KeyOrdering ordering = KeyOrdering::insertion;
    bool suppressDate = false;

    // <OrderedProperties ordering="..." suppressDate="..."/>
    [[nodiscard]] static OrderedPropertiesConfig fromXML(pugi::xml_node node);
    [[nodiscard]] static OrderedPropertiesConfig fromFile(const std::filesystem::path& path);
};

//-------------------------------------------------------------------------

}  // namespace ordprops

//-------------------------------------------------------------------------
