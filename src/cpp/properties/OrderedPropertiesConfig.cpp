/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/properties/OrderedPropertiesConfig.hpp"

#include "ordprops/base/PropertiesException.hpp"
#include "ordprops/util/logging.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <magic_enum.hpp>

#include <functional>
#include <source_location>
#include <string>

//-------------------------------------------------------------------------

namespace ordprops
{

//-------------------------------------------------------------------------

std::optional<container::KeyComparator> makeComparator(KeyOrdering ordering)
{
    switch (ordering) {
        case KeyOrdering::natural:
            return std::less<std::string>{};
        case KeyOrdering::reverse:
            return std::greater<std::string>{};
        case KeyOrdering::caseInsensitive:
            return [](const std::string& lhs, const std::string& rhs) {
                return boost::algorithm::ilexicographical_compare(lhs, rhs);
            };
        default:
            return {};
    }
}

//-------------------------------------------------------------------------

OrderedPropertiesConfig OrderedPropertiesConfig::fromXML(pugi::xml_node node)
{
    auto orderingFallback = [] {
        static constexpr auto fallback = KeyOrdering::insertion;
        util::logger().warn(
            "Unknown or missing attribute 'ordering', falling back to '{}'",
            magic_enum::enum_name(fallback));
        return std::make_optional(fallback);
    };

    return OrderedPropertiesConfig{
        .ordering = magic_enum::enum_cast<KeyOrdering>(
            node.attribute("ordering").as_string()).or_else(orderingFallback).value(),
        .suppressDate = node.attribute("suppressDate").as_bool()};
}

//-------------------------------------------------------------------------

OrderedPropertiesConfig OrderedPropertiesConfig::fromFile(const std::filesystem::path& path)
{
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw FormatError{fmt::format(
            "{}: error parsing config file '{}': {}",
            std::source_location::current().function_name(),
            path.generic_string(),
            result.description())};
    }

    const pugi::xml_node node = doc.child("OrderedProperties");
    if (!node) {
        throw FormatError{fmt::format(
            "{}: config file '{}' has no <OrderedProperties> element",
            std::source_location::current().function_name(),
            path.generic_string())};
    }

    return fromXML(node);
}

//-------------------------------------------------------------------------

}  // namespace ordprops

//-------------------------------------------------------------------------
