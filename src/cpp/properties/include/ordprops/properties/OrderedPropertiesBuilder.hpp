/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/properties/OrderedProperties.hpp"
#include "ordprops/properties/OrderedPropertiesConfig.hpp"

#include <optional>

//-------------------------------------------------------------------------

namespace ordprops
{

//-------------------------------------------------------------------------

class OrderedPropertiesBuilder
{
public:
    OrderedPropertiesBuilder() noexcept = default;

    // Without a comparator, or with an empty one, keys keep the order in which
    // they were added.
    OrderedPropertiesBuilder& withOrdering(container::KeyComparator comparator);
    OrderedPropertiesBuilder& withNaturalOrdering();
    OrderedPropertiesBuilder& suppressDateInComment(bool suppressDate) noexcept;

    [[nodiscard]] OrderedProperties build() const;

    [[nodiscard]] static OrderedPropertiesBuilder fromConfig(const OrderedPropertiesConfig& config);

private:
    std::optional<container::KeyComparator> m_comparator;
    bool m_suppressDate{};
};

//-------------------------------------------------------------------------

}  // namespace ordprops

//-------------------------------------------------------------------------
