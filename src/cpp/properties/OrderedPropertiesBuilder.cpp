/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/properties/OrderedPropertiesBuilder.hpp"

#include <functional>
#include <string>

//-------------------------------------------------------------------------

namespace ordprops
{

//-------------------------------------------------------------------------

OrderedPropertiesBuilder& OrderedPropertiesBuilder::withOrdering(
    container::KeyComparator comparator)
{
    if (comparator) {
        m_comparator = std::move(comparator);
    } else {
        m_comparator.reset();
    }
    return *this;
}

//-------------------------------------------------------------------------

OrderedPropertiesBuilder& OrderedPropertiesBuilder::withNaturalOrdering()
{
    return withOrdering(std::less<std::string>{});
}

//-------------------------------------------------------------------------

OrderedPropertiesBuilder& OrderedPropertiesBuilder::suppressDateInComment(
    bool suppressDate) noexcept
{
    m_suppressDate = suppressDate;
    return *this;
}

//-------------------------------------------------------------------------

OrderedProperties OrderedPropertiesBuilder::build() const
{
    return OrderedProperties{
        m_comparator ? container::OrderedMap{*m_comparator} : container::OrderedMap{},
        m_suppressDate};
}

//-------------------------------------------------------------------------

OrderedPropertiesBuilder OrderedPropertiesBuilder::fromConfig(
    const OrderedPropertiesConfig& config)
{
    OrderedPropertiesBuilder builder;
    if (auto comparator = makeComparator(config.ordering)) {
        builder.withOrdering(std::move(*comparator));
    }
    builder.suppressDateInComment(config.suppressDate);
    return builder;
}

//-------------------------------------------------------------------------

}  // namespace ordprops

//-------------------------------------------------------------------------
