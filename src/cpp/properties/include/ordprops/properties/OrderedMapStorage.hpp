/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/codec/IPropertyStorage.hpp"
#include "ordprops/container/OrderedMap.hpp"

//-------------------------------------------------------------------------

namespace ordprops
{

//-------------------------------------------------------------------------
// Points a codec at an OrderedMap instead of storage of its own. Holds
// nothing but the reference; create one per load/store call.

class OrderedMapStorage : public codec::IPropertyStorage
{
public:
    explicit OrderedMapStorage(container::OrderedMap& target) noexcept : m_target{target} {}

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const override
    {
        return m_target.get(key);
    }

    std::optional<std::string> put(const std::string& key, std::string value) override
    {
        return m_target.set(key, std::move(value));
    }

    [[nodiscard]] bool contains(const std::string& key) const override
    {
        return m_target.contains(key);
    }

    [[nodiscard]] std::vector<std::string> keys() const override
    {
        return m_target.keys();
    }

private:
    container::OrderedMap& m_target;
};

//-------------------------------------------------------------------------

}  // namespace ordprops

//-------------------------------------------------------------------------
