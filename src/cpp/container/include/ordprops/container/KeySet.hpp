/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <span>
#include <string>
#include <unordered_set>
#include <vector>

//-------------------------------------------------------------------------

namespace ordprops::container
{

//-------------------------------------------------------------------------
// Set of keys that remembers the order in which they were added.

class KeySet
{
public:
    using value_type = std::string;
    using const_iterator = std::vector<std::string>::const_iterator;
    using iterator = const_iterator;
    using size_type = size_t;

    KeySet() noexcept = default;

    template<typename Range>
    explicit KeySet(const Range& keys)
    {
        for (const auto& key : keys) {
            add(key);
        }
    }

    bool add(const std::string& key)
    {
        if (m_registry.contains(key)) {
            return false;
        }
        m_keys.push_back(key);
        m_registry.insert(key);
        return true;
    }

    [[nodiscard]] bool contains(const std::string& key) const noexcept
    {
        return m_registry.contains(key);
    }

    [[nodiscard]] std::span<const std::string> keys() const noexcept { return m_keys; }
    [[nodiscard]] size_t size() const noexcept { return m_keys.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_keys.empty(); }

    const_iterator begin() const noexcept { return m_keys.begin(); }
    const_iterator end() const noexcept { return m_keys.end(); }

    [[nodiscard]] bool operator==(const KeySet& other) const noexcept
    {
        return m_keys == other.m_keys;
    }

private:
    std::vector<std::string> m_keys;
    std::unordered_set<std::string> m_registry;
};

//-------------------------------------------------------------------------

}  // namespace ordprops::container

//-------------------------------------------------------------------------
