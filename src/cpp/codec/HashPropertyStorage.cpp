/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/codec/HashPropertyStorage.hpp"

#include <utility>

//-------------------------------------------------------------------------

namespace ordprops::codec
{

//-------------------------------------------------------------------------

std::optional<std::string> HashPropertyStorage::get(const std::string& key) const
{
    if (const auto it = m_table.find(key); it != m_table.end()) {
        return it->second;
    }
    return {};
}

//-------------------------------------------------------------------------

std::optional<std::string> HashPropertyStorage::put(const std::string& key, std::string value)
{
    if (auto it = m_table.find(key); it != m_table.end()) {
        return std::exchange(it->second, std::move(value));
    }
    m_table.emplace(key, std::move(value));
    return {};
}

//-------------------------------------------------------------------------

bool HashPropertyStorage::contains(const std::string& key) const
{
    return m_table.contains(key);
}

//-------------------------------------------------------------------------

std::vector<std::string> HashPropertyStorage::keys() const
{
    std::vector<std::string> ret;
    ret.reserve(m_table.size());
    for (const auto& [key, val] : m_table) {
        ret.push_back(key);
    }
    return ret;
}

//-------------------------------------------------------------------------

std::optional<std::string> HashPropertyStorage::erase(const std::string& key)
{
    auto it = m_table.find(key);
    if (it == m_table.end()) {
        return {};
    }
    std::string prev = std::move(it->second);
    m_table.erase(it);
    return prev;
}

//-------------------------------------------------------------------------

}  // namespace ordprops::codec

//-------------------------------------------------------------------------
