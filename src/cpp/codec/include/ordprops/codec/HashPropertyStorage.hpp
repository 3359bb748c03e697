/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/codec/IPropertyStorage.hpp"

#include <unordered_map>

//-------------------------------------------------------------------------

namespace ordprops::codec
{

//-------------------------------------------------------------------------
// Hash table storage; enumeration order is unspecified.

class HashPropertyStorage : public IPropertyStorage
{
public:
    HashPropertyStorage() noexcept = default;

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;
    std::optional<std::string> put(const std::string& key, std::string value) override;
    [[nodiscard]] bool contains(const std::string& key) const override;
    [[nodiscard]] std::vector<std::string> keys() const override;

    std::optional<std::string> erase(const std::string& key);

    [[nodiscard]] size_t size() const noexcept { return m_table.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_table.empty(); }

    [[nodiscard]] const std::unordered_map<std::string, std::string>& table() const noexcept
    {
        return m_table;
    }

private:
    std::unordered_map<std::string, std::string> m_table;
};

//-------------------------------------------------------------------------

}  // namespace ordprops::codec

//-------------------------------------------------------------------------
