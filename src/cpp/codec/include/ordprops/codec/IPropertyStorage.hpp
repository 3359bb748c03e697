/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

//-------------------------------------------------------------------------

namespace ordprops::codec
{

//-------------------------------------------------------------------------
// Everything the codecs read from or write to while loading and storing.
// Stores serialize entries in the order keys() yields them.

class IPropertyStorage
{
public:
    virtual ~IPropertyStorage() noexcept = default;

    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual std::optional<std::string> put(const std::string& key, std::string value) = 0;
    [[nodiscard]] virtual bool contains(const std::string& key) const = 0;
    [[nodiscard]] virtual std::vector<std::string> keys() const = 0;

protected:
    IPropertyStorage() noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace ordprops::codec

//-------------------------------------------------------------------------
