/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/codec/HashPropertyStorage.hpp"
#include "ordprops/codec/XmlCodec.hpp"

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

//-------------------------------------------------------------------------

namespace ordprops::codec
{

//-------------------------------------------------------------------------
// Plain properties table owning its storage. Key order is unspecified and
// the class is not synchronized.

class Properties
{
public:
    Properties() noexcept = default;

    [[nodiscard]] std::optional<std::string> getProperty(const std::string& key) const;
    [[nodiscard]] std::string getProperty(
        const std::string& key, const std::string& defaultValue) const;
    std::optional<std::string> setProperty(const std::string& key, std::string value);
    std::optional<std::string> removeProperty(const std::string& key);

    [[nodiscard]] bool isEmpty() const noexcept { return m_storage.empty(); }
    [[nodiscard]] size_t size() const noexcept { return m_storage.size(); }
    [[nodiscard]] std::vector<std::string> stringPropertyNames() const;

    [[nodiscard]] const std::unordered_map<std::string, std::string>& table() const noexcept
    {
        return m_storage.table();
    }

    void load(std::istream& is);
    void load(std::wistream& is);
    void loadFromXML(std::istream& is);

    void store(std::ostream& os, const std::optional<std::string>& comment = {});
    void store(std::wostream& os, const std::optional<std::string>& comment = {});
    void storeToXML(
        std::ostream& os,
        const std::optional<std::string>& comment = {},
        std::string_view encoding = kDefaultXmlEncoding);

private:
    HashPropertyStorage m_storage;
};

//-------------------------------------------------------------------------

}  // namespace ordprops::codec

//-------------------------------------------------------------------------
