/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/codec/IPropertyStorage.hpp"

#include <pugixml.hpp>

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace ordprops::codec
{

//-------------------------------------------------------------------------

inline constexpr std::string_view kPropertiesDoctype =
    R"(properties SYSTEM "http://java.sun.com/dtd/properties.dtd")";
inline constexpr std::string_view kDefaultXmlEncoding = "UTF-8";

//-------------------------------------------------------------------------

struct XmlEncoding
{
    std::string name;
    pugi::xml_encoding encoding;

    // Case-insensitive lookup of the encodings the writer supports.
    [[nodiscard]] static std::optional<XmlEncoding> fromName(std::string_view name);
};

//-------------------------------------------------------------------------
// XML properties documents:
//
//   <properties>
//     <comment>...</comment>      optional, first
//     <entry key="...">...</entry>
//   </properties>

class XmlCodec
{
public:
    explicit XmlCodec(IPropertyStorage& storage) noexcept : m_storage{storage} {}

    void load(std::istream& is);

    void store(
        std::ostream& os,
        const std::optional<std::string>& comment,
        std::string_view encoding = kDefaultXmlEncoding);

private:
    IPropertyStorage& m_storage;
};

//-------------------------------------------------------------------------

}  // namespace ordprops::codec

//-------------------------------------------------------------------------
