/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/codec/Properties.hpp"

#include "ordprops/codec/TextCodec.hpp"

//-------------------------------------------------------------------------

namespace ordprops::codec
{

//-------------------------------------------------------------------------

std::optional<std::string> Properties::getProperty(const std::string& key) const
{
    return m_storage.get(key);
}

//-------------------------------------------------------------------------

std::string Properties::getProperty(
    const std::string& key, const std::string& defaultValue) const
{
    return m_storage.get(key).value_or(defaultValue);
}

//-------------------------------------------------------------------------

std::optional<std::string> Properties::setProperty(const std::string& key, std::string value)
{
    return m_storage.put(key, std::move(value));
}

//-------------------------------------------------------------------------

std::optional<std::string> Properties::removeProperty(const std::string& key)
{
    return m_storage.erase(key);
}

//-------------------------------------------------------------------------

std::vector<std::string> Properties::stringPropertyNames() const
{
    return m_storage.keys();
}

//-------------------------------------------------------------------------

void Properties::load(std::istream& is)
{
    TextCodec{m_storage}.load(is);
}

//-------------------------------------------------------------------------

void Properties::load(std::wistream& is)
{
    TextCodec{m_storage}.load(is);
}

//-------------------------------------------------------------------------

void Properties::loadFromXML(std::istream& is)
{
    XmlCodec{m_storage}.load(is);
}

//-------------------------------------------------------------------------

void Properties::store(std::ostream& os, const std::optional<std::string>& comment)
{
    TextCodec{m_storage}.store(os, comment);
}

//-------------------------------------------------------------------------

void Properties::store(std::wostream& os, const std::optional<std::string>& comment)
{
    TextCodec{m_storage}.store(os, comment);
}

//-------------------------------------------------------------------------

void Properties::storeToXML(
    std::ostream& os, const std::optional<std::string>& comment, std::string_view encoding)
{
    XmlCodec{m_storage}.store(os, comment, encoding);
}

//-------------------------------------------------------------------------

}  // namespace ordprops::codec

//-------------------------------------------------------------------------
