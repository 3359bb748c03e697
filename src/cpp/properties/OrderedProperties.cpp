/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/properties/OrderedProperties.hpp"

#include "ordprops/base/PropertiesException.hpp"
#include "ordprops/codec/TextCodec.hpp"
#include "ordprops/properties/CommentSuppressingSink.hpp"
#include "ordprops/properties/OrderedMapStorage.hpp"
#include "ordprops/util/logging.hpp"

#include <fmt/format.h>

#include <source_location>
#include <utility>

//-------------------------------------------------------------------------

namespace ordprops
{

//-------------------------------------------------------------------------

OrderedProperties::OrderedProperties()
    : OrderedProperties{container::OrderedMap{}, false}
{}

//-------------------------------------------------------------------------

OrderedProperties::OrderedProperties(container::OrderedMap properties, bool suppressDate)
    : m_properties{std::move(properties)},
      m_suppressDate{suppressDate},
      m_mtx{std::make_unique<std::mutex>()}
{}

//-------------------------------------------------------------------------

OrderedProperties::OrderedProperties(OrderedProperties&& other)
    : m_mtx{std::make_unique<std::mutex>()}
{
    std::unique_lock lock{*other.m_mtx};
    auto empty = other.m_properties.emptyCopy();
    m_properties = std::exchange(other.m_properties, std::move(empty));
    m_suppressDate = other.m_suppressDate;
}

//-------------------------------------------------------------------------

OrderedProperties& OrderedProperties::operator=(OrderedProperties&& other)
{
    if (this == &other) {
        return *this;
    }

    std::scoped_lock lock{*m_mtx, *other.m_mtx};
    auto empty = other.m_properties.emptyCopy();
    m_properties = std::exchange(other.m_properties, std::move(empty));
    m_suppressDate = other.m_suppressDate;
    return *this;
}

//-------------------------------------------------------------------------

std::optional<std::string> OrderedProperties::getProperty(const std::string& key) const
{
    std::unique_lock lock{*m_mtx};
    return m_properties.get(key);
}

//-------------------------------------------------------------------------

std::string OrderedProperties::getProperty(
    const std::string& key, const std::string& defaultValue) const
{
    std::unique_lock lock{*m_mtx};
    return m_properties.getOrDefault(key, defaultValue);
}

//-------------------------------------------------------------------------

std::optional<std::string> OrderedProperties::setProperty(const std::string& key, std::string value)
{
    std::unique_lock lock{*m_mtx};
    return m_properties.set(key, std::move(value));
}

//-------------------------------------------------------------------------

std::optional<std::string> OrderedProperties::removeProperty(const std::string& key)
{
    std::unique_lock lock{*m_mtx};
    return m_properties.erase(key);
}

//-------------------------------------------------------------------------

bool OrderedProperties::containsKey(const std::string& key) const
{
    std::unique_lock lock{*m_mtx};
    return m_properties.contains(key);
}

//-------------------------------------------------------------------------

bool OrderedProperties::isEmpty() const
{
    std::unique_lock lock{*m_mtx};
    return m_properties.isEmpty();
}

//-------------------------------------------------------------------------

size_t OrderedProperties::size() const
{
    std::unique_lock lock{*m_mtx};
    return m_properties.size();
}

//-------------------------------------------------------------------------

void OrderedProperties::clear()
{
    std::unique_lock lock{*m_mtx};
    m_properties.clear();
}

//-------------------------------------------------------------------------

std::vector<std::string> OrderedProperties::propertyNames() const
{
    std::unique_lock lock{*m_mtx};
    return m_properties.keys();
}

//-------------------------------------------------------------------------

container::KeySet OrderedProperties::stringPropertyNames() const
{
    std::unique_lock lock{*m_mtx};
    return m_properties.keysAsSet();
}

//-------------------------------------------------------------------------

std::vector<container::OrderedMap::Entry> OrderedProperties::entries() const
{
    std::unique_lock lock{*m_mtx};
    return m_properties.entries();
}

//-------------------------------------------------------------------------

void OrderedProperties::load(std::istream& is)
{
    std::unique_lock lock{*m_mtx};
    OrderedMapStorage storage{m_properties};
    codec::TextCodec{storage}.load(is);
}

//-------------------------------------------------------------------------

void OrderedProperties::load(std::wistream& is)
{
    std::unique_lock lock{*m_mtx};
    OrderedMapStorage storage{m_properties};
    codec::TextCodec{storage}.load(is);
}

//-------------------------------------------------------------------------

void OrderedProperties::loadFromXML(std::istream& is)
{
    std::unique_lock lock{*m_mtx};
    OrderedMapStorage storage{m_properties};
    codec::XmlCodec{storage}.load(is);
}

//-------------------------------------------------------------------------

void OrderedProperties::store(std::ostream& os, const std::optional<std::string>& comment)
{
    std::unique_lock lock{*m_mtx};
    OrderedMapStorage storage{m_properties};
    codec::TextCodec codec{storage};
    if (!m_suppressDate) {
        codec.store(os, comment);
        return;
    }
    codec::ByteStreamSink sink{os};
    CommentSuppressingSink filter{sink};
    codec.store(filter, comment, true);
}

//-------------------------------------------------------------------------

void OrderedProperties::store(std::wostream& os, const std::optional<std::string>& comment)
{
    std::unique_lock lock{*m_mtx};
    OrderedMapStorage storage{m_properties};
    codec::TextCodec codec{storage};
    if (!m_suppressDate) {
        codec.store(os, comment);
        return;
    }
    codec::WideStreamSink sink{os};
    CommentSuppressingSink filter{sink};
    codec.store(filter, comment, false);
}

//-------------------------------------------------------------------------

void OrderedProperties::storeToXML(
    std::ostream& os, const std::optional<std::string>& comment, std::string_view encoding)
{
    std::unique_lock lock{*m_mtx};
    OrderedMapStorage storage{m_properties};
    codec::XmlCodec{storage}.store(os, comment, encoding);
}

//-------------------------------------------------------------------------

codec::Properties OrderedProperties::toPlainMap() const
{
    codec::Properties plain;
    std::unique_lock lock{*m_mtx};
    for (auto&& [key, val] : m_properties.entries()) {
        plain.setProperty(key, std::move(val));
    }
    return plain;
}

//-------------------------------------------------------------------------

OrderedProperties OrderedProperties::clone() const
{
    std::unique_lock lock{*m_mtx};
    return OrderedProperties{m_properties, m_suppressDate};
}

//-------------------------------------------------------------------------

bool OrderedProperties::ordersByComparator() const noexcept
{
    return m_properties.ordersByComparator();
}

//-------------------------------------------------------------------------

OrderedPropertiesSnapshot OrderedProperties::snapshot() const
{
    std::unique_lock lock{*m_mtx};
    return OrderedPropertiesSnapshot{
        .ordering = m_properties.ordersByComparator()
            ? SnapshotOrdering::comparator
            : SnapshotOrdering::insertion,
        .suppressDate = m_suppressDate,
        .entries = m_properties.entries()};
}

//-------------------------------------------------------------------------

OrderedProperties OrderedProperties::fromSnapshot(
    const OrderedPropertiesSnapshot& snapshot,
    std::optional<container::KeyComparator> comparator)
{
    if (comparator && !*comparator) {
        comparator.reset();
    }
    if (snapshot.ordering == SnapshotOrdering::comparator && !comparator) {
        throw InvalidStateError{fmt::format(
            "{}: snapshot was taken with a key comparator, which must be supplied to restore it",
            std::source_location::current().function_name())};
    }

    container::OrderedMap properties = comparator
        ? container::OrderedMap{std::move(*comparator)}
        : container::OrderedMap{};
    for (const auto& [key, val] : snapshot.entries) {
        properties.set(key, val);
    }

    util::logger().debug(
        "Restored {} properties from snapshot ({} of {} entries kept)",
        properties.ordersByComparator() ? "comparator-ordered" : "insertion-ordered",
        properties.size(),
        snapshot.entries.size());

    return OrderedProperties{std::move(properties), snapshot.suppressDate};
}

//-------------------------------------------------------------------------

}  // namespace ordprops

//-------------------------------------------------------------------------
