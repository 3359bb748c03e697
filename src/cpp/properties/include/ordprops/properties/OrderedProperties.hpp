/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/codec/Properties.hpp"
#include "ordprops/codec/XmlCodec.hpp"
#include "ordprops/container/KeySet.hpp"
#include "ordprops/container/OrderedMap.hpp"
#include "ordprops/properties/OrderedPropertiesSnapshot.hpp"

#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

//-------------------------------------------------------------------------

namespace ordprops
{

//-------------------------------------------------------------------------
// String properties kept in a well-defined key order: the order in which
// keys were first added, or the order of a comparator chosen through
// OrderedPropertiesBuilder. Storing can leave out the timestamp comment.
//
// Every operation holds the instance's lock for its whole duration,
// including the stream I/O of load and store.

class OrderedProperties
{
public:
    OrderedProperties();

    // A moved-from instance is empty, keeps its ordering mode and stays usable.
    OrderedProperties(OrderedProperties&& other);
    OrderedProperties& operator=(OrderedProperties&& other);

    [[nodiscard]] std::optional<std::string> getProperty(const std::string& key) const;
    [[nodiscard]] std::string getProperty(
        const std::string& key, const std::string& defaultValue) const;
    std::optional<std::string> setProperty(const std::string& key, std::string value);
    std::optional<std::string> removeProperty(const std::string& key);
    [[nodiscard]] bool containsKey(const std::string& key) const;

    [[nodiscard]] bool isEmpty() const;
    [[nodiscard]] size_t size() const;
    void clear();

    [[nodiscard]] std::vector<std::string> propertyNames() const;
    [[nodiscard]] container::KeySet stringPropertyNames() const;
    [[nodiscard]] std::vector<container::OrderedMap::Entry> entries() const;

    void load(std::istream& is);
    void load(std::wistream& is);
    void loadFromXML(std::istream& is);

    void store(std::ostream& os, const std::optional<std::string>& comment = {});
    void store(std::wostream& os, const std::optional<std::string>& comment = {});
    // The timestamp comment only exists in the text format, so XML output
    // is the same whether or not the date is suppressed.
    void storeToXML(
        std::ostream& os,
        const std::optional<std::string>& comment = {},
        std::string_view encoding = codec::kDefaultXmlEncoding);

    [[nodiscard]] codec::Properties toPlainMap() const;
    [[nodiscard]] OrderedProperties clone() const;

    [[nodiscard]] bool suppressesDate() const noexcept { return m_suppressDate; }
    [[nodiscard]] bool ordersByComparator() const noexcept;

    [[nodiscard]] OrderedPropertiesSnapshot snapshot() const;
    [[nodiscard]] static OrderedProperties fromSnapshot(
        const OrderedPropertiesSnapshot& snapshot,
        std::optional<container::KeyComparator> comparator = {});

private:
    OrderedProperties(container::OrderedMap properties, bool suppressDate);

    container::OrderedMap m_properties;
    bool m_suppressDate{};
    std::unique_ptr<std::mutex> m_mtx;

    friend class OrderedPropertiesBuilder;
};

//-------------------------------------------------------------------------

}  // namespace ordprops

//-------------------------------------------------------------------------
