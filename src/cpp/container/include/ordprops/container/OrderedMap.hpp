/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/container/KeySet.hpp"

#include <concepts>
#include <functional>
#include <map>
#include <optional>
#include <type_traits>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

//-------------------------------------------------------------------------

namespace ordprops::container
{

//-------------------------------------------------------------------------

// Strict weak ordering over keys; keys it deems equivalent are the same key.
using KeyComparator = std::function<bool(const std::string&, const std::string&)>;

//-------------------------------------------------------------------------

class OrderedMap
{
public:
    using Key = std::string;
    using Val = std::string;
    using Entry = std::pair<Key, Val>;

    // Iterates in the order keys were first set.
    OrderedMap() = default;
    // Iterates in ascending order under the comparator; an empty comparator
    // keeps insertion order.
    explicit OrderedMap(KeyComparator comparator);

    [[nodiscard]] bool ordersByComparator() const noexcept;
    [[nodiscard]] std::optional<KeyComparator> comparator() const;

    [[nodiscard]] std::optional<Val> get(const Key& key) const;
    [[nodiscard]] Val getOrDefault(const Key& key, const Val& defaultVal) const;
    [[nodiscard]] bool contains(const Key& key) const;

    std::optional<Val> set(const Key& key, Val val);
    std::optional<Val> erase(const Key& key);
    void clear() noexcept;

    [[nodiscard]] bool isEmpty() const noexcept;
    [[nodiscard]] size_t size() const noexcept;

    [[nodiscard]] std::vector<Key> keys() const;
    [[nodiscard]] KeySet keysAsSet() const;
    [[nodiscard]] std::vector<Entry> entries() const;

    // An empty map in the same ordering mode.
    [[nodiscard]] OrderedMap emptyCopy() const;

private:
    struct InsertionOrder
    {
        std::vector<Key> order;
        std::unordered_map<Key, Val> values;
    };

    using ComparatorOrder = std::map<Key, Val, KeyComparator>;

    template<typename Fn>
    void forEach(Fn&& fn) const
    {
        std::visit(
            [&](auto&& storage) {
                using T = std::remove_cvref_t<decltype(storage)>;
                if constexpr (std::same_as<T, InsertionOrder>) {
                    for (const Key& key : storage.order) {
                        fn(key, storage.values.at(key));
                    }
                } else if constexpr (std::same_as<T, ComparatorOrder>) {
                    for (const auto& [key, val] : storage) {
                        fn(key, val);
                    }
                }
            },
            m_storage);
    }

    std::variant<InsertionOrder, ComparatorOrder> m_storage;
};

//-------------------------------------------------------------------------

}  // namespace ordprops::container

//-------------------------------------------------------------------------
