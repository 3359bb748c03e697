/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/container/OrderedMap.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace ordprops::container
{

//-------------------------------------------------------------------------

OrderedMap::OrderedMap(KeyComparator comparator)
{
    if (comparator) {
        m_storage.emplace<ComparatorOrder>(std::move(comparator));
    }
}

//-------------------------------------------------------------------------

bool OrderedMap::ordersByComparator() const noexcept
{
    return std::holds_alternative<ComparatorOrder>(m_storage);
}

//-------------------------------------------------------------------------

std::optional<KeyComparator> OrderedMap::comparator() const
{
    if (const auto* storage = std::get_if<ComparatorOrder>(&m_storage)) {
        return storage->key_comp();
    }
    return {};
}

//-------------------------------------------------------------------------

std::optional<OrderedMap::Val> OrderedMap::get(const Key& key) const
{
    return std::visit(
        [&](auto&& storage) -> std::optional<Val> {
            using T = std::remove_cvref_t<decltype(storage)>;
            if constexpr (std::same_as<T, InsertionOrder>) {
                if (const auto it = storage.values.find(key); it != storage.values.end()) {
                    return it->second;
                }
            } else if constexpr (std::same_as<T, ComparatorOrder>) {
                if (const auto it = storage.find(key); it != storage.end()) {
                    return it->second;
                }
            }
            return {};
        },
        m_storage);
}

//-------------------------------------------------------------------------

OrderedMap::Val OrderedMap::getOrDefault(const Key& key, const Val& defaultVal) const
{
    return get(key).value_or(defaultVal);
}

//-------------------------------------------------------------------------

bool OrderedMap::contains(const Key& key) const
{
    return std::visit(
        [&](auto&& storage) {
            using T = std::remove_cvref_t<decltype(storage)>;
            if constexpr (std::same_as<T, InsertionOrder>) {
                return storage.values.contains(key);
            } else {
                return storage.contains(key);
            }
        },
        m_storage);
}

//-------------------------------------------------------------------------

std::optional<OrderedMap::Val> OrderedMap::set(const Key& key, Val val)
{
    return std::visit(
        [&](auto&& storage) -> std::optional<Val> {
            using T = std::remove_cvref_t<decltype(storage)>;
            if constexpr (std::same_as<T, InsertionOrder>) {
                if (auto it = storage.values.find(key); it != storage.values.end()) {
                    return std::exchange(it->second, std::move(val));
                }
                storage.order.push_back(key);
                storage.values.emplace(key, std::move(val));
            } else if constexpr (std::same_as<T, ComparatorOrder>) {
                // An equivalent key keeps its original spelling.
                if (auto it = storage.find(key); it != storage.end()) {
                    return std::exchange(it->second, std::move(val));
                }
                storage.emplace(key, std::move(val));
            }
            return {};
        },
        m_storage);
}

//-------------------------------------------------------------------------

std::optional<OrderedMap::Val> OrderedMap::erase(const Key& key)
{
    return std::visit(
        [&](auto&& storage) -> std::optional<Val> {
            using T = std::remove_cvref_t<decltype(storage)>;
            if constexpr (std::same_as<T, InsertionOrder>) {
                auto it = storage.values.find(key);
                if (it == storage.values.end()) {
                    return {};
                }
                Val prev = std::move(it->second);
                storage.values.erase(it);
                std::erase(storage.order, key);
                return prev;
            } else if constexpr (std::same_as<T, ComparatorOrder>) {
                auto it = storage.find(key);
                if (it == storage.end()) {
                    return {};
                }
                Val prev = std::move(it->second);
                storage.erase(it);
                return prev;
            }
        },
        m_storage);
}

//-------------------------------------------------------------------------

void OrderedMap::clear() noexcept
{
    std::visit(
        [](auto&& storage) {
            using T = std::remove_cvref_t<decltype(storage)>;
            if constexpr (std::same_as<T, InsertionOrder>) {
                storage.order.clear();
                storage.values.clear();
            } else {
                storage.clear();
            }
        },
        m_storage);
}

//-------------------------------------------------------------------------

bool OrderedMap::isEmpty() const noexcept
{
    return size() == 0;
}

//-------------------------------------------------------------------------

size_t OrderedMap::size() const noexcept
{
    return std::visit(
        [](auto&& storage) {
            using T = std::remove_cvref_t<decltype(storage)>;
            if constexpr (std::same_as<T, InsertionOrder>) {
                return storage.values.size();
            } else {
                return storage.size();
            }
        },
        m_storage);
}

//-------------------------------------------------------------------------

std::vector<OrderedMap::Key> OrderedMap::keys() const
{
    std::vector<Key> ret;
    ret.reserve(size());
    forEach([&](const Key& key, const Val&) { ret.push_back(key); });
    return ret;
}

//-------------------------------------------------------------------------

KeySet OrderedMap::keysAsSet() const
{
    KeySet ret;
    forEach([&](const Key& key, const Val&) { ret.add(key); });
    return ret;
}

//-------------------------------------------------------------------------

std::vector<OrderedMap::Entry> OrderedMap::entries() const
{
    std::vector<Entry> ret;
    ret.reserve(size());
    forEach([&](const Key& key, const Val& val) { ret.emplace_back(key, val); });
    return ret;
}

//-------------------------------------------------------------------------

OrderedMap OrderedMap::emptyCopy() const
{
    if (const auto cmp = comparator()) {
        return OrderedMap{*cmp};
    }
    return OrderedMap{};
}

//-------------------------------------------------------------------------

}  // namespace ordprops::container

//-------------------------------------------------------------------------
