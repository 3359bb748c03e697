/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/codec/IPropertyStorage.hpp"

#include <gmock/gmock.h>

#include <algorithm>
#include <initializer_list>
#include <string>
#include <utility>

//-------------------------------------------------------------------------

namespace ordprops::test
{

//-------------------------------------------------------------------------
// Keeps entries in the order they were first put.

class VectorStorage : public codec::IPropertyStorage
{
public:
    VectorStorage() = default;
    VectorStorage(std::initializer_list<std::pair<std::string, std::string>> init)
        : entries{init}
    {}

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const override
    {
        const auto it = find(key);
        if (it == entries.end()) return {};
        return it->second;
    }

    std::optional<std::string> put(const std::string& key, std::string value) override
    {
        auto it = std::ranges::find(entries, key, &Entry::first);
        if (it == entries.end()) {
            entries.emplace_back(key, std::move(value));
            return {};
        }
        return std::exchange(it->second, std::move(value));
    }

    [[nodiscard]] bool contains(const std::string& key) const override
    {
        return find(key) != entries.end();
    }

    [[nodiscard]] std::vector<std::string> keys() const override
    {
        std::vector<std::string> ret;
        for (const auto& [key, val] : entries) {
            ret.push_back(key);
        }
        return ret;
    }

    using Entry = std::pair<std::string, std::string>;
    std::vector<Entry> entries;

private:
    [[nodiscard]] std::vector<Entry>::const_iterator find(const std::string& key) const
    {
        return std::ranges::find(entries, key, &Entry::first);
    }
};

//-------------------------------------------------------------------------

class MockPropertyStorage : public codec::IPropertyStorage
{
public:
    MOCK_METHOD(std::optional<std::string>, get, (const std::string& key), (const, override));
    MOCK_METHOD(
        std::optional<std::string>, put, (const std::string& key, std::string value), (override));
    MOCK_METHOD(bool, contains, (const std::string& key), (const, override));
    MOCK_METHOD(std::vector<std::string>, keys, (), (const, override));
};

//-------------------------------------------------------------------------

}  // namespace ordprops::test

//-------------------------------------------------------------------------
