/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/container/OrderedMap.hpp"

#include <boost/algorithm/string.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <ranges>

//-------------------------------------------------------------------------

using namespace ordprops::container;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

const KeyComparator s_caseInsensitive = [](const std::string& lhs, const std::string& rhs) {
    return boost::algorithm::ilexicographical_compare(lhs, rhs);
};

}  // namespace

//-------------------------------------------------------------------------

TEST(OrderedMapTest, ResettingKeyKeepsItsPosition)
{
    OrderedMap map;

    EXPECT_EQ(map.set("a", "1"), std::nullopt);
    EXPECT_EQ(map.set("b", "2"), std::nullopt);
    EXPECT_EQ(map.set("a", "3"), "1");

    EXPECT_THAT(map.keys(), ElementsAre("a", "b"));
    EXPECT_EQ(map.get("a"), "3");
    EXPECT_EQ(map.size(), 2);
}

//-------------------------------------------------------------------------

TEST(OrderedMapTest, IteratesInFirstInsertionOrderForAllPermutations)
{
    std::vector<std::string> keys{"d", "a", "e", "b", "c"};
    std::ranges::sort(keys);

    do {
        OrderedMap map;
        for (const auto& key : keys) {
            map.set(key, key + "-value");
        }
        for (const auto& key : keys | std::views::reverse) {
            map.set(key, key + "-updated");
        }
        EXPECT_EQ(map.keys(), keys);
        for (const auto& [key, val] : map.entries()) {
            EXPECT_EQ(val, key + "-updated");
        }
    } while (std::ranges::next_permutation(keys).found);
}

//-------------------------------------------------------------------------

TEST(OrderedMapTest, ComparatorOrderIgnoresInsertionOrder)
{
    std::vector<std::string> keys{"charlie", "alpha", "bravo", "delta"};
    std::ranges::sort(keys);
    const std::vector<std::string> sorted = keys;

    do {
        OrderedMap map{std::less<std::string>{}};
        for (const auto& key : keys) {
            map.set(key, "x");
        }
        EXPECT_EQ(map.keys(), sorted);
    } while (std::ranges::next_permutation(keys).found);
}

//-------------------------------------------------------------------------

TEST(OrderedMapTest, ComparatorEquivalentKeysAreOneKey)
{
    OrderedMap map{s_caseInsensitive};

    map.set("Key", "1");
    EXPECT_EQ(map.set("KEY", "2"), "1");
    map.set("alpha", "3");

    EXPECT_EQ(map.size(), 2);
    EXPECT_THAT(map.keys(), ElementsAre("alpha", "Key"));
    EXPECT_EQ(map.get("key"), "2");
    EXPECT_TRUE(map.contains("kEy"));
}

//-------------------------------------------------------------------------

TEST(OrderedMapTest, EmptyComparatorKeepsInsertionOrder)
{
    OrderedMap map{KeyComparator{}};

    EXPECT_FALSE(map.ordersByComparator());
    EXPECT_EQ(map.comparator(), std::nullopt);
    EXPECT_NO_THROW(map.set("b", "1"));
    EXPECT_NO_THROW(map.set("a", "2"));
    EXPECT_EQ(map.set("b", "3"), "1");
    EXPECT_THAT(map.keys(), ElementsAre("b", "a"));
}

//-------------------------------------------------------------------------

TEST(OrderedMapTest, EraseDropsKeyFromOrder)
{
    OrderedMap map;
    map.set("a", "1");
    map.set("b", "2");
    map.set("c", "3");

    EXPECT_EQ(map.erase("b"), "2");
    EXPECT_EQ(map.erase("b"), std::nullopt);
    EXPECT_THAT(map.keys(), ElementsAre("a", "c"));

    map.set("b", "4");
    EXPECT_THAT(map.keys(), ElementsAre("a", "c", "b"));
}

//-------------------------------------------------------------------------

TEST(OrderedMapTest, KeysAreDetachedFromLaterChanges)
{
    OrderedMap map;
    map.set("a", "1");

    const auto keys = map.keys();
    const auto entries = map.entries();
    map.set("b", "2");
    map.erase("a");

    EXPECT_THAT(keys, ElementsAre("a"));
    EXPECT_THAT(entries, ElementsAre(Pair("a", "1")));
}

//-------------------------------------------------------------------------

TEST(OrderedMapTest, LookupsOnMissingKeys)
{
    OrderedMap map;

    EXPECT_TRUE(map.isEmpty());
    EXPECT_EQ(map.get("missing"), std::nullopt);
    EXPECT_EQ(map.getOrDefault("missing", "fallback"), "fallback");
    EXPECT_FALSE(map.contains("missing"));

    map.set("present", "");
    EXPECT_EQ(map.getOrDefault("present", "fallback"), "");
}

//-------------------------------------------------------------------------

TEST(OrderedMapTest, ClearKeepsOrderingMode)
{
    OrderedMap map{std::greater<std::string>{}};
    map.set("a", "1");
    map.set("b", "2");

    map.clear();
    EXPECT_TRUE(map.isEmpty());
    EXPECT_TRUE(map.ordersByComparator());

    map.set("a", "1");
    map.set("c", "3");
    EXPECT_THAT(map.keys(), ElementsAre("c", "a"));
}

//-------------------------------------------------------------------------

TEST(OrderedMapTest, EmptyCopySharesModeButNotEntries)
{
    OrderedMap insertion;
    insertion.set("a", "1");
    OrderedMap sorted{std::less<std::string>{}};
    sorted.set("a", "1");

    const auto insertionCopy = insertion.emptyCopy();
    const auto sortedCopy = sorted.emptyCopy();

    EXPECT_TRUE(insertionCopy.isEmpty());
    EXPECT_FALSE(insertionCopy.ordersByComparator());
    EXPECT_FALSE(insertionCopy.comparator().has_value());
    EXPECT_TRUE(sortedCopy.isEmpty());
    EXPECT_TRUE(sortedCopy.ordersByComparator());
    EXPECT_TRUE(sortedCopy.comparator().has_value());
}

//-------------------------------------------------------------------------

TEST(OrderedMapTest, KeysAsSetFollowsIterationOrder)
{
    OrderedMap map;
    map.set("z", "1");
    map.set("m", "2");

    const KeySet keySet = map.keysAsSet();

    EXPECT_THAT(keySet, ElementsAre("z", "m"));
    EXPECT_TRUE(keySet.contains("m"));
    EXPECT_FALSE(keySet.contains("a"));
}

//-------------------------------------------------------------------------
