/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/container/OrderedMap.hpp"

#include <cstdint>
#include <vector>

//-------------------------------------------------------------------------

namespace ordprops
{

//-------------------------------------------------------------------------

enum class SnapshotOrdering : uint32_t
{
    insertion,
    comparator
};

//-------------------------------------------------------------------------
// Persistable state of an OrderedProperties instance. Comparators cannot be
// persisted; only the fact that one was in use is recorded.

struct OrderedPropertiesSnapshot
{
    SnapshotOrdering ordering = SnapshotOrdering::insertion;
    bool suppressDate = false;
    std::vector<container::OrderedMap::Entry> entries;
};

//-------------------------------------------------------------------------

}  // namespace ordprops

//-------------------------------------------------------------------------
