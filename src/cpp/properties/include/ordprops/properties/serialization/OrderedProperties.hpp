/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ordprops/base/PropertiesException.hpp"
#include "ordprops/properties/OrderedProperties.hpp"
#include "ordprops/properties/OrderedPropertiesSnapshot.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>
#include <msgpack.hpp>

#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace ordprops::serialization
{

//-------------------------------------------------------------------------

[[nodiscard]] inline const msgpack::object* msgpackFind(
    const msgpack::object& o, std::string_view key)
{
    for (size_t i = 0; i < o.via.map.size; ++i) {
        const auto& k = o.via.map.ptr[i].key;
        if (k.type == msgpack::type::STR) {
            std::string_view ks{k.via.str.ptr, k.via.str.size};
            if (ks == key) {
                return &o.via.map.ptr[i].val;
            }
        }
    }
    return nullptr;
}

[[nodiscard]] inline InvalidStateError snapshotError(
    std::string_view what, std::source_location sl = std::source_location::current())
{
    return InvalidStateError{fmt::format("{}#L{}: {}", sl.file_name(), sl.line(), what)};
}

//-------------------------------------------------------------------------

}  // namespace ordprops::serialization

//-------------------------------------------------------------------------

namespace msgpack
{

MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{

namespace adaptor
{

template<>
struct convert<ordprops::OrderedPropertiesSnapshot>
{
    const msgpack::object& operator()(
        const msgpack::object& o, ordprops::OrderedPropertiesSnapshot& v) const
    {
        using namespace ordprops::serialization;

        if (o.type != msgpack::type::MAP) {
            throw snapshotError("snapshot is not a map");
        }

        v.ordering = ordprops::SnapshotOrdering::insertion;
        if (const auto* ordering = msgpackFind(o, "ordering")) {
            if (ordering->type != msgpack::type::STR) {
                throw snapshotError("'ordering' is not a string");
            }
            const auto parsed = magic_enum::enum_cast<ordprops::SnapshotOrdering>(
                std::string_view{ordering->via.str.ptr, ordering->via.str.size});
            if (!parsed) {
                throw snapshotError("'ordering' names no known ordering");
            }
            v.ordering = *parsed;
        }

        const auto* suppressDate = msgpackFind(o, "suppressDate");
        if (suppressDate == nullptr || suppressDate->type != msgpack::type::BOOLEAN) {
            throw snapshotError("'suppressDate' missing or not a boolean");
        }
        v.suppressDate = suppressDate->via.boolean;

        const auto* entries = msgpackFind(o, "entries");
        if (entries == nullptr || entries->type != msgpack::type::ARRAY) {
            throw snapshotError("'entries' missing or not an array");
        }
        v.entries.clear();
        v.entries.reserve(entries->via.array.size);
        for (uint32_t i = 0; i < entries->via.array.size; ++i) {
            const msgpack::object& entry = entries->via.array.ptr[i];
            if (entry.type != msgpack::type::ARRAY
                || entry.via.array.size != 2
                || entry.via.array.ptr[0].type != msgpack::type::STR
                || entry.via.array.ptr[1].type != msgpack::type::STR) {
                throw snapshotError("entry is not a pair of strings");
            }
            v.entries.emplace_back(
                entry.via.array.ptr[0].as<std::string>(),
                entry.via.array.ptr[1].as<std::string>());
        }

        return o;
    }
};

template<>
struct pack<ordprops::OrderedPropertiesSnapshot>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(
        msgpack::packer<Stream>& o, const ordprops::OrderedPropertiesSnapshot& v) const
    {
        using namespace std::string_literals;

        o.pack_map(3);

        o.pack("ordering"s);
        o.pack(std::string{magic_enum::enum_name(v.ordering)});

        o.pack("suppressDate"s);
        o.pack(v.suppressDate);

        o.pack("entries"s);
        o.pack_array(v.entries.size());
        for (const auto& [key, val] : v.entries) {
            o.pack_array(2);
            o.pack(key);
            o.pack(val);
        }

        return o;
    }
};

template<>
struct pack<ordprops::OrderedProperties>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(
        msgpack::packer<Stream>& o, const ordprops::OrderedProperties& v) const
    {
        return o.pack(v.snapshot());
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------
