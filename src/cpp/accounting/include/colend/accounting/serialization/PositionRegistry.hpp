/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/accounting/PositionRegistry.hpp"
#include "colend/accounting/serialization/UserPosition.hpp"
#include "colend/serialization/msgpack_util.hpp"

//-------------------------------------------------------------------------

namespace msgpack
{

MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{

namespace adaptor
{

template<>
struct convert<colend::accounting::PositionRegistry>
{
    const msgpack::object& operator()(
        const msgpack::object& o, colend::accounting::PositionRegistry& v) const
    {
        if (o.type != msgpack::type::ARRAY) {
            throw colend::serialization::MsgPackError{"expected an array of positions"};
        }

        colend::accounting::PositionRegistry registry;
        for (const auto& elem : std::span{o.via.array.ptr, o.via.array.size}) {
            auto position = elem.as<colend::accounting::UserPosition>();
            if (registry.contains(position.owner())) {
                throw colend::serialization::MsgPackError{fmt::format(
                    "duplicate position for '{}'", position.owner())};
            }
            registry.commit(std::move(position));
        }
        v = std::move(registry);

        return o;
    }
};

template<>
struct pack<colend::accounting::PositionRegistry>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(
        msgpack::packer<Stream>& o, const colend::accounting::PositionRegistry& v) const
    {
        o.pack_array(static_cast<uint32_t>(v.size()));
        for (const auto& [owner, position] : v) {
            o.pack(position);
        }
        return o;
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------
