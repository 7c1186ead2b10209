/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/accounting/Loan.hpp"
#include "colend/lending/LtvTable.hpp"
#include "colend/serialization/msgpack_util.hpp"

//-------------------------------------------------------------------------

namespace msgpack
{

MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{

namespace adaptor
{

// [id, borrower, startDate, principal, apy, ltv, collateral]
template<>
struct convert<colend::accounting::Loan>
{
    const msgpack::object& operator()(const msgpack::object& o, colend::accounting::Loan& v) const
    {
        colend::serialization::expectArray(o, 7);
        const auto& a = o.via.array.ptr;

        colend::accounting::LoanDesc desc{
            .id = a[0].as<colend::LoanId>(),
            .borrower = a[1].as<colend::AccountId>(),
            .startDate = a[2].as<colend::Timestamp>(),
            .principal = a[3].as<colend::Amount>(),
            .apy = a[4].as<uint8_t>(),
            .ltv = a[5].as<uint8_t>(),
            .collateral = a[6].as<colend::Amount>()
        };
        if (!colend::lending::isOfferedTier(desc.ltv, desc.apy)) {
            throw colend::serialization::MsgPackError{fmt::format(
                "loan #{} carries unknown tier (ltv {}, apy {})", desc.id, desc.ltv, desc.apy)};
        }
        v = colend::accounting::Loan{std::move(desc)};

        return o;
    }
};

template<>
struct pack<colend::accounting::Loan>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(
        msgpack::packer<Stream>& o, const colend::accounting::Loan& v) const
    {
        o.pack_array(7);
        o.pack(v.id());
        o.pack(v.borrower());
        o.pack(v.startDate());
        o.pack(v.principal());
        o.pack(v.apy());
        o.pack(v.ltv());
        o.pack(v.collateral());
        return o;
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------
