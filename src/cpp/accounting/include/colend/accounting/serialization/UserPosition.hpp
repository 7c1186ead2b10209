/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/accounting/UserPosition.hpp"
#include "colend/accounting/serialization/Loan.hpp"
#include "colend/serialization/msgpack_util.hpp"

//-------------------------------------------------------------------------

namespace colend::accounting
{

inline constexpr uint32_t kPositionLayoutVersion = 1;

}  // namespace colend::accounting

//-------------------------------------------------------------------------

namespace msgpack
{

MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{

namespace adaptor
{

// [version, owner, collateralTotal, debtAssetBalance, loanCount, [loan...]]
template<>
struct convert<colend::accounting::UserPosition>
{
    const msgpack::object& operator()(
        const msgpack::object& o, colend::accounting::UserPosition& v) const
    {
        using namespace colend::accounting;

        colend::serialization::expectArray(o, 6);
        const auto& a = o.via.array.ptr;

        if (const auto version = a[0].as<uint32_t>(); version != kPositionLayoutVersion) {
            throw colend::serialization::MsgPackError{fmt::format(
                "unsupported position layout version {}", version)};
        }

        try {
            v = UserPosition::restore(
                a[1].as<colend::AccountId>(),
                a[2].as<colend::Amount>(),
                a[3].as<colend::Amount>(),
                a[4].as<colend::LoanId>(),
                a[5].as<UserPosition::Loans>());
        }
        catch (const std::invalid_argument& e) {
            throw colend::serialization::MsgPackError{e.what()};
        }

        return o;
    }
};

template<>
struct pack<colend::accounting::UserPosition>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(
        msgpack::packer<Stream>& o, const colend::accounting::UserPosition& v) const
    {
        o.pack_array(6);
        o.pack(colend::accounting::kPositionLayoutVersion);
        o.pack(v.owner());
        o.pack(v.collateral().getTotal());
        o.pack(v.debtAssetBalance());
        o.pack(v.loanCount());
        o.pack(v.loans());
        return o;
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------
