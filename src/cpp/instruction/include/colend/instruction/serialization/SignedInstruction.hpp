/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/instruction/Instruction.hpp"
#include "colend/serialization/msgpack_util.hpp"

//-------------------------------------------------------------------------

namespace colend::instruction::detail
{

[[nodiscard]] inline Instruction instructionFromFields(
    InstructionKind kind, const msgpack::object& fields)
{
    using serialization::expectArray;

    switch (kind) {
        case InstructionKind::INITIALIZE_POSITION:
            expectArray(fields, 0);
            return InitializePosition{};
        case InstructionKind::DEPOSIT:
            expectArray(fields, 1);
            return Deposit{.amount = fields.via.array.ptr[0].as<Amount>()};
        case InstructionKind::ORIGINATE:
            expectArray(fields, 3);
            return Originate{
                .debtAmount = fields.via.array.ptr[0].as<Amount>(),
                .ltv = fields.via.array.ptr[1].as<uint8_t>(),
                .collateralDeposit = fields.via.array.ptr[2].as<Amount>()
            };
        case InstructionKind::REPAY:
            expectArray(fields, 3);
            return Repay{
                .owner = fields.via.array.ptr[0].as<AccountId>(),
                .loanId = fields.via.array.ptr[1].as<LoanId>(),
                .amount = fields.via.array.ptr[2].as<Amount>()
            };
        case InstructionKind::LIQUIDATE:
            expectArray(fields, 2);
            return Liquidate{
                .owner = fields.via.array.ptr[0].as<AccountId>(),
                .loanId = fields.via.array.ptr[1].as<LoanId>()
            };
        case InstructionKind::WITHDRAW:
            expectArray(fields, 1);
            return Withdraw{.amount = fields.via.array.ptr[0].as<Amount>()};
    }
    throw serialization::MsgPackError{fmt::format(
        "unknown instruction kind {}", std::to_underlying(kind))};
}

}  // namespace colend::instruction::detail

//-------------------------------------------------------------------------

namespace msgpack
{

MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{

namespace adaptor
{

// [kind, signer, timestamp, [fields...]]
template<>
struct convert<colend::instruction::SignedInstruction>
{
    const msgpack::object& operator()(
        const msgpack::object& o, colend::instruction::SignedInstruction& v) const
    {
        using namespace colend::instruction;

        colend::serialization::expectArray(o, 4);
        const auto& a = o.via.array.ptr;

        const auto kind = magic_enum::enum_cast<InstructionKind>(a[0].as<uint8_t>());
        if (!kind.has_value()) {
            throw colend::serialization::MsgPackError{fmt::format(
                "unknown instruction kind {}", a[0].as<uint32_t>())};
        }

        v.signer = a[1].as<colend::AccountId>();
        v.timestamp = a[2].as<colend::Timestamp>();
        v.instruction = detail::instructionFromFields(kind.value(), a[3]);

        return o;
    }
};

template<>
struct pack<colend::instruction::SignedInstruction>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(
        msgpack::packer<Stream>& o, const colend::instruction::SignedInstruction& v) const
    {
        using namespace colend::instruction;

        o.pack_array(4);
        o.pack(std::to_underlying(instructionKind(v.instruction)));
        o.pack(v.signer);
        o.pack(v.timestamp);
        std::visit(
            [&o](const auto& ins) {
                using T = std::remove_cvref_t<decltype(ins)>;
                if constexpr (std::same_as<T, InitializePosition>) {
                    o.pack_array(0);
                } else if constexpr (std::same_as<T, Deposit> || std::same_as<T, Withdraw>) {
                    o.pack_array(1);
                    o.pack(ins.amount);
                } else if constexpr (std::same_as<T, Originate>) {
                    o.pack_array(3);
                    o.pack(ins.debtAmount);
                    o.pack(ins.ltv);
                    o.pack(ins.collateralDeposit);
                } else if constexpr (std::same_as<T, Repay>) {
                    o.pack_array(3);
                    o.pack(ins.owner);
                    o.pack(ins.loanId);
                    o.pack(ins.amount);
                } else if constexpr (std::same_as<T, Liquidate>) {
                    o.pack_array(2);
                    o.pack(ins.owner);
                    o.pack(ins.loanId);
                }
            },
            v.instruction);
        return o;
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------
