/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/util/common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace colend::instruction
{

//-------------------------------------------------------------------------

enum class InstructionKind : uint8_t
{
    INITIALIZE_POSITION,
    DEPOSIT,
    ORIGINATE,
    REPAY,
    LIQUIDATE,
    WITHDRAW
};

[[nodiscard]] constexpr std::string_view InstructionKind2StrView(InstructionKind kind) noexcept
{
    return magic_enum::enum_name(kind);
}

//-------------------------------------------------------------------------

struct InitializePosition
{
    static constexpr auto kind = InstructionKind::INITIALIZE_POSITION;

    [[nodiscard]] bool operator==(const InitializePosition&) const noexcept = default;
};

struct Deposit
{
    static constexpr auto kind = InstructionKind::DEPOSIT;

    Amount amount{};

    [[nodiscard]] bool operator==(const Deposit&) const noexcept = default;
};

struct Originate
{
    static constexpr auto kind = InstructionKind::ORIGINATE;

    Amount debtAmount{};
    uint8_t ltv{};
    Amount collateralDeposit{};

    [[nodiscard]] bool operator==(const Originate&) const noexcept = default;
};

struct Repay
{
    static constexpr auto kind = InstructionKind::REPAY;

    // Empty means the signer's own position.
    AccountId owner;
    LoanId loanId{};
    Amount amount{};

    [[nodiscard]] bool operator==(const Repay&) const noexcept = default;
};

struct Liquidate
{
    static constexpr auto kind = InstructionKind::LIQUIDATE;

    AccountId owner;
    LoanId loanId{};

    [[nodiscard]] bool operator==(const Liquidate&) const noexcept = default;
};

struct Withdraw
{
    static constexpr auto kind = InstructionKind::WITHDRAW;

    Amount amount{};

    [[nodiscard]] bool operator==(const Withdraw&) const noexcept = default;
};

using Instruction =
    std::variant<InitializePosition, Deposit, Originate, Repay, Liquidate, Withdraw>;

[[nodiscard]] InstructionKind instructionKind(const Instruction& instruction) noexcept;

//-------------------------------------------------------------------------

struct SignedInstruction
{
    AccountId signer;
    Timestamp timestamp{};
    Instruction instruction;

    [[nodiscard]] bool operator==(const SignedInstruction&) const noexcept = default;
};

// <Deposit signer="alice" time="10" amount="500"/>, one element per kind:
// InitializePosition, Deposit, Originate, Repay, Liquidate, Withdraw.
[[nodiscard]] SignedInstruction signedInstructionFromXML(pugi::xml_node node);

//-------------------------------------------------------------------------

}  // namespace colend::instruction

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<colend::instruction::Instruction>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const colend::instruction::Instruction& instruction, FormatContext& ctx) const
    {
        using namespace colend::instruction;
        return std::visit(
            [&](const auto& ins) {
                using T = std::remove_cvref_t<decltype(ins)>;
                if constexpr (std::same_as<T, Deposit> || std::same_as<T, Withdraw>) {
                    return fmt::format_to(
                        ctx.out(), "{}({})", InstructionKind2StrView(T::kind), ins.amount);
                } else if constexpr (std::same_as<T, Originate>) {
                    return fmt::format_to(
                        ctx.out(), "{}({}, ltv {}, deposit {})",
                        InstructionKind2StrView(T::kind), ins.debtAmount, ins.ltv,
                        ins.collateralDeposit);
                } else if constexpr (std::same_as<T, Repay>) {
                    return fmt::format_to(
                        ctx.out(), "{}({}#{}, {})",
                        InstructionKind2StrView(T::kind), ins.owner, ins.loanId, ins.amount);
                } else if constexpr (std::same_as<T, Liquidate>) {
                    return fmt::format_to(
                        ctx.out(), "{}({}#{})",
                        InstructionKind2StrView(T::kind), ins.owner, ins.loanId);
                } else {
                    return fmt::format_to(ctx.out(), "{}", InstructionKind2StrView(T::kind));
                }
            },
            instruction);
    }
};

template<>
struct fmt::formatter<colend::instruction::SignedInstruction>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const colend::instruction::SignedInstruction& si, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{} @ {} : {}", si.signer, si.timestamp, si.instruction);
    }
};

//-------------------------------------------------------------------------
