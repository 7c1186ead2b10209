/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/instruction/Instruction.hpp"
#include "colend/lending/LoanLedger.hpp"

#include <expected>

//-------------------------------------------------------------------------

namespace colend::instruction
{

//-------------------------------------------------------------------------

class InstructionProcessor
{
public:
    using ExpectedEvents = std::expected<lending::LedgerEvents, ErrorCode>;

    explicit InstructionProcessor(lending::LoanLedger& ledger) noexcept;

    [[nodiscard]] ExpectedEvents process(const SignedInstruction& si);

private:
    [[nodiscard]] ExpectedEvents dispatch(
        const lending::OperationContext& ctx, const InitializePosition& ins);
    [[nodiscard]] ExpectedEvents dispatch(
        const lending::OperationContext& ctx, const Deposit& ins);
    [[nodiscard]] ExpectedEvents dispatch(
        const lending::OperationContext& ctx, const Originate& ins);
    [[nodiscard]] ExpectedEvents dispatch(
        const lending::OperationContext& ctx, const Repay& ins);
    [[nodiscard]] ExpectedEvents dispatch(
        const lending::OperationContext& ctx, const Liquidate& ins);
    [[nodiscard]] ExpectedEvents dispatch(
        const lending::OperationContext& ctx, const Withdraw& ins);

    lending::LoanLedger& m_ledger;
};

//-------------------------------------------------------------------------

}  // namespace colend::instruction

//-------------------------------------------------------------------------
