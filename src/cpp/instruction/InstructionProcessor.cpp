/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/instruction/InstructionProcessor.hpp"

//-------------------------------------------------------------------------

namespace colend::instruction
{

//-------------------------------------------------------------------------

namespace
{

template<typename T>
InstructionProcessor::ExpectedEvents takeEvents(std::expected<T, ErrorCode>&& result)
{
    if (!result.has_value()) {
        return std::unexpected{result.error()};
    }
    return std::move(result->events);
}

}  // namespace

//-------------------------------------------------------------------------

InstructionProcessor::InstructionProcessor(lending::LoanLedger& ledger) noexcept
    : m_ledger{ledger}
{}

//-------------------------------------------------------------------------

InstructionProcessor::ExpectedEvents InstructionProcessor::process(const SignedInstruction& si)
{
    const lending::OperationContext ctx{.signer = si.signer, .now = si.timestamp};

    auto result = std::visit(
        [&](const auto& ins) { return dispatch(ctx, ins); }, si.instruction);

    if (!result.has_value()) {
        m_ledger.logDebug("[{}] {} rejected: {}", si.timestamp, si, result.error());
    }
    return result;
}

//-------------------------------------------------------------------------

InstructionProcessor::ExpectedEvents InstructionProcessor::dispatch(
    const lending::OperationContext& ctx, const InitializePosition&)
{
    return m_ledger.openPosition(ctx);
}

//-------------------------------------------------------------------------

InstructionProcessor::ExpectedEvents InstructionProcessor::dispatch(
    const lending::OperationContext& ctx, const Deposit& ins)
{
    return takeEvents(m_ledger.deposit(ctx, ins.amount));
}

//-------------------------------------------------------------------------

InstructionProcessor::ExpectedEvents InstructionProcessor::dispatch(
    const lending::OperationContext& ctx, const Originate& ins)
{
    return takeEvents(m_ledger.originate(ctx, {
        .debtAmount = ins.debtAmount,
        .ltv = ins.ltv,
        .collateralDeposit = ins.collateralDeposit
    }));
}

//-------------------------------------------------------------------------

InstructionProcessor::ExpectedEvents InstructionProcessor::dispatch(
    const lending::OperationContext& ctx, const Repay& ins)
{
    return takeEvents(m_ledger.repay(ctx, ins.owner, ins.loanId, ins.amount));
}

//-------------------------------------------------------------------------

InstructionProcessor::ExpectedEvents InstructionProcessor::dispatch(
    const lending::OperationContext& ctx, const Liquidate& ins)
{
    return takeEvents(m_ledger.liquidate(ctx, ins.owner, ins.loanId));
}

//-------------------------------------------------------------------------

InstructionProcessor::ExpectedEvents InstructionProcessor::dispatch(
    const lending::OperationContext& ctx, const Withdraw& ins)
{
    return takeEvents(m_ledger.withdraw(ctx, ins.amount));
}

//-------------------------------------------------------------------------

}  // namespace colend::instruction

//-------------------------------------------------------------------------
