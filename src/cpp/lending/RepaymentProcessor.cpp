/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/lending/RepaymentProcessor.hpp"

#include "colend/util/checked.hpp"

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

RepaymentProcessor::RepaymentProcessor(
    transfer::AssetTransferGateway& gateway, AccountId treasury) noexcept
    : m_gateway{gateway}, m_treasury{std::move(treasury)}
{}

//-------------------------------------------------------------------------

RepaymentProcessor::ExpectedPlan RepaymentProcessor::plan(
    const accounting::Loan& loan, Amount amount, Timestamp now) noexcept
{
    if (amount == 0) {
        return std::unexpected{ErrorCode::INVALID_AMOUNT};
    }

    const auto accrual = accrue(loan, now);
    if (!accrual.has_value()) {
        return std::unexpected{accrual.error()};
    }
    if (amount > accrual->totalOwed) {
        return std::unexpected{ErrorCode::REPAYMENT_AMOUNT_TOO_HIGH};
    }

    if (amount == accrual->totalOwed) {
        return Plan{
            .status = RepaymentStatus::FULLY_REPAID,
            .accrual = accrual.value(),
            .amount = amount,
            .newPrincipal = 0,
            .interestPaid = accrual->interest
        };
    }

    // Unpaid interest does not survive a partial payment; accrual restarts
    // at `now` on whatever principal is left.
    const Amount remaining = accrual->totalOwed - amount;
    const Amount newPrincipal = remaining > accrual->interest ? remaining - accrual->interest : 0;
    const auto principalPaid = checked::sub(accrual->principal, newPrincipal);
    if (!principalPaid.has_value()) {
        return std::unexpected{principalPaid.error()};
    }

    return Plan{
        .status = RepaymentStatus::PARTIALLY_REPAID,
        .accrual = accrual.value(),
        .amount = amount,
        .newPrincipal = newPrincipal,
        .interestPaid = amount > principalPaid.value() ? amount - principalPaid.value() : 0
    };
}

//-------------------------------------------------------------------------

RepaymentProcessor::ExpectedResult RepaymentProcessor::process(
    accounting::UserPosition& position,
    const AccountId& signer,
    LoanId loanId,
    Amount amount,
    Timestamp now) const
{
    if (signer != position.owner()) {
        return std::unexpected{ErrorCode::UNAUTHORIZED};
    }
    const accounting::Loan* loan = position.findLoan(loanId);
    if (loan == nullptr) {
        return std::unexpected{ErrorCode::LOAN_NOT_FOUND};
    }
    if (signer != loan->borrower()) {
        return std::unexpected{ErrorCode::UNAUTHORIZED};
    }

    const auto planned = plan(*loan, amount, now);
    if (!planned.has_value()) {
        return std::unexpected{planned.error()};
    }

    if (auto moved = m_gateway.transfer({
            .asset = transfer::Asset::DEBT,
            .from = signer,
            .to = m_treasury,
            .amount = amount
        });
        !moved.has_value()) {
        return std::unexpected{moved.error()};
    }

    const Amount collateral = loan->collateral();
    RepaymentResult result{
        .status = planned->status,
        .loanId = loanId,
        .amountPaid = amount,
        .interestPaid = planned->interestPaid,
        .remainingPrincipal = planned->newPrincipal
    };

    if (planned->status == RepaymentStatus::FULLY_REPAID || planned->newPrincipal == 0) {
        if (auto closed = position.closeLoan(loanId); !closed.has_value()) {
            return std::unexpected{closed.error()};
        }
        result.collateralReturned = collateral;
        result.loanClosed = true;
    }
    else if (auto rebased = position.rebaseLoan(loanId, planned->newPrincipal, now);
        !rebased.has_value()) {
        return std::unexpected{rebased.error()};
    }

    if (planned->status == RepaymentStatus::FULLY_REPAID) {
        result.events.emplace_back(now, LoanRepaid{
            .loanId = loanId,
            .borrower = signer,
            .amount = amount,
            .collateralReturned = collateral,
            .interestPaid = planned->interestPaid
        });
    } else {
        result.events.emplace_back(now, PartialRepayment{
            .loanId = loanId,
            .borrower = signer,
            .amount = amount,
            .remainingPrincipal = planned->newPrincipal,
            .interestPaid = planned->interestPaid
        });
    }

    return result;
}

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------
