/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/accounting/UserPosition.hpp"
#include "colend/lending/InterestAccrual.hpp"
#include "colend/lending/LedgerResults.hpp"
#include "colend/transfer/AssetTransferGateway.hpp"

#include <expected>

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

class RepaymentProcessor
{
public:
    struct Plan
    {
        RepaymentStatus status;
        Accrual accrual;
        Amount amount;
        Amount newPrincipal;
        Amount interestPaid;
    };

    using ExpectedPlan = std::expected<Plan, ErrorCode>;
    using ExpectedResult = std::expected<RepaymentResult, ErrorCode>;

    RepaymentProcessor(transfer::AssetTransferGateway& gateway, AccountId treasury) noexcept;

    // Splits a payment of `amount` against `loan` at `now` into the full or
    // partial repayment it amounts to. Pure.
    [[nodiscard]] static ExpectedPlan plan(
        const accounting::Loan& loan, Amount amount, Timestamp now) noexcept;

    // Applies the payment to `position`, pulling `amount` of the debt asset
    // from `signer` into the treasury. The caller owns atomicity.
    [[nodiscard]] ExpectedResult process(
        accounting::UserPosition& position,
        const AccountId& signer,
        LoanId loanId,
        Amount amount,
        Timestamp now) const;

private:
    transfer::AssetTransferGateway& m_gateway;
    AccountId m_treasury;
};

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------
