/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/lending/LiquidationEvaluator.hpp"

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

checked::Result<Amount> collateralValue(Amount collateral, uint64_t price) noexcept
{
    return checked::mul(collateral, price)
        .and_then([](Amount v) { return checked::div(v, kPriceScale); });
}

//-------------------------------------------------------------------------

std::expected<Assessment, ErrorCode> assessLoan(
    const accounting::Loan& loan, Timestamp now, uint64_t price) noexcept
{
    const auto accrual = accrue(loan, now);
    if (!accrual.has_value()) {
        return std::unexpected{accrual.error()};
    }
    return collateralValue(loan.collateral(), price)
        .transform([&](Amount value) {
            return Assessment{
                .accrual = accrual.value(),
                .collateralValue = value,
                .underwater = value < accrual->totalOwed
            };
        });
}

//-------------------------------------------------------------------------

std::expected<bool, ErrorCode> isUnderwater(
    const accounting::Loan& loan, Timestamp now, uint64_t price) noexcept
{
    return assessLoan(loan, now, price)
        .transform([](const Assessment& assessment) { return assessment.underwater; });
}

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------
