/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/accounting/Loan.hpp"
#include "colend/lending/InterestAccrual.hpp"
#include "colend/util/checked.hpp"

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

struct Assessment
{
    Accrual accrual;
    Amount collateralValue{};
    bool underwater{};
};

//-------------------------------------------------------------------------

// Value of `collateral` in debt-asset units at `price` (kPriceScale = 1.0).
[[nodiscard]] checked::Result<Amount> collateralValue(Amount collateral, uint64_t price) noexcept;

// A loan is underwater once its collateral is worth less than its total owed.
[[nodiscard]] std::expected<Assessment, ErrorCode> assessLoan(
    const accounting::Loan& loan, Timestamp now, uint64_t price) noexcept;

[[nodiscard]] std::expected<bool, ErrorCode> isUnderwater(
    const accounting::Loan& loan, Timestamp now, uint64_t price) noexcept;

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------
