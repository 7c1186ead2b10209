/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/lending/CollateralSizer.hpp"

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

checked::Result<Amount> requiredCollateral(
    Amount debtAmount, uint8_t ltvRatio, uint64_t collateralPrice) noexcept
{
    return checked::mul(debtAmount, Amount{100})
        .and_then([&](Amount v) { return checked::div(v, Amount{ltvRatio}); })
        .and_then([](Amount v) { return checked::mul(v, kPriceScale); })
        .and_then([&](Amount v) { return checked::div(v, collateralPrice); });
}

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------
