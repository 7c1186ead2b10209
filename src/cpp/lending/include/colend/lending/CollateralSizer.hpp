/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/util/checked.hpp"
#include "colend/util/common.hpp"

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

// debtAmount * 100 / ltvRatio * kPriceScale / collateralPrice, truncating
// after each step in that order. `collateralPrice` is on the kPriceScale.
[[nodiscard]] checked::Result<Amount> requiredCollateral(
    Amount debtAmount, uint8_t ltvRatio, uint64_t collateralPrice) noexcept;

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------
