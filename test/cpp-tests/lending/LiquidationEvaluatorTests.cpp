/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/lending/LiquidationEvaluator.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace colend;
using namespace colend::lending;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

accounting::Loan makeLoan(Amount principal, Amount collateral, uint8_t apy = 8)
{
    return accounting::Loan{accounting::LoanDesc{
        .id = 1,
        .borrower = "alice",
        .startDate = 0,
        .principal = principal,
        .apy = apy,
        .ltv = 50,
        .collateral = collateral
    }};
}

}  // namespace

//-------------------------------------------------------------------------

TEST(LiquidationEvaluatorTest, CollateralValue)
{
    EXPECT_THAT(collateralValue(2'000, kPriceScale), Optional(2'000u));
    EXPECT_THAT(collateralValue(2'000, 15'000), Optional(3'000u));
    EXPECT_THAT(collateralValue(3, 3'333), Optional(0u));
}

TEST(LiquidationEvaluatorTest, HealthyLoan)
{
    const auto loan = makeLoan(1'000, 2'000);
    const auto assessment = assessLoan(loan, 0, kPriceScale);
    ASSERT_TRUE(assessment.has_value());
    EXPECT_EQ(assessment->collateralValue, 2'000u);
    EXPECT_EQ(assessment->accrual.totalOwed, 1'000u);
    EXPECT_FALSE(assessment->underwater);
}

TEST(LiquidationEvaluatorTest, PriceDropSinksLoan)
{
    const auto loan = makeLoan(1'000, 2'000);
    // 2000 * 4999 / 10000 = 999 < 1000
    EXPECT_THAT(isUnderwater(loan, 0, 4'999), Optional(true));
    // 2000 * 5000 / 10000 = 1000, not strictly below.
    EXPECT_THAT(isUnderwater(loan, 0, 5'000), Optional(false));
}

TEST(LiquidationEvaluatorTest, InterestSinksLoan)
{
    const auto loan = makeLoan(1'000'000, 1'000'000);
    EXPECT_THAT(isUnderwater(loan, 0, kPriceScale), Optional(false));
    EXPECT_THAT(isUnderwater(loan, static_cast<Timestamp>(kSecondsPerYear), kPriceScale), Optional(true));
}

TEST(LiquidationEvaluatorTest, Idempotent)
{
    const auto loan = makeLoan(1'000'000, 1'900'000);
    const auto first = isUnderwater(loan, 12'345'678, 5'100);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(isUnderwater(loan, 12'345'678, 5'100), first);
    }
}

TEST(LiquidationEvaluatorTest, PropagatesClockRollback)
{
    auto loan = makeLoan(1'000, 2'000);
    loan.rebase(1'000, 500);
    const auto result = isUnderwater(loan, 499, kPriceScale);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::ARITHMETIC_OVERFLOW);
}

//-------------------------------------------------------------------------
