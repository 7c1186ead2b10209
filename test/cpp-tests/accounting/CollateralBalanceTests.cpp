/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/accounting/CollateralBalance.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

//-------------------------------------------------------------------------

using namespace colend;
using namespace colend::accounting;

using namespace testing;

//-------------------------------------------------------------------------

TEST(CollateralBalanceTest, InitialState)
{
    const CollateralBalance balance{1'000};
    EXPECT_EQ(balance.getTotal(), 1'000u);
    EXPECT_EQ(balance.getFree(), 1'000u);
    EXPECT_EQ(balance.getReserved(), 0u);
    EXPECT_TRUE(balance.getReservations().empty());
}

//-------------------------------------------------------------------------

struct ReserveTestParams
{
    Amount total;
    LoanId loanId;
    Amount reservation;
    std::optional<ErrorCode> error;
};

void PrintTo(const ReserveTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.total = {}, .loanId = {}, .reservation = {}, .error = {}}}",
        params.total,
        params.loanId,
        params.reservation,
        params.error.has_value() ? ErrorCode2StrView(*params.error) : "none");
}

struct ReserveTest : TestWithParam<ReserveTestParams>
{
    virtual void SetUp() override
    {
        params = GetParam();
        balance = CollateralBalance{params.total};
    }

    ReserveTestParams params;
    CollateralBalance balance;
};

TEST_P(ReserveTest, WorksCorrectly)
{
    const auto result = balance.makeReservation(params.loanId, params.reservation);

    if (params.error.has_value()) {
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error(), *params.error);
        EXPECT_EQ(balance.getFree(), params.total);
        EXPECT_EQ(balance.getReserved(), 0u);
        return;
    }

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(balance.getTotal(), params.total);
    EXPECT_EQ(balance.getFree(), params.total - params.reservation);
    EXPECT_EQ(balance.getReserved(), params.reservation);
    EXPECT_THAT(balance.getReservation(params.loanId), Optional(params.reservation));
}

INSTANTIATE_TEST_SUITE_P(
    CollateralBalanceTest,
    ReserveTest,
    Values(
        ReserveTestParams{.total = 100, .loanId = 1, .reservation = 42, .error = {}},
        ReserveTestParams{.total = 100, .loanId = 2, .reservation = 100, .error = {}},
        ReserveTestParams{
            .total = 100, .loanId = 3, .reservation = 101,
            .error = ErrorCode::INSUFFICIENT_COLLATERAL
        },
        ReserveTestParams{
            .total = 0, .loanId = 4, .reservation = 1,
            .error = ErrorCode::INSUFFICIENT_COLLATERAL
        },
        ReserveTestParams{
            .total = 100, .loanId = 5, .reservation = 0, .error = ErrorCode::INVALID_AMOUNT
        }));

//-------------------------------------------------------------------------

TEST(CollateralBalanceTest, DuplicateReservationThrows)
{
    CollateralBalance balance{100};
    ASSERT_TRUE(balance.makeReservation(1, 10).has_value());
    EXPECT_THROW((void)balance.makeReservation(1, 10), std::invalid_argument);
}

TEST(CollateralBalanceTest, FreeReservationReturnsToFree)
{
    CollateralBalance balance{100};
    ASSERT_TRUE(balance.makeReservation(7, 60).has_value());

    const auto freed = balance.freeReservation(7);
    ASSERT_TRUE(freed.has_value());
    EXPECT_EQ(freed.value(), 60u);
    EXPECT_EQ(balance.getFree(), 100u);
    EXPECT_EQ(balance.getTotal(), 100u);
    EXPECT_EQ(balance.getReservation(7), std::nullopt);
}

TEST(CollateralBalanceTest, VoidReservationLeavesTotal)
{
    CollateralBalance balance{100};
    ASSERT_TRUE(balance.makeReservation(7, 60).has_value());

    const auto voided = balance.voidReservation(7);
    ASSERT_TRUE(voided.has_value());
    EXPECT_EQ(voided.value(), 60u);
    EXPECT_EQ(balance.getFree(), 40u);
    EXPECT_EQ(balance.getReserved(), 0u);
    EXPECT_EQ(balance.getTotal(), 40u);
}

TEST(CollateralBalanceTest, UnknownReservation)
{
    CollateralBalance balance{100};
    EXPECT_EQ(balance.freeReservation(3).error(), ErrorCode::LOAN_NOT_FOUND);
    EXPECT_EQ(balance.voidReservation(3).error(), ErrorCode::LOAN_NOT_FOUND);
}

TEST(CollateralBalanceTest, WithdrawNeverTouchesReserved)
{
    CollateralBalance balance{100};
    ASSERT_TRUE(balance.makeReservation(1, 70).has_value());

    const auto tooMuch = balance.withdraw(31);
    ASSERT_FALSE(tooMuch.has_value());
    EXPECT_EQ(tooMuch.error(), ErrorCode::INSUFFICIENT_FUNDS);

    ASSERT_TRUE(balance.withdraw(30).has_value());
    EXPECT_EQ(balance.getFree(), 0u);
    EXPECT_EQ(balance.getReserved(), 70u);
    EXPECT_EQ(balance.getTotal(), 70u);
}

TEST(CollateralBalanceTest, DepositOverflow)
{
    CollateralBalance balance{std::numeric_limits<Amount>::max()};
    const auto result = balance.deposit(1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::ARITHMETIC_OVERFLOW);
    EXPECT_EQ(balance.getTotal(), std::numeric_limits<Amount>::max());
}

//-------------------------------------------------------------------------
