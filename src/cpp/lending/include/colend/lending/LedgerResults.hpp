/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/lending/InterestAccrual.hpp"
#include "colend/lending/LedgerEvent.hpp"
#include "colend/util/common.hpp"

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

struct OriginationResult
{
    LoanId loanId{};
    Amount debtAmount{};
    Amount collateral{};
    uint8_t ltv{};
    uint8_t apy{};
    LedgerEvents events;
};

enum class RepaymentStatus : uint8_t
{
    FULLY_REPAID,
    PARTIALLY_REPAID
};

[[nodiscard]] constexpr std::string_view RepaymentStatus2StrView(RepaymentStatus status) noexcept
{
    return magic_enum::enum_name(status);
}

struct RepaymentResult
{
    RepaymentStatus status{};
    LoanId loanId{};
    Amount amountPaid{};
    Amount interestPaid{};
    Amount remainingPrincipal{};
    Amount collateralReturned{};
    // Set when a partial payment left no principal and the loan was removed.
    bool loanClosed{};
    LedgerEvents events;
};

struct LiquidationResult
{
    LoanId loanId{};
    AccountId borrower;
    Amount debtRepaid{};
    Amount collateralSeized{};
    Amount collateralValue{};
    LedgerEvents events;
};

struct BalanceChange
{
    Amount amount{};
    Amount freeBalance{};
    LedgerEvents events;
};

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<colend::lending::RepaymentStatus>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(colend::lending::RepaymentStatus status, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", colend::lending::RepaymentStatus2StrView(status));
    }
};

//-------------------------------------------------------------------------
