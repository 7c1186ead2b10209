/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/accounting/Loan.hpp"
#include "colend/util/checked.hpp"
#include "colend/util/common.hpp"

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

struct Accrual
{
    Amount principal{};
    Amount interest{};
    Amount totalOwed{};

    [[nodiscard]] bool operator==(const Accrual&) const noexcept = default;
};

//-------------------------------------------------------------------------

// principal * apyPercent * (now - startDate) / (kSecondsPerYear * 100).
// A clock running backwards is reported as ARITHMETIC_OVERFLOW.
[[nodiscard]] checked::Result<Amount> interestOwed(
    Amount principal, uint8_t apyPercent, Timestamp startDate, Timestamp now) noexcept;

[[nodiscard]] std::expected<Accrual, ErrorCode> accrue(
    const accounting::Loan& loan, Timestamp now) noexcept;

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<colend::lending::Accrual>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const colend::lending::Accrual& accrual, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Accrual{{.principal = {}, .interest = {}, .totalOwed = {}}}",
            accrual.principal,
            accrual.interest,
            accrual.totalOwed);
    }
};

//-------------------------------------------------------------------------
