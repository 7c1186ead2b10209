/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/lending/InterestAccrual.hpp"

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

checked::Result<Amount> interestOwed(
    Amount principal, uint8_t apyPercent, Timestamp startDate, Timestamp now) noexcept
{
    if (now < startDate) {
        return std::unexpected{ErrorCode::ARITHMETIC_OVERFLOW};
    }
    const auto elapsed = checked::sub(now, startDate);
    if (!elapsed.has_value()) {
        return std::unexpected{elapsed.error()};
    }
    if (apyPercent == 0) {
        return Amount{};
    }

    static constexpr Amount denominator = kSecondsPerYear * 100;

    return checked::mul(principal, Amount{apyPercent})
        .and_then([&](Amount v) { return checked::mul(v, static_cast<Amount>(elapsed.value())); })
        .and_then([](Amount v) { return checked::div(v, denominator); });
}

//-------------------------------------------------------------------------

std::expected<Accrual, ErrorCode> accrue(const accounting::Loan& loan, Timestamp now) noexcept
{
    return interestOwed(loan.principal(), loan.apy(), loan.startDate(), now)
        .and_then([&](Amount interest) {
            return checked::add(loan.principal(), interest)
                .transform([&](Amount totalOwed) {
                    return Accrual{
                        .principal = loan.principal(),
                        .interest = interest,
                        .totalOwed = totalOwed
                    };
                });
        });
}

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------
