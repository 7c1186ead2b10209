/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <cstdint>
#include <string_view>

//-------------------------------------------------------------------------

namespace colend
{

enum class ErrorCode : uint32_t
{
    INVALID_LTV,
    MAX_LOANS_REACHED,
    INSUFFICIENT_COLLATERAL,
    INSUFFICIENT_FUNDS,
    LOAN_NOT_FOUND,
    REPAYMENT_AMOUNT_TOO_HIGH,
    LOAN_NOT_UNDERWATER,
    UNAUTHORIZED,
    ARITHMETIC_OVERFLOW,
    PRICE_UNAVAILABLE,
    TRANSFER_FAILED,
    INVALID_AMOUNT,
    POSITION_NOT_FOUND,
    POSITION_EXISTS
};

[[nodiscard]] constexpr std::string_view ErrorCode2StrView(ErrorCode ec) noexcept
{
    return magic_enum::enum_name(ec);
}

}  // namespace colend

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<colend::ErrorCode>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(colend::ErrorCode ec, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", colend::ErrorCode2StrView(ec));
    }
};

//-------------------------------------------------------------------------
