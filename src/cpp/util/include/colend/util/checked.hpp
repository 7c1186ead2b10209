/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/util/ErrorCode.hpp"

#include <boost/safe_numerics/checked_integer.hpp>

#include <concepts>
#include <expected>

//-------------------------------------------------------------------------
// Overflow-checked integer arithmetic. Every failure (wrap, underflow,
// division by zero) surfaces as ErrorCode::ARITHMETIC_OVERFLOW.

namespace colend::checked
{

//-------------------------------------------------------------------------

template<std::integral T>
using Result = std::expected<T, ErrorCode>;

namespace detail
{

template<std::integral T>
[[nodiscard]] Result<T> unwrap(const boost::safe_numerics::checked_result<T>& r) noexcept
{
    if (r.exception()) {
        return std::unexpected{ErrorCode::ARITHMETIC_OVERFLOW};
    }
    return static_cast<T>(r);
}

}  // namespace detail

//-------------------------------------------------------------------------

template<std::integral T>
[[nodiscard]] Result<T> add(T a, T b) noexcept
{
    return detail::unwrap(boost::safe_numerics::checked::add<T>(a, b));
}

template<std::integral T>
[[nodiscard]] Result<T> sub(T a, T b) noexcept
{
    return detail::unwrap(boost::safe_numerics::checked::subtract<T>(a, b));
}

template<std::integral T>
[[nodiscard]] Result<T> mul(T a, T b) noexcept
{
    return detail::unwrap(boost::safe_numerics::checked::multiply<T>(a, b));
}

template<std::integral T>
[[nodiscard]] Result<T> div(T a, T b) noexcept
{
    return detail::unwrap(boost::safe_numerics::checked::divide<T>(a, b));
}

//-------------------------------------------------------------------------

}  // namespace colend::checked

//-------------------------------------------------------------------------
