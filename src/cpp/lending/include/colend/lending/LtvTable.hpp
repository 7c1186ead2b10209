/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

struct LtvTier
{
    uint8_t ltv;
    uint8_t apy;

    [[nodiscard]] constexpr bool operator==(const LtvTier&) const noexcept = default;
};

// Offered loan-to-value ratios (percent) and their fixed annual rates (whole percent).
inline constexpr std::array<LtvTier, 4> kLtvTable{{
    {.ltv = 20, .apy = 0},
    {.ltv = 25, .apy = 1},
    {.ltv = 33, .apy = 5},
    {.ltv = 50, .apy = 8}
}};

namespace detail
{

consteval bool validLtvTable()
{
    for (size_t i = 0; i < kLtvTable.size(); ++i) {
        const auto [ltv, apy] = kLtvTable[i];
        if (ltv == 0 || ltv > 100 || apy > 100) return false;
        if (i > 0 && kLtvTable[i - 1].ltv >= ltv) return false;
    }
    return true;
}

}  // namespace detail

static_assert(detail::validLtvTable(), "LTV tiers must be in (0, 100] and strictly increasing");

//-------------------------------------------------------------------------

[[nodiscard]] constexpr std::optional<LtvTier> findLtvTier(uint8_t ltv) noexcept
{
    for (const auto& tier : kLtvTable) {
        if (tier.ltv == ltv) return tier;
    }
    return std::nullopt;
}

[[nodiscard]] constexpr bool isOfferedTier(uint8_t ltv, uint8_t apy) noexcept
{
    const auto tier = findLtvTier(ltv);
    return tier.has_value() && tier->apy == apy;
}

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------
