/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/util/ErrorCode.hpp"
#include "colend/util/common.hpp"

#include <expected>

//-------------------------------------------------------------------------

namespace colend::oracle
{

//-------------------------------------------------------------------------

struct PriceQuote
{
    uint64_t price{};
    uint64_t scale{kPriceScale};
    Timestamp publishTime{};
};

//-------------------------------------------------------------------------

class PriceOracle
{
public:
    using ExpectedQuote = std::expected<PriceQuote, ErrorCode>;

    virtual ~PriceOracle() = default;

    // Spot price of the collateral asset in debt-asset units. Any failure
    // (unknown feed, feed down) is reported as PRICE_UNAVAILABLE.
    [[nodiscard]] virtual ExpectedQuote getPrice(const std::string& feed) const = 0;

protected:
    PriceOracle() = default;
};

//-------------------------------------------------------------------------

}  // namespace colend::oracle

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<colend::oracle::PriceQuote>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const colend::oracle::PriceQuote& quote, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "PriceQuote{{.price = {}, .scale = {}, .publishTime = {}}}",
            quote.price,
            quote.scale,
            quote.publishTime);
    }
};

//-------------------------------------------------------------------------
