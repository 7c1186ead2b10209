/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/oracle/PriceOracle.hpp"

#include <map>
#include <set>

//-------------------------------------------------------------------------

namespace colend::oracle
{

//-------------------------------------------------------------------------

class StaticPriceOracle : public PriceOracle
{
public:
    StaticPriceOracle() noexcept = default;

    [[nodiscard]] ExpectedQuote getPrice(const std::string& feed) const override;

    void setPrice(const std::string& feed, const PriceQuote& quote);
    void setAvailable(const std::string& feed, bool flag) noexcept;

    [[nodiscard]] const std::map<std::string, PriceQuote>& quotes() const noexcept
    {
        return m_quotes;
    }

private:
    std::map<std::string, PriceQuote> m_quotes;
    std::set<std::string> m_unavailable;
};

//-------------------------------------------------------------------------

}  // namespace colend::oracle

//-------------------------------------------------------------------------
