/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/oracle/StaticPriceOracle.hpp"

//-------------------------------------------------------------------------

namespace colend::oracle
{

//-------------------------------------------------------------------------

StaticPriceOracle::ExpectedQuote StaticPriceOracle::getPrice(const std::string& feed) const
{
    if (m_unavailable.contains(feed)) {
        return std::unexpected{ErrorCode::PRICE_UNAVAILABLE};
    }
    auto it = m_quotes.find(feed);
    if (it == m_quotes.end()) {
        return std::unexpected{ErrorCode::PRICE_UNAVAILABLE};
    }
    return it->second;
}

//-------------------------------------------------------------------------

void StaticPriceOracle::setPrice(const std::string& feed, const PriceQuote& quote)
{
    if (feed.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: feed reference cannot be empty",
            std::source_location::current().function_name())};
    }
    m_quotes[feed] = quote;
}

//-------------------------------------------------------------------------

void StaticPriceOracle::setAvailable(const std::string& feed, bool flag) noexcept
{
    if (flag) {
        m_unavailable.erase(feed);
    } else {
        m_unavailable.insert(feed);
    }
}

//-------------------------------------------------------------------------

}  // namespace colend::oracle

//-------------------------------------------------------------------------
