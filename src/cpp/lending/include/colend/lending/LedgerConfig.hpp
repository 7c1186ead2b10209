/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/util/common.hpp"

#include <pugixml.hpp>

#include <source_location>

//-------------------------------------------------------------------------

namespace colend::lending
{

struct LedgerConfig
{
    AccountId treasury;
    std::string feed;
    std::string collateralSymbol{"COLLATERAL"};
    std::string debtSymbol{"DEBT"};
    // Oldest acceptable oracle quote in seconds; 0 disables the check.
    Timestamp maxPriceAge{};
    bool debug{};
};

[[nodiscard]] LedgerConfig makeLedgerConfig(pugi::xml_node node);

}  // namespace colend::lending

//-------------------------------------------------------------------------
