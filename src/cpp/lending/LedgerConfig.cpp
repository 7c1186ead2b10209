/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/lending/LedgerConfig.hpp"

#include <fmt/format.h>

//-------------------------------------------------------------------------

namespace colend::lending
{

LedgerConfig makeLedgerConfig(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    auto requireAttribute = [&](const char* name) -> std::string {
        std::string value = node.attribute(name).as_string();
        if (value.empty()) {
            throw std::invalid_argument{fmt::format(
                "{}: Attribute '{}' of <{}> must be set", sl.function_name(), name, node.name())};
        }
        return value;
    };

    const auto maxPriceAge = node.attribute("maxPriceAge").as_llong();
    if (maxPriceAge < 0) {
        throw std::invalid_argument{fmt::format(
            "{}: 'maxPriceAge' cannot be negative, was {}", sl.function_name(), maxPriceAge)};
    }

    return {
        .treasury = requireAttribute("treasury"),
        .feed = requireAttribute("feed"),
        .collateralSymbol = node.attribute("collateralSymbol").as_string("COLLATERAL"),
        .debtSymbol = node.attribute("debtSymbol").as_string("DEBT"),
        .maxPriceAge = maxPriceAge,
        .debug = node.attribute("debug").as_bool()
    };
}

}  // namespace colend::lending

//-------------------------------------------------------------------------
