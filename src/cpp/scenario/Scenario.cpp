/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/scenario/Scenario.hpp"

#include <fmt/ranges.h>

//-------------------------------------------------------------------------

namespace colend::scenario
{

//-------------------------------------------------------------------------

namespace
{

Funding fundingFromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const std::string assetName = node.attribute("asset").as_string();
    const auto asset = magic_enum::enum_cast<transfer::Asset>(assetName);
    if (!asset.has_value()) {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown asset '{}', expected one of {}",
            ctx, assetName, fmt::join(magic_enum::enum_names<transfer::Asset>(), ", "))};
    }
    std::string account = node.attribute("account").as_string();
    if (account.empty()) {
        throw std::invalid_argument{fmt::format("{}: <{}> requires an account", ctx, node.name())};
    }
    return {
        .asset = asset.value(),
        .account = std::move(account),
        .amount = node.attribute("amount").as_ullong()
    };
}

PriceUpdate priceUpdateFromXML(pugi::xml_node node)
{
    const Timestamp time = node.attribute("time").as_llong();
    return {
        .time = time,
        .quote = {
            .price = node.attribute("price").as_ullong(),
            .scale = node.attribute("scale").as_ullong(kPriceScale),
            .publishTime = node.attribute("publishTime").as_llong(time)
        },
        .available = node.attribute("available").as_bool(true)
    };
}

}  // namespace

//-------------------------------------------------------------------------

Scenario::Scenario(
    lending::LedgerConfig config, std::vector<Funding> funding, std::vector<Step> steps)
    : m_config{std::move(config)}, m_funding{std::move(funding)}, m_steps{std::move(steps)}
{}

//-------------------------------------------------------------------------

Scenario Scenario::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_node ledgerNode = node.child("Ledger");
    if (!ledgerNode) {
        throw std::invalid_argument{fmt::format("{}: missing node 'Ledger'", ctx)};
    }

    std::vector<Funding> funding;
    for (pugi::xml_node creditNode : node.child("Funding").children("Credit")) {
        funding.push_back(fundingFromXML(creditNode));
    }

    std::vector<Step> steps;
    for (pugi::xml_node stepNode : node.child("Steps").children()) {
        if (std::string_view{stepNode.name()} == "Price") {
            steps.emplace_back(priceUpdateFromXML(stepNode));
        } else {
            steps.emplace_back(instruction::signedInstructionFromXML(stepNode));
        }
    }

    return Scenario{lending::makeLedgerConfig(ledgerNode), std::move(funding), std::move(steps)};
}

//-------------------------------------------------------------------------

Scenario Scenario::fromFile(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::runtime_error{fmt::format(
            "{}: Could not load '{}': {}", ctx, path.c_str(), result.description())};
    }
    pugi::xml_node node = doc.child("Scenario");
    if (!node) {
        throw std::runtime_error{fmt::format("{}: '{}' has no <Scenario> root", ctx, path.c_str())};
    }
    return fromXML(node);
}

//-------------------------------------------------------------------------

}  // namespace colend::scenario

//-------------------------------------------------------------------------
