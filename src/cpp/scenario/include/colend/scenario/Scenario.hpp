/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/instruction/Instruction.hpp"
#include "colend/lending/LedgerConfig.hpp"
#include "colend/oracle/PriceOracle.hpp"
#include "colend/transfer/AssetTransferGateway.hpp"
#include "colend/util/common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace colend::scenario
{

//-------------------------------------------------------------------------

struct Funding
{
    transfer::Asset asset;
    AccountId account;
    Amount amount{};
};

struct PriceUpdate
{
    Timestamp time{};
    oracle::PriceQuote quote;
    bool available{true};
};

using Step = std::variant<PriceUpdate, instruction::SignedInstruction>;

//-------------------------------------------------------------------------

// <Scenario>
//   <Ledger treasury="..." feed="..." .../>
//   <Funding><Credit asset="DEBT" account="..." amount="..."/></Funding>
//   <Steps><Price time="0" price="15000"/><Deposit signer="..." .../></Steps>
// </Scenario>
class Scenario
{
public:
    Scenario(lending::LedgerConfig config, std::vector<Funding> funding, std::vector<Step> steps);

    [[nodiscard]] const lending::LedgerConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const std::vector<Funding>& funding() const noexcept { return m_funding; }
    [[nodiscard]] const std::vector<Step>& steps() const noexcept { return m_steps; }

    [[nodiscard]] static Scenario fromXML(pugi::xml_node node);
    [[nodiscard]] static Scenario fromFile(const fs::path& path);

private:
    lending::LedgerConfig m_config;
    std::vector<Funding> m_funding;
    std::vector<Step> m_steps;
};

//-------------------------------------------------------------------------

}  // namespace colend::scenario

//-------------------------------------------------------------------------
