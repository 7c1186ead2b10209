/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/instruction/InstructionProcessor.hpp"
#include "colend/lending/LoanLedger.hpp"
#include "colend/logging/EventLogger.hpp"
#include "colend/oracle/StaticPriceOracle.hpp"
#include "colend/scenario/Scenario.hpp"
#include "colend/transfer/InMemoryTransferGateway.hpp"

//-------------------------------------------------------------------------

namespace colend::scenario
{

//-------------------------------------------------------------------------

class ScenarioRunner
{
public:
    struct Outcome
    {
        instruction::SignedInstruction instruction;
        instruction::InstructionProcessor::ExpectedEvents result;
    };

    explicit ScenarioRunner(Scenario scenario);

    ScenarioRunner(const ScenarioRunner&) = delete;
    ScenarioRunner& operator=(const ScenarioRunner&) = delete;

    [[nodiscard]] const Scenario& scenario() const noexcept { return m_scenario; }
    [[nodiscard]] auto&& oracle(this auto&& self) noexcept { return self.m_oracle; }
    [[nodiscard]] auto&& gateway(this auto&& self) noexcept { return self.m_gateway; }
    [[nodiscard]] auto&& ledger(this auto&& self) noexcept { return *self.m_ledger; }
    [[nodiscard]] const std::vector<Outcome>& outcomes() const noexcept { return m_outcomes; }

    void setEventLogger(std::unique_ptr<logging::EventLogger> logger) noexcept;

    // Applies every remaining step in order; rejected instructions are recorded,
    // not fatal.
    const std::vector<Outcome>& run();

    void dumpPositions(const fs::path& path) const;
    void saveSnapshot(const fs::path& path) const;

    [[nodiscard]] static accounting::PositionRegistry loadSnapshot(const fs::path& path);

private:
    void apply(const PriceUpdate& update);
    void apply(const instruction::SignedInstruction& si);

    Scenario m_scenario;
    oracle::StaticPriceOracle m_oracle;
    transfer::InMemoryTransferGateway m_gateway;
    std::unique_ptr<lending::LoanLedger> m_ledger;
    std::unique_ptr<instruction::InstructionProcessor> m_processor;
    std::unique_ptr<logging::EventLogger> m_eventLogger;
    std::vector<Outcome> m_outcomes;
    size_t m_cursor{};
};

//-------------------------------------------------------------------------

}  // namespace colend::scenario

//-------------------------------------------------------------------------
