/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/scenario/ScenarioRunner.hpp"

#include "colend/accounting/serialization/PositionRegistry.hpp"
#include "colend/serialization/json_util.hpp"

#include <fstream>
#include <iterator>

//-------------------------------------------------------------------------

namespace colend::scenario
{

//-------------------------------------------------------------------------

ScenarioRunner::ScenarioRunner(Scenario scenario)
    : m_scenario{std::move(scenario)}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    for (const auto& [asset, account, amount] : m_scenario.funding()) {
        if (auto credited = m_gateway.credit(asset, account, amount); !credited.has_value()) {
            throw std::invalid_argument{fmt::format(
                "{}: Could not fund {} {} to '{}': {}",
                ctx, amount, magic_enum::enum_name(asset), account, credited.error())};
        }
    }

    m_ledger = std::make_unique<lending::LoanLedger>(m_scenario.config(), m_oracle, m_gateway);
    m_processor = std::make_unique<instruction::InstructionProcessor>(*m_ledger);
}

//-------------------------------------------------------------------------

void ScenarioRunner::setEventLogger(std::unique_ptr<logging::EventLogger> logger) noexcept
{
    m_eventLogger = std::move(logger);
}

//-------------------------------------------------------------------------

const std::vector<ScenarioRunner::Outcome>& ScenarioRunner::run()
{
    const auto& steps = m_scenario.steps();
    for (; m_cursor < steps.size(); ++m_cursor) {
        std::visit([this](const auto& step) { apply(step); }, steps[m_cursor]);
    }
    return m_outcomes;
}

//-------------------------------------------------------------------------

void ScenarioRunner::apply(const PriceUpdate& update)
{
    const auto& feed = m_scenario.config().feed;
    m_oracle.setPrice(feed, update.quote);
    m_oracle.setAvailable(feed, update.available);
    m_ledger->logDebug("[{}] {} -> {}{}",
        update.time, feed, update.quote, update.available ? "" : " (unavailable)");
}

//-------------------------------------------------------------------------

void ScenarioRunner::apply(const instruction::SignedInstruction& si)
{
    auto result = m_processor->process(si);
    if (m_eventLogger) {
        m_eventLogger->log(si, result);
    }
    m_outcomes.push_back({.instruction = si, .result = std::move(result)});
}

//-------------------------------------------------------------------------

void ScenarioRunner::dumpPositions(const fs::path& path) const
{
    rapidjson::Document json{rapidjson::kObjectType};
    m_ledger->registry().jsonSerialize(json, "positions");
    m_gateway.jsonSerialize(json, "balances");

    std::ofstream ofs{path};
    if (!ofs) {
        throw std::runtime_error{fmt::format(
            "{}: Could not open '{}' for writing",
            std::source_location::current().function_name(), path.c_str())};
    }
    json::dumpJson(json, ofs, {.indent = json::IndentOptions{}});
}

//-------------------------------------------------------------------------

void ScenarioRunner::saveSnapshot(const fs::path& path) const
{
    serialization::BinaryStream stream;
    msgpack::pack(stream, m_ledger->registry());

    std::ofstream ofs{path, std::ios::binary};
    if (!ofs) {
        throw std::runtime_error{fmt::format(
            "{}: Could not open '{}' for writing",
            std::source_location::current().function_name(), path.c_str())};
    }
    ofs.write(stream.data(), static_cast<std::streamsize>(stream.size()));
}

//-------------------------------------------------------------------------

accounting::PositionRegistry ScenarioRunner::loadSnapshot(const fs::path& path)
{
    std::ifstream ifs{path, std::ios::binary};
    if (!ifs) {
        throw std::runtime_error{fmt::format(
            "{}: Could not open '{}'",
            std::source_location::current().function_name(), path.c_str())};
    }
    const std::string buffer{std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};

    msgpack::object_handle oh = msgpack::unpack(buffer.data(), buffer.size());
    return oh.get().as<accounting::PositionRegistry>();
}

//-------------------------------------------------------------------------

}  // namespace colend::scenario

//-------------------------------------------------------------------------
