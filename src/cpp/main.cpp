/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/scenario/ScenarioRunner.hpp"
#include "colend/util/common.hpp"

#include <CLI/CLI.hpp>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"colend: collateralized lending ledger"};

    fs::path scenarioFile;
    app.add_option("-f,--scenario-file", scenarioFile, "Scenario file")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path positionsFile;
    app.add_option("-o,--positions", positionsFile, "Final positions dump (JSON)");

    fs::path snapshotFile;
    app.add_option("-s,--snapshot", snapshotFile, "Final positions snapshot (msgpack)");

    fs::path eventLogFile;
    app.add_option("-l,--event-log", eventLogFile, "Instruction outcome log (CSV)");

    CLI11_PARSE(app, argc, argv);

    fmt::print("{}\n", app.get_description());

    colend::scenario::ScenarioRunner runner{colend::scenario::Scenario::fromFile(scenarioFile)};
    fmt::print(" - '{}' loaded successfully\n", scenarioFile.c_str());

    if (!eventLogFile.empty()) {
        runner.setEventLogger(std::make_unique<colend::logging::EventLogger>(eventLogFile));
    }

    const auto& outcomes = runner.run();
    const auto rejected = ranges::count_if(
        outcomes, [](const auto& outcome) { return !outcome.result.has_value(); });
    fmt::print(
        " - {} instructions processed, {} rejected\n", outcomes.size(), rejected);

    if (!positionsFile.empty()) {
        runner.dumpPositions(positionsFile);
        fmt::print(" - positions written to '{}'\n", positionsFile.c_str());
    }
    if (!snapshotFile.empty()) {
        runner.saveSnapshot(snapshotFile);
        fmt::print(" - snapshot written to '{}'\n", snapshotFile.c_str());
    }

    return 0;
}

//-------------------------------------------------------------------------
