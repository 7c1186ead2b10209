/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/scenario/ScenarioRunner.hpp"
#include "colend/serialization/json_util.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

//-------------------------------------------------------------------------

using namespace colend;
using namespace colend::scenario;
using namespace colend::transfer;

using namespace testing;

//-------------------------------------------------------------------------

static const fs::path s_scenarioPath = fs::path{COLEND_TEST_DATA_DIR} / "scenario.xml";

//-------------------------------------------------------------------------

TEST(ScenarioTest, FromFile)
{
    const auto scenario = Scenario::fromFile(s_scenarioPath);

    EXPECT_EQ(scenario.config().treasury, "treasury");
    EXPECT_EQ(scenario.config().feed, "COL/USD");
    EXPECT_EQ(scenario.config().collateralSymbol, "COL");
    EXPECT_EQ(scenario.config().maxPriceAge, 3'600);

    ASSERT_EQ(scenario.funding().size(), 4u);
    EXPECT_EQ(scenario.funding()[1].asset, Asset::COLLATERAL);
    EXPECT_EQ(scenario.funding()[1].account, "alice");
    EXPECT_EQ(scenario.funding()[1].amount, 5'000'000u);

    ASSERT_EQ(scenario.steps().size(), 12u);
    const auto* price = std::get_if<PriceUpdate>(&scenario.steps()[0]);
    ASSERT_NE(price, nullptr);
    EXPECT_EQ(price->quote.price, 15'000u);
    EXPECT_EQ(price->quote.scale, kPriceScale);
    EXPECT_TRUE(price->available);
    EXPECT_TRUE(std::holds_alternative<instruction::SignedInstruction>(scenario.steps()[1]));
}

TEST(ScenarioTest, MissingFile)
{
    EXPECT_THROW((void)Scenario::fromFile("does/not/exist.xml"), std::runtime_error);
}

TEST(ScenarioTest, MalformedScenario)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(R"(
        <Scenario>
          <Ledger treasury="t" feed="f"/>
          <Funding><Credit asset="GOLD" account="alice" amount="1"/></Funding>
        </Scenario>)"));
    EXPECT_THROW((void)Scenario::fromXML(doc.child("Scenario")), std::invalid_argument);

    ASSERT_TRUE(doc.load_string(R"(<Scenario><Steps/></Scenario>)"));
    EXPECT_THROW((void)Scenario::fromXML(doc.child("Scenario")), std::invalid_argument);
}

//-------------------------------------------------------------------------

struct ScenarioRunnerTest : Test
{
    virtual void SetUp() override
    {
        runner = std::make_unique<ScenarioRunner>(Scenario::fromFile(s_scenarioPath));
    }

    virtual void TearDown() override
    {
        for (const auto& path : scratch) {
            fs::remove(path);
        }
    }

    fs::path scratchFile(const std::string& name)
    {
        return scratch.emplace_back(fs::temp_directory_path() / name);
    }

    std::unique_ptr<ScenarioRunner> runner;
    std::vector<fs::path> scratch;
};

//-------------------------------------------------------------------------

TEST_F(ScenarioRunnerTest, Outcomes)
{
    const auto& outcomes = runner->run();
    ASSERT_EQ(outcomes.size(), 9u);

    std::vector<std::optional<ErrorCode>> errors;
    for (const auto& outcome : outcomes) {
        errors.push_back(
            outcome.result.has_value() ? std::nullopt : std::optional{outcome.result.error()});
    }
    EXPECT_THAT(errors, ElementsAre(
        std::nullopt,
        std::nullopt,
        std::nullopt,
        std::nullopt,
        Optional(ErrorCode::INVALID_LTV),
        std::nullopt,
        std::nullopt,
        std::nullopt,
        Optional(ErrorCode::INSUFFICIENT_FUNDS)));
}

TEST_F(ScenarioRunnerTest, FinalState)
{
    (void)runner->run();

    const auto& gateway = runner->gateway();
    EXPECT_EQ(gateway.balance(Asset::DEBT, "treasury"), 10'000'136u);
    EXPECT_EQ(gateway.balance(Asset::DEBT, "alice"), 599'973u);
    EXPECT_EQ(gateway.balance(Asset::DEBT, "bob"), 4'499'891u);
    EXPECT_EQ(gateway.balance(Asset::COLLATERAL, "alice"), 4'333'334u);
    EXPECT_EQ(gateway.balance(Asset::COLLATERAL, "bob"), 666'666u);
    EXPECT_EQ(gateway.balance(Asset::COLLATERAL, "treasury"), 0u);

    const auto& alice = runner->ledger().registry().at("alice");
    EXPECT_TRUE(alice.loans().empty());
    EXPECT_EQ(alice.loanCount(), 2u);
    EXPECT_EQ(alice.debtAssetBalance(), 0u);
    EXPECT_EQ(alice.collateral().getTotal(), 0u);
}

TEST_F(ScenarioRunnerTest, LiquidationDetails)
{
    const auto& outcomes = runner->run();
    const auto& liquidation = outcomes[6];
    ASSERT_TRUE(liquidation.result.has_value());
    ASSERT_EQ(liquidation.result->size(), 1u);
    const auto* event = liquidation.result->front().as<lending::LoanLiquidated>();
    ASSERT_NE(event, nullptr);
    EXPECT_EQ(event->debtRepaid, 500'109u);
    EXPECT_EQ(event->collateralSeized, 666'666u);
    EXPECT_EQ(event->collateralValue, 466'666u);
}

TEST_F(ScenarioRunnerTest, EventLog)
{
    const auto path = scratchFile("colend-scenario-events.csv");
    runner->setEventLogger(std::make_unique<logging::EventLogger>(path));
    (void)runner->run();

    std::ifstream ifs{path};
    std::vector<std::string> lines;
    for (std::string line; std::getline(ifs, line);) {
        lines.push_back(line);
    }
    ASSERT_EQ(lines.size(), 10u);
    EXPECT_EQ(lines[0], "time,signer,instruction,status,events");
    EXPECT_THAT(lines[1], StartsWith("0,alice,INITIALIZE_POSITION,OK,"));
    EXPECT_EQ(lines[5], "30,alice,ORIGINATE,INVALID_LTV,[]");
}

TEST_F(ScenarioRunnerTest, DumpPositions)
{
    const auto path = scratchFile("colend-scenario-positions.json");
    (void)runner->run();
    runner->dumpPositions(path);

    std::ifstream ifs{path};
    const std::string text{std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};
    const auto dump = json::str2json(text);
    ASSERT_TRUE(dump.IsObject());
    ASSERT_TRUE(dump.HasMember("positions"));
    ASSERT_TRUE(dump["positions"].HasMember("alice"));
    EXPECT_EQ(dump["positions"]["alice"]["loanCount"].GetUint64(), 2u);
    EXPECT_TRUE(dump.HasMember("balances"));
}

TEST_F(ScenarioRunnerTest, SnapshotRoundTrip)
{
    const auto path = scratchFile("colend-scenario-snapshot.msgpack");
    const auto& outcomes = runner->run();
    ASSERT_FALSE(outcomes.empty());
    runner->saveSnapshot(path);

    const auto restored = ScenarioRunner::loadSnapshot(path);
    const auto& registry = runner->ledger().registry();
    ASSERT_EQ(restored.size(), registry.size());
    EXPECT_EQ(restored.at("alice"), registry.at("alice"));
}

//-------------------------------------------------------------------------
