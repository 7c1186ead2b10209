/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/logging/EventLogger.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

//-------------------------------------------------------------------------

using namespace colend;
using namespace colend::instruction;
using namespace colend::lending;
using namespace colend::logging;

using namespace testing;

//-------------------------------------------------------------------------

static const SignedInstruction s_deposit{
    .signer = "alice",
    .timestamp = 10,
    .instruction = Deposit{.amount = 500}
};

TEST(EventLoggerTest, FormatsAcceptedInstruction)
{
    const InstructionProcessor::ExpectedEvents outcome{LedgerEvents{
        LedgerEvent{10, CollateralDeposited{.owner = "alice", .amount = 500, .freeBalance = 500}}
    }};

    const auto entry = EventLogger::formatEntry(s_deposit, outcome);
    EXPECT_THAT(entry, StartsWith("10,alice,DEPOSIT,OK,["));
    EXPECT_THAT(entry, HasSubstr(R"("event":"CollateralDeposited")"));
    EXPECT_THAT(entry, HasSubstr(R"("freeBalance":500)"));
    EXPECT_THAT(entry, EndsWith("]"));
}

TEST(EventLoggerTest, FormatsRejectedInstruction)
{
    const InstructionProcessor::ExpectedEvents outcome{
        std::unexpect, ErrorCode::POSITION_NOT_FOUND};

    EXPECT_EQ(
        EventLogger::formatEntry(s_deposit, outcome),
        "10,alice,DEPOSIT,POSITION_NOT_FOUND,[]");
}

TEST(EventLoggerTest, WritesHeaderAndEntries)
{
    const fs::path path = fs::temp_directory_path() / "colend-event-logger-test.csv";
    {
        const EventLogger logger{path};
        logger.log(s_deposit, std::unexpected{ErrorCode::POSITION_NOT_FOUND});
    }

    std::ifstream ifs{path};
    std::string header, entry;
    ASSERT_TRUE(std::getline(ifs, header));
    ASSERT_TRUE(std::getline(ifs, entry));
    EXPECT_EQ(header, "time,signer,instruction,status,events");
    EXPECT_EQ(entry, "10,alice,DEPOSIT,POSITION_NOT_FOUND,[]");

    fs::remove(path);
}

//-------------------------------------------------------------------------
