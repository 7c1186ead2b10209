/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/accounting/serialization/PositionRegistry.hpp"
#include "colend/accounting/serialization/UserPosition.hpp"
#include "colend/serialization/msgpack_util.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace colend;
using namespace colend::accounting;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

UserPosition makePosition(const AccountId& owner, std::initializer_list<NewLoanDesc> loans)
{
    UserPosition position{owner};
    if (!position.collateral().deposit(50'000).has_value()) {
        throw std::runtime_error{"deposit failed"};
    }
    for (const auto& desc : loans) {
        if (!position.openLoan(desc).has_value()) {
            throw std::runtime_error{"openLoan failed"};
        }
    }
    return position;
}

template<typename T>
T unpackAs(const serialization::BinaryStream& stream)
{
    msgpack::object_handle oh = msgpack::unpack(stream.data(), stream.size());
    return oh.get().as<T>();
}

// Packs a raw position record so that individual fields can be corrupted.
void packRawPosition(
    serialization::BinaryStream& stream,
    uint32_t version,
    const AccountId& owner,
    Amount collateralTotal,
    Amount debt,
    LoanId loanCount,
    const UserPosition::Loans& loans)
{
    msgpack::packer<serialization::BinaryStream> packer{stream};
    packer.pack_array(6);
    packer.pack(version);
    packer.pack(owner);
    packer.pack(collateralTotal);
    packer.pack(debt);
    packer.pack(loanCount);
    packer.pack(loans);
}

}  // namespace

//-------------------------------------------------------------------------

struct UserPositionSerializationTest : TestWithParam<UserPosition>
{
    virtual void SetUp() override
    {
        refValue = GetParam();
    }

    UserPosition refValue;
};

TEST_P(UserPositionSerializationTest, Packed)
{
    serialization::BinaryStream stream;
    msgpack::pack(stream, refValue);
    EXPECT_EQ(unpackAs<UserPosition>(stream), refValue);
}

INSTANTIATE_TEST_SUITE_P(
    UserPositionSerializationTests,
    UserPositionSerializationTest,
    Values(
        UserPosition{"empty"},
        makePosition("alice", {
            {.principal = 1'000, .apy = 5, .ltv = 33, .collateral = 3'030, .startDate = 7}
        }),
        makePosition("bob", {
            {.principal = 1'000, .apy = 0, .ltv = 20, .collateral = 5'000, .startDate = 1},
            {.principal = 2'000, .apy = 8, .ltv = 50, .collateral = 4'000, .startDate = 2},
            {.principal = 3'000, .apy = 1, .ltv = 25, .collateral = 12'000, .startDate = 3}
        })));

//-------------------------------------------------------------------------

TEST(UserPositionDecodeTest, RejectsUnknownVersion)
{
    serialization::BinaryStream stream;
    packRawPosition(stream, kPositionLayoutVersion + 1, "alice", 0, 0, 0, {});
    EXPECT_THROW((void)unpackAs<UserPosition>(stream), serialization::MsgPackError);
}

TEST(UserPositionDecodeTest, RejectsWrongArity)
{
    serialization::BinaryStream stream;
    msgpack::packer<serialization::BinaryStream> packer{stream};
    packer.pack_array(3);
    packer.pack(kPositionLayoutVersion);
    packer.pack(std::string{"alice"});
    packer.pack(Amount{0});
    EXPECT_THROW((void)unpackAs<UserPosition>(stream), serialization::MsgPackError);
}

TEST(UserPositionDecodeTest, RejectsBrokenDebtInvariant)
{
    const auto position = makePosition("alice", {
        {.principal = 1'000, .apy = 5, .ltv = 33, .collateral = 3'030, .startDate = 0}
    });
    serialization::BinaryStream stream;
    packRawPosition(
        stream, kPositionLayoutVersion, "alice",
        position.collateral().getTotal(), 1'001, position.loanCount(), position.loans());
    EXPECT_THROW((void)unpackAs<UserPosition>(stream), serialization::MsgPackError);
}

TEST(UserPositionDecodeTest, RejectsUnknownTier)
{
    const UserPosition::Loans loans{Loan{LoanDesc{
        .id = 1,
        .borrower = "alice",
        .startDate = 0,
        .principal = 100,
        .apy = 7,
        .ltv = 33,
        .collateral = 300
    }}};
    serialization::BinaryStream stream;
    packRawPosition(stream, kPositionLayoutVersion, "alice", 300, 100, 1, loans);
    EXPECT_THROW((void)unpackAs<UserPosition>(stream), serialization::MsgPackError);
}

//-------------------------------------------------------------------------

TEST(PositionRegistrySerializationTest, Packed)
{
    PositionRegistry registry;
    registry.commit(makePosition("alice", {
        {.principal = 1'000, .apy = 8, .ltv = 50, .collateral = 2'000, .startDate = 5}
    }));
    registry.commit(UserPosition{"bob"});

    serialization::BinaryStream stream;
    msgpack::pack(stream, registry);
    const auto restored = unpackAs<PositionRegistry>(stream);

    ASSERT_EQ(restored.size(), 2u);
    EXPECT_EQ(restored.at("alice"), registry.at("alice"));
    EXPECT_EQ(restored.at("bob"), registry.at("bob"));
}

TEST(PositionRegistrySerializationTest, RejectsDuplicateOwner)
{
    serialization::BinaryStream stream;
    msgpack::packer<serialization::BinaryStream> packer{stream};
    packer.pack_array(2);
    packer.pack(UserPosition{"alice"});
    packer.pack(UserPosition{"alice"});
    EXPECT_THROW((void)unpackAs<PositionRegistry>(stream), serialization::MsgPackError);
}

//-------------------------------------------------------------------------
