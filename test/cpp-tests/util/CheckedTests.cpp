/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/util/checked.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

//-------------------------------------------------------------------------

using namespace colend;

using namespace testing;

//-------------------------------------------------------------------------

static constexpr auto s_max = std::numeric_limits<uint64_t>::max();

TEST(CheckedTest, AddWithinRange)
{
    EXPECT_EQ(checked::add(uint64_t{40}, uint64_t{2}), 42u);
    EXPECT_EQ(checked::add(s_max - 1, uint64_t{1}), s_max);
}

TEST(CheckedTest, AddOverflows)
{
    const auto result = checked::add(s_max, uint64_t{1});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::ARITHMETIC_OVERFLOW);
}

TEST(CheckedTest, SubUnderflows)
{
    EXPECT_EQ(checked::sub(uint64_t{5}, uint64_t{5}), 0u);
    const auto result = checked::sub(uint64_t{5}, uint64_t{6});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::ARITHMETIC_OVERFLOW);
}

TEST(CheckedTest, SignedSubOverflows)
{
    const auto result = checked::sub(std::numeric_limits<int64_t>::min(), int64_t{1});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::ARITHMETIC_OVERFLOW);
}

TEST(CheckedTest, MulOverflows)
{
    EXPECT_EQ(checked::mul(uint64_t{1} << 31, uint64_t{1} << 32), uint64_t{1} << 63);
    const auto result = checked::mul(uint64_t{1} << 32, uint64_t{1} << 32);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::ARITHMETIC_OVERFLOW);
}

TEST(CheckedTest, DivTruncatesAndRejectsZero)
{
    EXPECT_EQ(checked::div(uint64_t{7}, uint64_t{2}), 3u);
    const auto result = checked::div(uint64_t{7}, uint64_t{0});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::ARITHMETIC_OVERFLOW);
}

//-------------------------------------------------------------------------
