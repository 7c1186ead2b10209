/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <range/v3/all.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <source_location>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace views = ranges::views;

//-------------------------------------------------------------------------

namespace colend
{

using Amount = uint64_t;
using LoanId = uint64_t;
using AccountId = std::string;
using Timestamp = int64_t;

inline constexpr size_t kMaxLoansPerUser = 5;

// Fixed decimal precision of collateral prices (10'000 = 1.0).
inline constexpr uint64_t kPriceScale = 10'000;

inline constexpr uint64_t kSecondsPerYear = 31'536'000;

}  // namespace colend

//-------------------------------------------------------------------------
