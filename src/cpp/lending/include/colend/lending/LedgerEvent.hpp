/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/serialization/JsonSerializable.hpp"
#include "colend/util/common.hpp"

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

struct PositionOpened
{
    static constexpr std::string_view name = "PositionOpened";

    AccountId owner;

    [[nodiscard]] bool operator==(const PositionOpened&) const noexcept = default;
};

struct CollateralDeposited
{
    static constexpr std::string_view name = "CollateralDeposited";

    AccountId owner;
    Amount amount{};
    Amount freeBalance{};

    [[nodiscard]] bool operator==(const CollateralDeposited&) const noexcept = default;
};

struct CollateralWithdrawn
{
    static constexpr std::string_view name = "CollateralWithdrawn";

    AccountId owner;
    Amount amount{};
    Amount freeBalance{};

    [[nodiscard]] bool operator==(const CollateralWithdrawn&) const noexcept = default;
};

struct LoanCreated
{
    static constexpr std::string_view name = "LoanCreated";

    LoanId loanId{};
    AccountId borrower;
    Amount debtAmount{};
    Amount collateral{};
    uint8_t ltv{};
    uint8_t apy{};

    [[nodiscard]] bool operator==(const LoanCreated&) const noexcept = default;
};

struct LoanRepaid
{
    static constexpr std::string_view name = "LoanRepaid";

    LoanId loanId{};
    AccountId borrower;
    Amount amount{};
    Amount collateralReturned{};
    Amount interestPaid{};

    [[nodiscard]] bool operator==(const LoanRepaid&) const noexcept = default;
};

struct PartialRepayment
{
    static constexpr std::string_view name = "PartialRepayment";

    LoanId loanId{};
    AccountId borrower;
    Amount amount{};
    Amount remainingPrincipal{};
    Amount interestPaid{};

    [[nodiscard]] bool operator==(const PartialRepayment&) const noexcept = default;
};

struct LoanLiquidated
{
    static constexpr std::string_view name = "LoanLiquidated";

    LoanId loanId{};
    AccountId borrower;
    AccountId liquidator;
    Amount debtRepaid{};
    Amount collateralSeized{};
    Amount collateralValue{};

    [[nodiscard]] bool operator==(const LoanLiquidated&) const noexcept = default;
};

//-------------------------------------------------------------------------

class LedgerEvent : public JsonSerializable
{
public:
    using Payload = std::variant<
        PositionOpened,
        CollateralDeposited,
        CollateralWithdrawn,
        LoanCreated,
        LoanRepaid,
        PartialRepayment,
        LoanLiquidated>;

    LedgerEvent(Timestamp timestamp, Payload payload) noexcept;

    [[nodiscard]] Timestamp timestamp() const noexcept { return m_timestamp; }
    [[nodiscard]] const Payload& payload() const noexcept { return m_payload; }
    [[nodiscard]] std::string_view name() const noexcept;

    template<typename T>
    [[nodiscard]] const T* as() const noexcept { return std::get_if<T>(&m_payload); }

    [[nodiscard]] bool operator==(const LedgerEvent& other) const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    Timestamp m_timestamp;
    Payload m_payload;
};

using LedgerEvents = std::vector<LedgerEvent>;

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<colend::lending::LedgerEvent>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const colend::lending::LedgerEvent& event, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "{}", colend::json::jsonSerializable2str(event));
    }
};

//-------------------------------------------------------------------------
