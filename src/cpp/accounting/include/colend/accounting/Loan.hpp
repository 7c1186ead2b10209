/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/serialization/JsonSerializable.hpp"
#include "colend/util/common.hpp"

//-------------------------------------------------------------------------

namespace colend::accounting
{

//-------------------------------------------------------------------------

struct LoanDesc
{
    LoanId id{};
    AccountId borrower;
    Timestamp startDate{};
    Amount principal{};
    uint8_t apy{};
    uint8_t ltv{};
    Amount collateral{};
};

//-------------------------------------------------------------------------

class Loan : public JsonSerializable
{
public:
    Loan() noexcept = default;
    explicit Loan(LoanDesc desc) noexcept;

    [[nodiscard]] LoanId id() const noexcept { return m.id; }
    [[nodiscard]] const AccountId& borrower() const noexcept { return m.borrower; }
    [[nodiscard]] Timestamp startDate() const noexcept { return m.startDate; }
    [[nodiscard]] Amount principal() const noexcept { return m.principal; }
    [[nodiscard]] uint8_t apy() const noexcept { return m.apy; }
    [[nodiscard]] uint8_t ltv() const noexcept { return m.ltv; }
    [[nodiscard]] Amount collateral() const noexcept { return m.collateral; }

    [[nodiscard]] bool operator==(const Loan& other) const noexcept;

    // Restarts accrual at `now` on the remaining principal.
    void rebase(Amount principal, Timestamp now) noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    LoanDesc m;
};

//-------------------------------------------------------------------------

}  // namespace colend::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<colend::accounting::Loan>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const colend::accounting::Loan& loan, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Loan{{.id = {}, .borrower = {}, .startDate = {}, .principal = {}, "
            ".apy = {}, .ltv = {}, .collateral = {}}}",
            loan.id(),
            loan.borrower(),
            loan.startDate(),
            loan.principal(),
            loan.apy(),
            loan.ltv(),
            loan.collateral());
    }
};

//-------------------------------------------------------------------------
