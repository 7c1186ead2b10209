/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/accounting/CollateralBalance.hpp"
#include "colend/accounting/Loan.hpp"
#include "colend/serialization/JsonSerializable.hpp"
#include "colend/util/ErrorCode.hpp"
#include "colend/util/common.hpp"

#include <fmt/ranges.h>

#include <algorithm>
#include <expected>
#include <iosfwd>

//-------------------------------------------------------------------------

namespace colend::accounting
{

//-------------------------------------------------------------------------

struct NewLoanDesc
{
    Amount principal{};
    uint8_t apy{};
    uint8_t ltv{};
    Amount collateral{};
    Timestamp startDate{};
};

//-------------------------------------------------------------------------

// Per-user ledger record. Invariants:
//   collateral().getReserved() == Σ loan.collateral()
//   debtAssetBalance() == Σ loan.principal()
//   loans().size() <= kMaxLoansPerUser, every loan has principal > 0
class UserPosition : public JsonSerializable
{
public:
    using Loans = std::vector<Loan>;

    UserPosition() noexcept = default;
    explicit UserPosition(AccountId owner) noexcept;

    [[nodiscard]] const AccountId& owner() const noexcept { return m_owner; }
    [[nodiscard]] auto&& collateral(this auto&& self) noexcept { return self.m_collateral; }
    [[nodiscard]] Amount debtAssetBalance() const noexcept { return m_debtAssetBalance; }
    [[nodiscard]] LoanId loanCount() const noexcept { return m_loanCount; }
    [[nodiscard]] const Loans& loans() const noexcept { return m_loans; }

    [[nodiscard]] auto* findLoan(this auto&& self, LoanId id) noexcept
    {
        auto it = std::ranges::find(self.m_loans, id, &Loan::id);
        return it != self.m_loans.end() ? std::addressof(*it) : nullptr;
    }

    [[nodiscard]] bool atLoanLimit() const noexcept;

    // Reserves the collateral and appends a loan numbered loanCount() + 1.
    [[nodiscard]] std::expected<LoanId, ErrorCode> openLoan(const NewLoanDesc& desc);
    // Releases the collateral to the free balance and removes the loan.
    [[nodiscard]] std::expected<Loan, ErrorCode> closeLoan(LoanId id);
    // Removes the loan together with its collateral.
    [[nodiscard]] std::expected<Loan, ErrorCode> seizeLoan(LoanId id);
    [[nodiscard]] std::expected<void, ErrorCode> rebaseLoan(
        LoanId id, Amount newPrincipal, Timestamp now);

    [[nodiscard]] bool operator==(const UserPosition& other) const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    friend std::ostream& operator<<(std::ostream& os, const UserPosition& position);

    // Rebuilds a position from its persisted fields, throwing
    // std::invalid_argument if they violate the invariants above.
    [[nodiscard]] static UserPosition restore(
        AccountId owner,
        Amount collateralTotal,
        Amount debtAssetBalance,
        LoanId loanCount,
        Loans loans);

private:
    [[nodiscard]] std::expected<Loan, ErrorCode> removeLoan(LoanId id, bool seize);

    AccountId m_owner;
    CollateralBalance m_collateral;
    Amount m_debtAssetBalance{};
    LoanId m_loanCount{};
    Loans m_loans;
};

//-------------------------------------------------------------------------

}  // namespace colend::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<colend::accounting::UserPosition>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const colend::accounting::UserPosition& position, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "UserPosition{{.owner = {}, .collateral = {}, .debtAssetBalance = {}, "
            ".loanCount = {}, .loans = [{}]}}",
            position.owner(),
            position.collateral(),
            position.debtAssetBalance(),
            position.loanCount(),
            fmt::join(position.loans(), ", "));
    }
};

//-------------------------------------------------------------------------
