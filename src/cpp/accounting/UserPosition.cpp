/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/accounting/UserPosition.hpp"

#include "colend/util/checked.hpp"

#include <ostream>
#include <set>

//-------------------------------------------------------------------------

namespace colend::accounting
{

//-------------------------------------------------------------------------

UserPosition::UserPosition(AccountId owner) noexcept
    : m_owner{std::move(owner)}
{}

//-------------------------------------------------------------------------

bool UserPosition::atLoanLimit() const noexcept
{
    return m_loans.size() >= kMaxLoansPerUser;
}

//-------------------------------------------------------------------------

std::expected<LoanId, ErrorCode> UserPosition::openLoan(const NewLoanDesc& desc)
{
    if (atLoanLimit()) {
        return std::unexpected{ErrorCode::MAX_LOANS_REACHED};
    }
    if (desc.principal == 0) {
        return std::unexpected{ErrorCode::INVALID_AMOUNT};
    }

    const auto id = checked::add(m_loanCount, LoanId{1});
    if (!id.has_value()) return std::unexpected{id.error()};
    const auto debt = checked::add(m_debtAssetBalance, desc.principal);
    if (!debt.has_value()) return std::unexpected{debt.error()};

    if (auto reservation = m_collateral.makeReservation(id.value(), desc.collateral);
        !reservation.has_value()) {
        return std::unexpected{reservation.error()};
    }

    m_loans.emplace_back(LoanDesc{
        .id = id.value(),
        .borrower = m_owner,
        .startDate = desc.startDate,
        .principal = desc.principal,
        .apy = desc.apy,
        .ltv = desc.ltv,
        .collateral = desc.collateral
    });
    m_loanCount = id.value();
    m_debtAssetBalance = debt.value();

    return id.value();
}

//-------------------------------------------------------------------------

std::expected<Loan, ErrorCode> UserPosition::closeLoan(LoanId id)
{
    return removeLoan(id, false);
}

//-------------------------------------------------------------------------

std::expected<Loan, ErrorCode> UserPosition::seizeLoan(LoanId id)
{
    return removeLoan(id, true);
}

//-------------------------------------------------------------------------

std::expected<void, ErrorCode> UserPosition::rebaseLoan(
    LoanId id, Amount newPrincipal, Timestamp now)
{
    Loan* loan = findLoan(id);
    if (loan == nullptr) {
        return std::unexpected{ErrorCode::LOAN_NOT_FOUND};
    }
    const auto debt = checked::sub(loan->principal(), newPrincipal)
        .and_then([&](Amount repaid) { return checked::sub(m_debtAssetBalance, repaid); });
    if (!debt.has_value()) {
        return std::unexpected{debt.error()};
    }
    loan->rebase(newPrincipal, now);
    m_debtAssetBalance = debt.value();
    return {};
}

//-------------------------------------------------------------------------

std::expected<Loan, ErrorCode> UserPosition::removeLoan(LoanId id, bool seize)
{
    auto it = std::ranges::find(m_loans, id, &Loan::id);
    if (it == m_loans.end()) {
        return std::unexpected{ErrorCode::LOAN_NOT_FOUND};
    }
    const auto debt = checked::sub(m_debtAssetBalance, it->principal());
    if (!debt.has_value()) {
        return std::unexpected{debt.error()};
    }
    const auto released = seize
        ? m_collateral.voidReservation(id)
        : m_collateral.freeReservation(id);
    if (!released.has_value()) {
        return std::unexpected{released.error()};
    }

    Loan loan = std::move(*it);
    m_loans.erase(it);
    m_debtAssetBalance = debt.value();
    return loan;
}

//-------------------------------------------------------------------------

bool UserPosition::operator==(const UserPosition& other) const noexcept
{
    return m_owner == other.m_owner
        && m_collateral == other.m_collateral
        && m_debtAssetBalance == other.m_debtAssetBalance
        && m_loanCount == other.m_loanCount
        && m_loans == other.m_loans;
}

//-------------------------------------------------------------------------

void UserPosition::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("owner", rapidjson::Value{m_owner.c_str(), allocator}, allocator);
        m_collateral.jsonSerialize(json, "collateral");
        json.AddMember("debtAssetBalance", rapidjson::Value{m_debtAssetBalance}, allocator);
        json.AddMember("loanCount", rapidjson::Value{m_loanCount}, allocator);
        rapidjson::Value loansJson{rapidjson::kArrayType};
        for (const auto& loan : m_loans) {
            rapidjson::Document loanJson{&allocator};
            loan.jsonSerialize(loanJson);
            loansJson.PushBack(loanJson, allocator);
        }
        json.AddMember("loans", loansJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::ostream& operator<<(std::ostream& os, const UserPosition& position)
{
    return os << fmt::format("{}", position);
}

//-------------------------------------------------------------------------

UserPosition UserPosition::restore(
    AccountId owner,
    Amount collateralTotal,
    Amount debtAssetBalance,
    LoanId loanCount,
    Loans loans)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (loans.size() > kMaxLoansPerUser) {
        throw std::invalid_argument{fmt::format(
            "{}: Position of '{}' holds {} loans, limit is {}",
            ctx, owner, loans.size(), kMaxLoansPerUser)};
    }

    UserPosition position{std::move(owner)};
    position.m_collateral = CollateralBalance{collateralTotal};
    position.m_loanCount = loanCount;

    std::set<LoanId> seen;
    Amount principalSum{};
    for (auto& loan : loans) {
        if (loan.id() == 0 || loan.id() > loanCount || !seen.insert(loan.id()).second) {
            throw std::invalid_argument{fmt::format(
                "{}: Invalid or duplicate loan id {} (loanCount {})", ctx, loan.id(), loanCount)};
        }
        if (loan.borrower() != position.m_owner) {
            throw std::invalid_argument{fmt::format(
                "{}: Loan #{} is owned by '{}', expected '{}'",
                ctx, loan.id(), loan.borrower(), position.m_owner)};
        }
        if (loan.principal() == 0 || loan.collateral() == 0) {
            throw std::invalid_argument{fmt::format(
                "{}: Loan #{} has zero principal or collateral", ctx, loan.id())};
        }
        if (!position.m_collateral.makeReservation(loan.id(), loan.collateral()).has_value()) {
            throw std::invalid_argument{fmt::format(
                "{}: Loan collateral exceeds the collateral balance {}",
                ctx, position.m_collateral)};
        }
        const auto sum = checked::add(principalSum, loan.principal());
        if (!sum.has_value()) {
            throw std::invalid_argument{fmt::format("{}: Principal sum overflows", ctx)};
        }
        principalSum = sum.value();
        position.m_loans.push_back(std::move(loan));
    }

    if (principalSum != debtAssetBalance) {
        throw std::invalid_argument{fmt::format(
            "{}: Debt asset balance {} does not match outstanding principal {}",
            ctx, debtAssetBalance, principalSum)};
    }
    position.m_debtAssetBalance = debtAssetBalance;

    return position;
}

//-------------------------------------------------------------------------

}  // namespace colend::accounting

//-------------------------------------------------------------------------
