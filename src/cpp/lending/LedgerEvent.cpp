/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/lending/LedgerEvent.hpp"

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

namespace
{

void addString(rapidjson::Document& json, const char* name, const std::string& value)
{
    auto& allocator = json.GetAllocator();
    json.AddMember(
        rapidjson::StringRef(name), rapidjson::Value{value.c_str(), allocator}, allocator);
}

void addAmount(rapidjson::Document& json, const char* name, uint64_t value)
{
    json.AddMember(rapidjson::StringRef(name), rapidjson::Value{value}, json.GetAllocator());
}

void addFields(rapidjson::Document& json, const PositionOpened& e)
{
    addString(json, "owner", e.owner);
}

void addFields(rapidjson::Document& json, const CollateralDeposited& e)
{
    addString(json, "owner", e.owner);
    addAmount(json, "amount", e.amount);
    addAmount(json, "freeBalance", e.freeBalance);
}

void addFields(rapidjson::Document& json, const CollateralWithdrawn& e)
{
    addString(json, "owner", e.owner);
    addAmount(json, "amount", e.amount);
    addAmount(json, "freeBalance", e.freeBalance);
}

void addFields(rapidjson::Document& json, const LoanCreated& e)
{
    addAmount(json, "loanId", e.loanId);
    addString(json, "borrower", e.borrower);
    addAmount(json, "debtAmount", e.debtAmount);
    addAmount(json, "collateral", e.collateral);
    addAmount(json, "ltv", e.ltv);
    addAmount(json, "apy", e.apy);
}

void addFields(rapidjson::Document& json, const LoanRepaid& e)
{
    addAmount(json, "loanId", e.loanId);
    addString(json, "borrower", e.borrower);
    addAmount(json, "amount", e.amount);
    addAmount(json, "collateralReturned", e.collateralReturned);
    addAmount(json, "interestPaid", e.interestPaid);
}

void addFields(rapidjson::Document& json, const PartialRepayment& e)
{
    addAmount(json, "loanId", e.loanId);
    addString(json, "borrower", e.borrower);
    addAmount(json, "amount", e.amount);
    addAmount(json, "remainingPrincipal", e.remainingPrincipal);
    addAmount(json, "interestPaid", e.interestPaid);
}

void addFields(rapidjson::Document& json, const LoanLiquidated& e)
{
    addAmount(json, "loanId", e.loanId);
    addString(json, "borrower", e.borrower);
    addString(json, "liquidator", e.liquidator);
    addAmount(json, "debtRepaid", e.debtRepaid);
    addAmount(json, "collateralSeized", e.collateralSeized);
    addAmount(json, "collateralValue", e.collateralValue);
}

}  // namespace

//-------------------------------------------------------------------------

LedgerEvent::LedgerEvent(Timestamp timestamp, Payload payload) noexcept
    : m_timestamp{timestamp}, m_payload{std::move(payload)}
{}

//-------------------------------------------------------------------------

std::string_view LedgerEvent::name() const noexcept
{
    return std::visit([](const auto& e) { return std::remove_cvref_t<decltype(e)>::name; }, m_payload);
}

//-------------------------------------------------------------------------

bool LedgerEvent::operator==(const LedgerEvent& other) const noexcept
{
    return m_timestamp == other.m_timestamp && m_payload == other.m_payload;
}

//-------------------------------------------------------------------------

void LedgerEvent::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        const auto eventName = name();
        json.AddMember(
            "event",
            rapidjson::Value{eventName.data(), static_cast<rapidjson::SizeType>(eventName.size()), allocator},
            allocator);
        json.AddMember("timestamp", rapidjson::Value{m_timestamp}, allocator);
        std::visit([&json](const auto& e) { addFields(json, e); }, m_payload);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------
