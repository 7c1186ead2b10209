/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/accounting/Loan.hpp"

//-------------------------------------------------------------------------

namespace colend::accounting
{

//-------------------------------------------------------------------------

Loan::Loan(LoanDesc desc) noexcept
    : m{std::move(desc)}
{}

//-------------------------------------------------------------------------

bool Loan::operator==(const Loan& other) const noexcept
{
    return m.id == other.m.id
        && m.borrower == other.m.borrower
        && m.startDate == other.m.startDate
        && m.principal == other.m.principal
        && m.apy == other.m.apy
        && m.ltv == other.m.ltv
        && m.collateral == other.m.collateral;
}

//-------------------------------------------------------------------------

void Loan::rebase(Amount principal, Timestamp now) noexcept
{
    m.principal = principal;
    m.startDate = now;
}

//-------------------------------------------------------------------------

void Loan::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{m.id}, allocator);
        json.AddMember("borrower", rapidjson::Value{m.borrower.c_str(), allocator}, allocator);
        json.AddMember("startDate", rapidjson::Value{m.startDate}, allocator);
        json.AddMember("principal", rapidjson::Value{m.principal}, allocator);
        json.AddMember("apy", rapidjson::Value{static_cast<uint32_t>(m.apy)}, allocator);
        json.AddMember("ltv", rapidjson::Value{static_cast<uint32_t>(m.ltv)}, allocator);
        json.AddMember("collateral", rapidjson::Value{m.collateral}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace colend::accounting

//-------------------------------------------------------------------------
