/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/transfer/InMemoryTransferGateway.hpp"

#include "colend/util/checked.hpp"

//-------------------------------------------------------------------------

namespace colend::transfer
{

//-------------------------------------------------------------------------

InMemoryTransferGateway::ExpectedTransfer InMemoryTransferGateway::transfer(
    const TransferDesc& desc)
{
    if (desc.amount == 0 || desc.from == desc.to) {
        return {};
    }

    const Amount fromBalance = balance(desc.asset, desc.from);
    const auto newFrom = checked::sub(fromBalance, desc.amount);
    const auto newTo = checked::add(balance(desc.asset, desc.to), desc.amount);
    if (!newFrom.has_value() || !newTo.has_value()) {
        return std::unexpected{ErrorCode::TRANSFER_FAILED};
    }

    m_balances[{desc.asset, desc.from}] = newFrom.value();
    m_balances[{desc.asset, desc.to}] = newTo.value();
    m_journal.push_back(desc);
    return {};
}

//-------------------------------------------------------------------------

void InMemoryTransferGateway::begin()
{
    if (m_snapshot.has_value()) {
        throw std::logic_error{fmt::format(
            "{}: nested transfer transactions are not supported",
            std::source_location::current().function_name())};
    }
    m_snapshot = m_balances;
    m_journalMark = m_journal.size();
}

//-------------------------------------------------------------------------

void InMemoryTransferGateway::commit()
{
    if (!m_snapshot.has_value()) {
        throw std::logic_error{fmt::format(
            "{}: no transfer transaction in progress",
            std::source_location::current().function_name())};
    }
    m_snapshot.reset();
}

//-------------------------------------------------------------------------

void InMemoryTransferGateway::rollback() noexcept
{
    if (!m_snapshot.has_value()) return;
    m_balances = std::move(m_snapshot).value();
    m_snapshot.reset();
    m_journal.erase(
        m_journal.begin() + static_cast<std::ptrdiff_t>(m_journalMark), m_journal.end());
}

//-------------------------------------------------------------------------

InMemoryTransferGateway::ExpectedTransfer InMemoryTransferGateway::credit(
    Asset asset, const AccountId& account, Amount amount)
{
    const auto newBalance = checked::add(balance(asset, account), amount);
    if (!newBalance.has_value()) {
        return std::unexpected{ErrorCode::TRANSFER_FAILED};
    }
    m_balances[{asset, account}] = newBalance.value();
    return {};
}

//-------------------------------------------------------------------------

Amount InMemoryTransferGateway::balance(Asset asset, const AccountId& account) const noexcept
{
    if (auto it = m_balances.find({asset, account}); it != m_balances.end()) {
        return it->second;
    }
    return 0;
}

//-------------------------------------------------------------------------

void InMemoryTransferGateway::jsonSerialize(
    rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetArray();
        auto& allocator = json.GetAllocator();
        for (const auto& [accountKey, amount] : m_balances) {
            const auto& [asset, account] = accountKey;
            rapidjson::Value entry{rapidjson::kObjectType};
            entry.AddMember(
                "asset",
                rapidjson::Value{magic_enum::enum_name(asset).data(), allocator},
                allocator);
            entry.AddMember("account", rapidjson::Value{account.c_str(), allocator}, allocator);
            entry.AddMember("amount", rapidjson::Value{amount}, allocator);
            json.PushBack(entry, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace colend::transfer

//-------------------------------------------------------------------------
