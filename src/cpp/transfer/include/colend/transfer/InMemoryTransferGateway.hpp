/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/serialization/JsonSerializable.hpp"
#include "colend/transfer/AssetTransferGateway.hpp"

#include <map>
#include <optional>
#include <vector>

//-------------------------------------------------------------------------

namespace colend::transfer
{

//-------------------------------------------------------------------------

class InMemoryTransferGateway : public AssetTransferGateway, public JsonSerializable
{
public:
    using Key = std::pair<Asset, AccountId>;
    using ContainerType = std::map<Key, Amount>;

    InMemoryTransferGateway() noexcept = default;

    [[nodiscard]] ExpectedTransfer transfer(const TransferDesc& desc) override;

    void begin() override;
    void commit() override;
    void rollback() noexcept override;
    [[nodiscard]] bool inTransaction() const noexcept override { return m_snapshot.has_value(); }

    // Creates units out of thin air; used to fund the treasury and test parties.
    [[nodiscard]] ExpectedTransfer credit(Asset asset, const AccountId& account, Amount amount);

    [[nodiscard]] Amount balance(Asset asset, const AccountId& account) const noexcept;
    [[nodiscard]] const ContainerType& balances() const noexcept { return m_balances; }
    [[nodiscard]] const std::vector<TransferDesc>& journal() const noexcept { return m_journal; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    ContainerType m_balances;
    std::optional<ContainerType> m_snapshot;
    std::vector<TransferDesc> m_journal;
    size_t m_journalMark{};
};

//-------------------------------------------------------------------------

}  // namespace colend::transfer

//-------------------------------------------------------------------------
