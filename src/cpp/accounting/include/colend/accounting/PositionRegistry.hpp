/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/accounting/UserPosition.hpp"
#include "colend/serialization/JsonSerializable.hpp"
#include "colend/util/common.hpp"

//-------------------------------------------------------------------------

namespace colend::accounting
{

//-------------------------------------------------------------------------

class PositionRegistry : public JsonSerializable
{
public:
    using ContainerType = std::map<AccountId, UserPosition>;

    [[nodiscard]] UserPosition& at(const AccountId& owner);
    [[nodiscard]] const UserPosition& at(const AccountId& owner) const;

    [[nodiscard]] auto* find(this auto&& self, const AccountId& owner) noexcept
    {
        auto it = self.m_underlying.find(owner);
        return it != self.m_underlying.end() ? std::addressof(it->second) : nullptr;
    }

    [[nodiscard]] decltype(auto) begin(this auto&& self) { return self.m_underlying.begin(); }
    [[nodiscard]] decltype(auto) end(this auto&& self) { return self.m_underlying.end(); }

    [[nodiscard]] bool contains(const AccountId& owner) const noexcept;
    [[nodiscard]] size_t size() const noexcept { return m_underlying.size(); }
    [[nodiscard]] const ContainerType& positions() const noexcept { return m_underlying; }

    // Replaces the stored position of position.owner() (or inserts it).
    void commit(UserPosition position);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    ContainerType m_underlying;
};

//-------------------------------------------------------------------------

}  // namespace colend::accounting

//-------------------------------------------------------------------------
