/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/accounting/PositionRegistry.hpp"

//-------------------------------------------------------------------------

namespace colend::accounting
{

//-------------------------------------------------------------------------

UserPosition& PositionRegistry::at(const AccountId& owner)
{
    if (auto position = find(owner)) {
        return *position;
    }
    throw std::out_of_range{fmt::format(
        "{}: No position registered for '{}'",
        std::source_location::current().function_name(), owner)};
}

//-------------------------------------------------------------------------

const UserPosition& PositionRegistry::at(const AccountId& owner) const
{
    if (auto position = find(owner)) {
        return *position;
    }
    throw std::out_of_range{fmt::format(
        "{}: No position registered for '{}'",
        std::source_location::current().function_name(), owner)};
}

//-------------------------------------------------------------------------

bool PositionRegistry::contains(const AccountId& owner) const noexcept
{
    return m_underlying.contains(owner);
}

//-------------------------------------------------------------------------

void PositionRegistry::commit(UserPosition position)
{
    if (position.owner().empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot commit a position without an owner",
            std::source_location::current().function_name())};
    }
    auto owner = position.owner();
    m_underlying.insert_or_assign(std::move(owner), std::move(position));
}

//-------------------------------------------------------------------------

void PositionRegistry::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        for (const auto& [owner, position] : m_underlying) {
            position.jsonSerialize(json, owner);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace colend::accounting

//-------------------------------------------------------------------------
