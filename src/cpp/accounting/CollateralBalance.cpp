/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/accounting/CollateralBalance.hpp"

#include "colend/util/checked.hpp"

#include <ostream>

//-------------------------------------------------------------------------

namespace colend::accounting
{

//-------------------------------------------------------------------------

CollateralBalance::CollateralBalance(Amount total) noexcept
    : m_free{total}, m_total{total}
{}

//-------------------------------------------------------------------------

std::optional<Amount> CollateralBalance::getReservation(LoanId id) const noexcept
{
    if (auto it = m_reservations.find(id); it != m_reservations.end()) {
        return it->second;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

const std::map<LoanId, Amount>& CollateralBalance::getReservations() const noexcept
{
    return m_reservations;
}

//-------------------------------------------------------------------------

bool CollateralBalance::canReserve(Amount amount) const noexcept
{
    return amount > 0 && amount <= m_free;
}

//-------------------------------------------------------------------------

bool CollateralBalance::operator==(const CollateralBalance& other) const noexcept
{
    return m_free == other.m_free
        && m_reserved == other.m_reserved
        && m_total == other.m_total
        && m_reservations == other.m_reservations;
}

//-------------------------------------------------------------------------

std::expected<void, ErrorCode> CollateralBalance::deposit(Amount amount)
{
    const auto free = checked::add(m_free, amount);
    const auto total = checked::add(m_total, amount);
    if (!free.has_value() || !total.has_value()) {
        return std::unexpected{ErrorCode::ARITHMETIC_OVERFLOW};
    }
    m_free = free.value();
    m_total = total.value();
    checkConsistency(std::source_location::current());
    return {};
}

//-------------------------------------------------------------------------

std::expected<void, ErrorCode> CollateralBalance::withdraw(Amount amount)
{
    if (amount > m_free) {
        return std::unexpected{ErrorCode::INSUFFICIENT_FUNDS};
    }
    const auto free = checked::sub(m_free, amount);
    const auto total = checked::sub(m_total, amount);
    if (!free.has_value() || !total.has_value()) {
        return std::unexpected{ErrorCode::ARITHMETIC_OVERFLOW};
    }
    m_free = free.value();
    m_total = total.value();
    checkConsistency(std::source_location::current());
    return {};
}

//-------------------------------------------------------------------------

std::expected<Amount, ErrorCode> CollateralBalance::makeReservation(LoanId id, Amount amount)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_reservations.contains(id)) {
        throw std::invalid_argument{fmt::format(
            "{}: Loan #{} already holds a reservation of {} | {}",
            ctx, id, m_reservations.at(id), *this)};
    }
    if (amount == 0) {
        return std::unexpected{ErrorCode::INVALID_AMOUNT};
    }
    if (!canReserve(amount)) {
        return std::unexpected{ErrorCode::INSUFFICIENT_COLLATERAL};
    }

    m_free -= amount;
    m_reserved += amount;
    m_reservations.insert({id, amount});

    checkConsistency(std::source_location::current());
    return amount;
}

//-------------------------------------------------------------------------

std::expected<Amount, ErrorCode> CollateralBalance::freeReservation(LoanId id)
{
    auto it = m_reservations.find(id);
    if (it == m_reservations.end()) {
        return std::unexpected{ErrorCode::LOAN_NOT_FOUND};
    }
    const Amount amount = it->second;
    const auto free = checked::add(m_free, amount);
    if (!free.has_value()) {
        return std::unexpected{ErrorCode::ARITHMETIC_OVERFLOW};
    }
    m_reservations.erase(it);
    m_free = free.value();
    m_reserved -= amount;

    checkConsistency(std::source_location::current());
    return amount;
}

//-------------------------------------------------------------------------

std::expected<Amount, ErrorCode> CollateralBalance::voidReservation(LoanId id)
{
    auto it = m_reservations.find(id);
    if (it == m_reservations.end()) {
        return std::unexpected{ErrorCode::LOAN_NOT_FOUND};
    }
    const Amount amount = it->second;
    m_reservations.erase(it);
    m_reserved -= amount;
    m_total -= amount;

    checkConsistency(std::source_location::current());
    return amount;
}

//-------------------------------------------------------------------------

void CollateralBalance::checkConsistency(std::source_location sl) const
{
    const auto sum = checked::add(m_free, m_reserved);
    if (!sum.has_value() || sum.value() != m_total) {
        throw std::runtime_error{fmt::format(
            "{}: Inconsistent collateral balance: total {} != free {} + reserved {}",
            sl.function_name(), m_total, m_free, m_reserved)};
    }
    if (const Amount reserved = ranges::accumulate(m_reservations | views::values, Amount{});
        reserved != m_reserved) {
        throw std::runtime_error{fmt::format(
            "{}: Total reservation {} does not match the sum of reservations {} | {}",
            sl.function_name(), m_reserved, reserved, *this)};
    }
}

//-------------------------------------------------------------------------

void CollateralBalance::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("free", rapidjson::Value{m_free}, allocator);
        json.AddMember("reserved", rapidjson::Value{m_reserved}, allocator);
        json.AddMember("total", rapidjson::Value{m_total}, allocator);
        json::serializeHelper(
            json,
            "reservations",
            [this](rapidjson::Document& json) {
                json.SetObject();
                auto& allocator = json.GetAllocator();
                for (const auto& [loanId, amount] : m_reservations) {
                    json.AddMember(
                        rapidjson::Value{std::to_string(loanId).c_str(), allocator},
                        rapidjson::Value{amount},
                        allocator);
                }
            });
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::ostream& operator<<(std::ostream& os, const CollateralBalance& bal) noexcept
{
    return os << fmt::format("{}", bal);
}

//-------------------------------------------------------------------------

}  // namespace colend::accounting

//-------------------------------------------------------------------------
