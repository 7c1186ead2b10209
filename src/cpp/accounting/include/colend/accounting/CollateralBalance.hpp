/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/serialization/JsonSerializable.hpp"
#include "colend/util/ErrorCode.hpp"
#include "colend/util/common.hpp"

#include <expected>
#include <iosfwd>

//-------------------------------------------------------------------------

namespace colend::accounting
{

//-------------------------------------------------------------------------

// Collateral-asset units held by the ledger for one user. The total is split
// into a free part and a part reserved against open loans, keyed by loan id.
class CollateralBalance : public JsonSerializable
{
public:
    explicit CollateralBalance(Amount total = {}) noexcept;

    [[nodiscard]] Amount getFree() const noexcept { return m_free; }
    [[nodiscard]] Amount getTotal() const noexcept { return m_total; }
    [[nodiscard]] Amount getReserved() const noexcept { return m_reserved; }
    [[nodiscard]] std::optional<Amount> getReservation(LoanId id) const noexcept;
    [[nodiscard]] const std::map<LoanId, Amount>& getReservations() const noexcept;

    [[nodiscard]] bool canReserve(Amount amount) const noexcept;

    [[nodiscard]] bool operator==(const CollateralBalance& other) const noexcept;

    [[nodiscard]] std::expected<void, ErrorCode> deposit(Amount amount);
    [[nodiscard]] std::expected<void, ErrorCode> withdraw(Amount amount);

    [[nodiscard]] std::expected<Amount, ErrorCode> makeReservation(LoanId id, Amount amount);
    // Returns the reservation to the free balance.
    [[nodiscard]] std::expected<Amount, ErrorCode> freeReservation(LoanId id);
    // Removes the reservation from the balance altogether (seized collateral).
    [[nodiscard]] std::expected<Amount, ErrorCode> voidReservation(LoanId id);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    friend std::ostream& operator<<(std::ostream& os, const CollateralBalance& bal) noexcept;

private:
    void checkConsistency(std::source_location sl) const;

    Amount m_free{};
    Amount m_reserved{};
    Amount m_total{};
    std::map<LoanId, Amount> m_reservations;
};

//-------------------------------------------------------------------------

}  // namespace colend::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<colend::accounting::CollateralBalance>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const colend::accounting::CollateralBalance& bal, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{} ({} | {})",
            bal.getTotal(),
            bal.getFree(),
            bal.getReserved());
    }
};

//-------------------------------------------------------------------------
