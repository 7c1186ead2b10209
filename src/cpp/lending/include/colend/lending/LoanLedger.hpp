/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/accounting/PositionRegistry.hpp"
#include "colend/lending/LedgerConfig.hpp"
#include "colend/lending/LedgerResults.hpp"
#include "colend/lending/LiquidationEvaluator.hpp"
#include "colend/lending/RepaymentProcessor.hpp"
#include "colend/oracle/PriceOracle.hpp"
#include "colend/transfer/AssetTransferGateway.hpp"

#include <expected>
#include <type_traits>

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

struct OperationContext
{
    AccountId signer;
    Timestamp now{};
};

struct OriginationRequest
{
    Amount debtAmount{};
    uint8_t ltv{};
    // Collateral moved in from the signer before sizing the loan.
    Amount collateralDeposit{};
};

//-------------------------------------------------------------------------

// Root of the lending state machine. Every mutating operation runs against a
// staged copy of the affected position inside a TransferScope and commits
// both together, so a failed operation leaves neither state nor balances behind.
class LoanLedger
{
public:
    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    LoanLedger(
        LedgerConfig config,
        const oracle::PriceOracle& oracle,
        transfer::AssetTransferGateway& gateway);

    [[nodiscard]] const LedgerConfig& config() const noexcept { return m_config; }
    [[nodiscard]] auto&& registry(this auto&& self) noexcept { return self.m_registry; }

    [[nodiscard]] Expected<LedgerEvents> openPosition(const OperationContext& ctx);
    [[nodiscard]] Expected<BalanceChange> deposit(const OperationContext& ctx, Amount amount);
    [[nodiscard]] Expected<OriginationResult> originate(
        const OperationContext& ctx, const OriginationRequest& request);
    [[nodiscard]] Expected<RepaymentResult> repay(
        const OperationContext& ctx, const AccountId& owner, LoanId loanId, Amount amount);
    [[nodiscard]] Expected<LiquidationResult> liquidate(
        const OperationContext& ctx, const AccountId& owner, LoanId loanId);
    [[nodiscard]] Expected<BalanceChange> withdraw(const OperationContext& ctx, Amount amount);

    [[nodiscard]] Expected<Accrual> quote(
        const AccountId& owner, LoanId loanId, Timestamp now) const;
    [[nodiscard]] Expected<Assessment> assess(
        const AccountId& owner, LoanId loanId, Timestamp now) const;
    [[nodiscard]] Expected<bool> isUnderwater(
        const AccountId& owner, LoanId loanId, Timestamp now) const;

    // Current collateral price on the kPriceScale, after staleness checks.
    [[nodiscard]] Expected<uint64_t> resolvePrice(Timestamp now) const;

    void restore(accounting::PositionRegistry registry) noexcept;

    template<typename... Args>
    void logDebug(fmt::format_string<Args...> fmt, Args&&... args) const noexcept
    {
        if (m_config.debug) {
            fmt::print("{}\n", fmt::format(fmt, std::forward<Args>(args)...));
        }
    }

private:
    template<typename F>
    auto transact(const AccountId& owner, F&& body)
        -> std::invoke_result_t<F&, accounting::UserPosition&>
    {
        const auto* current = m_registry.find(owner);
        if (current == nullptr) {
            return std::unexpected{ErrorCode::POSITION_NOT_FOUND};
        }
        accounting::UserPosition staged = *current;
        transfer::TransferScope scope{m_gateway};
        auto result = body(staged);
        if (result.has_value()) {
            scope.commit();
            m_registry.commit(std::move(staged));
        }
        return result;
    }

    [[nodiscard]] Expected<const accounting::Loan*> findLoan(
        const AccountId& owner, LoanId loanId) const;

    [[nodiscard]] Expected<BalanceChange> depositInto(
        accounting::UserPosition& position, const OperationContext& ctx, Amount amount);

    LedgerConfig m_config;
    const oracle::PriceOracle& m_oracle;
    transfer::AssetTransferGateway& m_gateway;
    RepaymentProcessor m_repaymentProcessor;
    accounting::PositionRegistry m_registry;
};

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------
