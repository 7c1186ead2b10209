/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/lending/LoanLedger.hpp"

#include "colend/lending/CollateralSizer.hpp"
#include "colend/lending/LtvTable.hpp"
#include "colend/util/checked.hpp"

#include <algorithm>
#include <iterator>

//-------------------------------------------------------------------------

namespace colend::lending
{

//-------------------------------------------------------------------------

LoanLedger::LoanLedger(
    LedgerConfig config,
    const oracle::PriceOracle& oracle,
    transfer::AssetTransferGateway& gateway)
    : m_config{std::move(config)},
      m_oracle{oracle},
      m_gateway{gateway},
      m_repaymentProcessor{gateway, m_config.treasury}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_config.treasury.empty()) {
        throw std::invalid_argument{fmt::format("{}: Treasury account must be set", ctx)};
    }
    if (m_config.feed.empty()) {
        throw std::invalid_argument{fmt::format("{}: Price feed must be set", ctx)};
    }
}

//-------------------------------------------------------------------------

LoanLedger::Expected<LedgerEvents> LoanLedger::openPosition(const OperationContext& ctx)
{
    if (ctx.signer.empty()) {
        return std::unexpected{ErrorCode::UNAUTHORIZED};
    }
    if (m_registry.contains(ctx.signer)) {
        return std::unexpected{ErrorCode::POSITION_EXISTS};
    }
    m_registry.commit(accounting::UserPosition{ctx.signer});
    logDebug("[{}] position opened for {}", ctx.now, ctx.signer);
    return LedgerEvents{LedgerEvent{ctx.now, PositionOpened{.owner = ctx.signer}}};
}

//-------------------------------------------------------------------------

LoanLedger::Expected<BalanceChange> LoanLedger::deposit(const OperationContext& ctx, Amount amount)
{
    return transact(ctx.signer, [&](accounting::UserPosition& staged) {
        return depositInto(staged, ctx, amount);
    });
}

//-------------------------------------------------------------------------

LoanLedger::Expected<OriginationResult> LoanLedger::originate(
    const OperationContext& ctx, const OriginationRequest& request)
{
    return transact(ctx.signer, [&](accounting::UserPosition& staged) -> Expected<OriginationResult> {
        if (staged.owner() != ctx.signer) {
            return std::unexpected{ErrorCode::UNAUTHORIZED};
        }
        if (staged.atLoanLimit()) {
            return std::unexpected{ErrorCode::MAX_LOANS_REACHED};
        }
        const auto tier = findLtvTier(request.ltv);
        if (!tier.has_value()) {
            return std::unexpected{ErrorCode::INVALID_LTV};
        }
        if (request.debtAmount == 0) {
            return std::unexpected{ErrorCode::INVALID_AMOUNT};
        }

        OriginationResult result;

        if (request.collateralDeposit > 0) {
            auto deposited = depositInto(staged, ctx, request.collateralDeposit);
            if (!deposited.has_value()) {
                return std::unexpected{deposited.error()};
            }
            std::ranges::move(deposited->events, std::back_inserter(result.events));
        }

        const auto price = resolvePrice(ctx.now);
        if (!price.has_value()) {
            return std::unexpected{price.error()};
        }
        const auto collateral = requiredCollateral(request.debtAmount, tier->ltv, price.value());
        if (!collateral.has_value()) {
            return std::unexpected{collateral.error()};
        }
        if (collateral.value() == 0) {
            return std::unexpected{ErrorCode::INVALID_AMOUNT};
        }
        if (!staged.collateral().canReserve(collateral.value())) {
            logDebug(
                "[{}] {} needs {} collateral for {} at ltv {}, has {} free",
                ctx.now, ctx.signer, collateral.value(), request.debtAmount,
                tier->ltv, staged.collateral().getFree());
            return std::unexpected{ErrorCode::INSUFFICIENT_COLLATERAL};
        }

        if (auto moved = m_gateway.transfer({
                .asset = transfer::Asset::DEBT,
                .from = m_config.treasury,
                .to = ctx.signer,
                .amount = request.debtAmount
            });
            !moved.has_value()) {
            return std::unexpected{moved.error()};
        }

        const auto loanId = staged.openLoan({
            .principal = request.debtAmount,
            .apy = tier->apy,
            .ltv = tier->ltv,
            .collateral = collateral.value(),
            .startDate = ctx.now
        });
        if (!loanId.has_value()) {
            return std::unexpected{loanId.error()};
        }

        result.loanId = loanId.value();
        result.debtAmount = request.debtAmount;
        result.collateral = collateral.value();
        result.ltv = tier->ltv;
        result.apy = tier->apy;
        result.events.emplace_back(ctx.now, LoanCreated{
            .loanId = result.loanId,
            .borrower = ctx.signer,
            .debtAmount = result.debtAmount,
            .collateral = result.collateral,
            .ltv = result.ltv,
            .apy = result.apy
        });

        logDebug(
            "[{}] loan #{} of {} opened for {} against {} collateral (price {})",
            ctx.now, result.loanId, result.debtAmount, ctx.signer, result.collateral, price.value());
        return result;
    });
}

//-------------------------------------------------------------------------

LoanLedger::Expected<RepaymentResult> LoanLedger::repay(
    const OperationContext& ctx, const AccountId& owner, LoanId loanId, Amount amount)
{
    const AccountId& target = owner.empty() ? ctx.signer : owner;
    return transact(target, [&](accounting::UserPosition& staged) {
        auto result = m_repaymentProcessor.process(staged, ctx.signer, loanId, amount, ctx.now);
        if (result.has_value()) {
            logDebug(
                "[{}] loan #{} of {} {} with {} (interest {}, remaining {})",
                ctx.now, loanId, target, result->status, amount,
                result->interestPaid, result->remainingPrincipal);
        }
        return result;
    });
}

//-------------------------------------------------------------------------

LoanLedger::Expected<LiquidationResult> LoanLedger::liquidate(
    const OperationContext& ctx, const AccountId& owner, LoanId loanId)
{
    return transact(owner, [&](accounting::UserPosition& staged) -> Expected<LiquidationResult> {
        const accounting::Loan* loan = staged.findLoan(loanId);
        if (loan == nullptr) {
            return std::unexpected{ErrorCode::LOAN_NOT_FOUND};
        }

        const auto price = resolvePrice(ctx.now);
        if (!price.has_value()) {
            return std::unexpected{price.error()};
        }
        const auto assessment = assessLoan(*loan, ctx.now, price.value());
        if (!assessment.has_value()) {
            return std::unexpected{assessment.error()};
        }
        if (!assessment->underwater) {
            return std::unexpected{ErrorCode::LOAN_NOT_UNDERWATER};
        }

        LiquidationResult result{
            .loanId = loanId,
            .borrower = loan->borrower(),
            .debtRepaid = assessment->accrual.totalOwed,
            .collateralSeized = loan->collateral(),
            .collateralValue = assessment->collateralValue
        };

        if (auto moved = m_gateway.transfer({
                .asset = transfer::Asset::DEBT,
                .from = ctx.signer,
                .to = m_config.treasury,
                .amount = result.debtRepaid
            });
            !moved.has_value()) {
            return std::unexpected{moved.error()};
        }
        if (auto moved = m_gateway.transfer({
                .asset = transfer::Asset::COLLATERAL,
                .from = m_config.treasury,
                .to = ctx.signer,
                .amount = result.collateralSeized
            });
            !moved.has_value()) {
            return std::unexpected{moved.error()};
        }

        if (auto seized = staged.seizeLoan(loanId); !seized.has_value()) {
            return std::unexpected{seized.error()};
        }

        result.events.emplace_back(ctx.now, LoanLiquidated{
            .loanId = loanId,
            .borrower = result.borrower,
            .liquidator = ctx.signer,
            .debtRepaid = result.debtRepaid,
            .collateralSeized = result.collateralSeized,
            .collateralValue = result.collateralValue
        });

        logDebug(
            "[{}] loan #{} of {} liquidated by {}: owed {}, collateral worth {}",
            ctx.now, loanId, owner, ctx.signer, result.debtRepaid, result.collateralValue);
        return result;
    });
}

//-------------------------------------------------------------------------

LoanLedger::Expected<BalanceChange> LoanLedger::withdraw(const OperationContext& ctx, Amount amount)
{
    return transact(ctx.signer, [&](accounting::UserPosition& staged) -> Expected<BalanceChange> {
        if (amount == 0) {
            return std::unexpected{ErrorCode::INVALID_AMOUNT};
        }
        if (auto withdrawn = staged.collateral().withdraw(amount); !withdrawn.has_value()) {
            return std::unexpected{withdrawn.error()};
        }
        if (auto moved = m_gateway.transfer({
                .asset = transfer::Asset::COLLATERAL,
                .from = m_config.treasury,
                .to = ctx.signer,
                .amount = amount
            });
            !moved.has_value()) {
            return std::unexpected{moved.error()};
        }

        const Amount freeBalance = staged.collateral().getFree();
        return BalanceChange{
            .amount = amount,
            .freeBalance = freeBalance,
            .events = {LedgerEvent{ctx.now, CollateralWithdrawn{
                .owner = ctx.signer,
                .amount = amount,
                .freeBalance = freeBalance
            }}}
        };
    });
}

//-------------------------------------------------------------------------

LoanLedger::Expected<Accrual> LoanLedger::quote(
    const AccountId& owner, LoanId loanId, Timestamp now) const
{
    return findLoan(owner, loanId)
        .and_then([&](const accounting::Loan* loan) { return accrue(*loan, now); });
}

//-------------------------------------------------------------------------

LoanLedger::Expected<Assessment> LoanLedger::assess(
    const AccountId& owner, LoanId loanId, Timestamp now) const
{
    const auto loan = findLoan(owner, loanId);
    if (!loan.has_value()) {
        return std::unexpected{loan.error()};
    }
    return resolvePrice(now).and_then([&](uint64_t price) {
        return assessLoan(*loan.value(), now, price);
    });
}

//-------------------------------------------------------------------------

LoanLedger::Expected<bool> LoanLedger::isUnderwater(
    const AccountId& owner, LoanId loanId, Timestamp now) const
{
    return assess(owner, loanId, now)
        .transform([](const Assessment& assessment) { return assessment.underwater; });
}

//-------------------------------------------------------------------------

LoanLedger::Expected<uint64_t> LoanLedger::resolvePrice(Timestamp now) const
{
    const auto quote = m_oracle.getPrice(m_config.feed);
    if (!quote.has_value() || quote->price == 0 || quote->scale == 0) {
        return std::unexpected{ErrorCode::PRICE_UNAVAILABLE};
    }
    if (quote->publishTime > now) {
        logDebug("[{}] quote on {} published ahead of time: {}", now, m_config.feed, quote.value());
        return std::unexpected{ErrorCode::PRICE_UNAVAILABLE};
    }
    if (m_config.maxPriceAge > 0) {
        const auto age = checked::sub(now, quote->publishTime);
        if (!age.has_value() || age.value() > m_config.maxPriceAge) {
            logDebug("[{}] stale quote on {}: {}", now, m_config.feed, quote.value());
            return std::unexpected{ErrorCode::PRICE_UNAVAILABLE};
        }
    }

    if (quote->scale == kPriceScale) {
        return quote->price;
    }
    const auto price = checked::mul(quote->price, kPriceScale)
        .and_then([&](uint64_t v) { return checked::div(v, quote->scale); });
    if (price.has_value() && price.value() == 0) {
        return std::unexpected{ErrorCode::PRICE_UNAVAILABLE};
    }
    return price;
}

//-------------------------------------------------------------------------

void LoanLedger::restore(accounting::PositionRegistry registry) noexcept
{
    m_registry = std::move(registry);
}

//-------------------------------------------------------------------------

LoanLedger::Expected<const accounting::Loan*> LoanLedger::findLoan(
    const AccountId& owner, LoanId loanId) const
{
    const auto* position = m_registry.find(owner);
    if (position == nullptr) {
        return std::unexpected{ErrorCode::POSITION_NOT_FOUND};
    }
    const auto* loan = position->findLoan(loanId);
    if (loan == nullptr) {
        return std::unexpected{ErrorCode::LOAN_NOT_FOUND};
    }
    return loan;
}

//-------------------------------------------------------------------------

LoanLedger::Expected<BalanceChange> LoanLedger::depositInto(
    accounting::UserPosition& position, const OperationContext& ctx, Amount amount)
{
    if (amount == 0) {
        return std::unexpected{ErrorCode::INVALID_AMOUNT};
    }
    if (auto moved = m_gateway.transfer({
            .asset = transfer::Asset::COLLATERAL,
            .from = ctx.signer,
            .to = m_config.treasury,
            .amount = amount
        });
        !moved.has_value()) {
        return std::unexpected{moved.error()};
    }
    if (auto credited = position.collateral().deposit(amount); !credited.has_value()) {
        return std::unexpected{credited.error()};
    }

    const Amount freeBalance = position.collateral().getFree();
    logDebug("[{}] {} deposited {} {}, free {}",
        ctx.now, ctx.signer, amount, m_config.collateralSymbol, freeBalance);
    return BalanceChange{
        .amount = amount,
        .freeBalance = freeBalance,
        .events = {LedgerEvent{ctx.now, CollateralDeposited{
            .owner = ctx.signer,
            .amount = amount,
            .freeBalance = freeBalance
        }}}
    };
}

//-------------------------------------------------------------------------

}  // namespace colend::lending

//-------------------------------------------------------------------------
