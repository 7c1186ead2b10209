/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/util/ErrorCode.hpp"
#include "colend/util/common.hpp"

#include <expected>

//-------------------------------------------------------------------------

namespace colend::transfer
{

//-------------------------------------------------------------------------

enum class Asset : uint8_t
{
    COLLATERAL,
    DEBT
};

struct TransferDesc
{
    Asset asset;
    AccountId from;
    AccountId to;
    Amount amount{};
};

//-------------------------------------------------------------------------

class AssetTransferGateway
{
public:
    using ExpectedTransfer = std::expected<void, ErrorCode>;

    virtual ~AssetTransferGateway() = default;

    // Moves a balance between two parties. Called at most once per logical
    // movement; failures are reported as TRANSFER_FAILED and leave no trace.
    [[nodiscard]] virtual ExpectedTransfer transfer(const TransferDesc& desc) = 0;

    // Unit of work spanning all transfers of one ledger operation.
    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() noexcept = 0;
    [[nodiscard]] virtual bool inTransaction() const noexcept = 0;

protected:
    AssetTransferGateway() = default;
};

//-------------------------------------------------------------------------

class TransferScope
{
public:
    explicit TransferScope(AssetTransferGateway& gateway);
    ~TransferScope() noexcept;

    TransferScope(const TransferScope&) = delete;
    TransferScope& operator=(const TransferScope&) = delete;

    void commit();

private:
    AssetTransferGateway& m_gateway;
    bool m_committed{};
};

//-------------------------------------------------------------------------

}  // namespace colend::transfer

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<colend::transfer::TransferDesc>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const colend::transfer::TransferDesc& desc, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{} {} : {} -> {}",
            desc.amount,
            magic_enum::enum_name(desc.asset),
            desc.from,
            desc.to);
    }
};

//-------------------------------------------------------------------------
