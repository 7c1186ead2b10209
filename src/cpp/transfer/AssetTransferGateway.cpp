/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/transfer/AssetTransferGateway.hpp"

//-------------------------------------------------------------------------

namespace colend::transfer
{

//-------------------------------------------------------------------------

TransferScope::TransferScope(AssetTransferGateway& gateway)
    : m_gateway{gateway}
{
    m_gateway.begin();
}

//-------------------------------------------------------------------------

TransferScope::~TransferScope() noexcept
{
    if (!m_committed) {
        m_gateway.rollback();
    }
}

//-------------------------------------------------------------------------

void TransferScope::commit()
{
    m_gateway.commit();
    m_committed = true;
}

//-------------------------------------------------------------------------

}  // namespace colend::transfer

//-------------------------------------------------------------------------
