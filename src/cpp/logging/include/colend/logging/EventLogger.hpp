/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "colend/instruction/InstructionProcessor.hpp"
#include "colend/util/common.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace colend::logging
{

//-------------------------------------------------------------------------

// One CSV line per processed instruction:
//   time,signer,instruction,status,events
// where status is OK or the error code and events is a JSON array.
class EventLogger
{
public:
    explicit EventLogger(const fs::path& filepath);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    void log(
        const instruction::SignedInstruction& si,
        const instruction::InstructionProcessor::ExpectedEvents& outcome) const;

    [[nodiscard]] static std::string formatEntry(
        const instruction::SignedInstruction& si,
        const instruction::InstructionProcessor::ExpectedEvents& outcome);

private:
    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
};

//-------------------------------------------------------------------------

}  // namespace colend::logging

//-------------------------------------------------------------------------
