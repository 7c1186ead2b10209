/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/logging/EventLogger.hpp"

#include "colend/serialization/json_util.hpp"

#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace colend::logging
{

//-------------------------------------------------------------------------

EventLogger::EventLogger(const fs::path& filepath)
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "EventLogger", std::make_unique<spdlog::sinks::basic_file_sink_st>(m_filepath, true));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");
    m_logger->trace("time,signer,instruction,status,events");
    m_logger->flush();
}

//-------------------------------------------------------------------------

void EventLogger::log(
    const instruction::SignedInstruction& si,
    const instruction::InstructionProcessor::ExpectedEvents& outcome) const
{
    m_logger->trace(formatEntry(si, outcome));
    m_logger->flush();
}

//-------------------------------------------------------------------------

std::string EventLogger::formatEntry(
    const instruction::SignedInstruction& si,
    const instruction::InstructionProcessor::ExpectedEvents& outcome)
{
    rapidjson::Document json{rapidjson::kArrayType};
    if (outcome.has_value()) {
        auto& allocator = json.GetAllocator();
        for (const auto& event : outcome.value()) {
            rapidjson::Document eventJson{&allocator};
            event.jsonSerialize(eventJson);
            json.PushBack(eventJson, allocator);
        }
    }

    return fmt::format(
        "{},{},{},{},{}",
        si.timestamp,
        si.signer,
        instruction::InstructionKind2StrView(instruction::instructionKind(si.instruction)),
        outcome.has_value() ? std::string_view{"OK"} : ErrorCode2StrView(outcome.error()),
        json::json2str(json));
}

//-------------------------------------------------------------------------

}  // namespace colend::logging

//-------------------------------------------------------------------------
