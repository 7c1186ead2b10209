/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "colend/instruction/Instruction.hpp"

#include <limits>

//-------------------------------------------------------------------------

namespace colend::instruction
{

//-------------------------------------------------------------------------

InstructionKind instructionKind(const Instruction& instruction) noexcept
{
    return std::visit(
        [](const auto& ins) { return std::remove_cvref_t<decltype(ins)>::kind; }, instruction);
}

//-------------------------------------------------------------------------

SignedInstruction signedInstructionFromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const std::string_view name = node.name();

    auto requireAttribute = [&](const char* attr) {
        auto attribute = node.attribute(attr);
        if (attribute.empty()) {
            throw std::invalid_argument{fmt::format(
                "{}: <{}> requires attribute '{}'", ctx, name, attr)};
        }
        return attribute;
    };

    auto instruction = [&] -> Instruction {
        if (name == "InitializePosition") {
            return InitializePosition{};
        }
        if (name == "Deposit") {
            return Deposit{.amount = requireAttribute("amount").as_ullong()};
        }
        if (name == "Originate") {
            const auto ltv = requireAttribute("ltv").as_uint();
            if (ltv > std::numeric_limits<uint8_t>::max()) {
                throw std::invalid_argument{fmt::format(
                    "{}: 'ltv' {} is out of range", ctx, ltv)};
            }
            return Originate{
                .debtAmount = requireAttribute("debt").as_ullong(),
                .ltv = static_cast<uint8_t>(ltv),
                .collateralDeposit = node.attribute("collateralDeposit").as_ullong()
            };
        }
        if (name == "Repay") {
            return Repay{
                .owner = node.attribute("owner").as_string(),
                .loanId = requireAttribute("loanId").as_ullong(),
                .amount = requireAttribute("amount").as_ullong()
            };
        }
        if (name == "Liquidate") {
            return Liquidate{
                .owner = requireAttribute("owner").as_string(),
                .loanId = requireAttribute("loanId").as_ullong()
            };
        }
        if (name == "Withdraw") {
            return Withdraw{.amount = requireAttribute("amount").as_ullong()};
        }
        throw std::invalid_argument{fmt::format("{}: Unknown instruction <{}>", ctx, name)};
    }();

    std::string signer = requireAttribute("signer").as_string();
    if (signer.empty()) {
        throw std::invalid_argument{fmt::format("{}: <{}> has an empty signer", ctx, name)};
    }

    return {
        .signer = std::move(signer),
        .timestamp = requireAttribute("time").as_llong(),
        .instruction = std::move(instruction)
    };
}

//-------------------------------------------------------------------------

}  // namespace colend::instruction

//-------------------------------------------------------------------------
