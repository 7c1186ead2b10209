/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <rapidjson/document.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

namespace colend::json
{

//-------------------------------------------------------------------------

struct IndentOptions
{
    char indentChar = ' ';
    uint8_t indentCharCount = 4;
};

struct FormatOptions
{
    std::optional<IndentOptions> indent = {};
};

[[nodiscard]] std::string json2str(
    const rapidjson::Value& json, const FormatOptions& formatOptions = {});

[[nodiscard]] rapidjson::Document str2json(const std::string& str);

void dumpJson(
    const rapidjson::Value& json,
    std::ofstream& ofs,
    const FormatOptions& formatOptions = {});

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

//-------------------------------------------------------------------------

}  // namespace colend::json

//-------------------------------------------------------------------------
