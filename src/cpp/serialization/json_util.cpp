/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/serialization/json_util.hpp"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <charconv>
#include <source_location>
#include <string_view>

//-------------------------------------------------------------------------

namespace derivsim::json
{

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    const auto& [indent, decimals] = formatOptions;
    rapidjson::StringBuffer buffer;
    if (indent.has_value()) {
        const auto& opts = indent.value();
        rapidjson::PrettyWriter writer{buffer};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        writer.SetMaxDecimalPlaces(decimals);
        json.Accept(writer);
    } else {
        rapidjson::Writer writer{buffer};
        writer.SetMaxDecimalPlaces(decimals);
        json.Accept(writer);
    }
    return buffer.GetString();
}

//-------------------------------------------------------------------------

rapidjson::Document str2json(const std::string& str)
{
    rapidjson::Document json;
    if (json.Parse<rapidjson::kParseNumbersAsStringsFlag>(str.c_str()).HasParseError()) {
        static constexpr size_t maxCharsShown = 200uz;
        std::string_view facade{str.data(), std::min(maxCharsShown, str.size())};
        throw std::invalid_argument{fmt::format(
            "{}: Error parsing Json string: {}{}",
            std::source_location::current().function_name(),
            facade,
            facade.size() < str.size() ? "..." : "")};
    }
    return json;
}

//-------------------------------------------------------------------------

decimal_t getDecimal(const rapidjson::Value& json)
{
    if (json.IsString()) [[likely]] {
        return util::parseDecimal(json.GetString());
    } else if (json.IsInt64()) {
        return decimal_t{json.GetInt64()};
    } else if (json.IsDouble()) [[unlikely]] {
        return util::double2decimal(json.GetDouble());
    } else {
        throw std::invalid_argument{fmt::format(
            "{}: Ill-formed Json value to form a decimal with: {}",
            std::source_location::current().function_name(),
            json2str(json))};
    }
}

//-------------------------------------------------------------------------

uint64_t getUint(const rapidjson::Value& json)
{
    if (json.IsString()) [[likely]] {
        const std::string_view str{json.GetString(), json.GetStringLength()};
        uint64_t val{};
        const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), val);
        if (ec == std::errc{} && ptr == str.data() + str.size() && !str.empty()) {
            return val;
        }
    } else if (json.IsUint64()) {
        return json.GetUint64();
    }
    throw std::invalid_argument{fmt::format(
        "{}: Ill-formed Json value to form an unsigned integer with: {}",
        std::source_location::current().function_name(),
        json2str(json))};
}

//-------------------------------------------------------------------------

rapidjson::Value decimalValue(decimal_t val)
{
    if (!util::isFinite(val)) {
        return rapidjson::Value{};
    }
    return rapidjson::Value{util::decimal2double(val)};
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

}  // namespace derivsim::json

//-------------------------------------------------------------------------
