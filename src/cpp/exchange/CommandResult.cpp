/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/exchange/CommandResult.hpp"

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

CommandResult::CommandResult(bool success, std::string_view type)
    : success{success}, type{type}
{
    data.SetObject();
}

//-------------------------------------------------------------------------

CommandResult CommandResult::failure(std::string_view type, std::string error)
{
    CommandResult result{false, type};
    result.error = std::move(error);
    return result;
}

//-------------------------------------------------------------------------

void CommandResult::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("success", rapidjson::Value{success}, allocator);
        json.AddMember("type", rapidjson::Value{type.c_str(), allocator}, allocator);
        json::setOptionalMember(json, "error", error);
        json.AddMember("data", rapidjson::Value{data, allocator}, allocator);
        if (!state.IsNull()) {
            json.AddMember("state", rapidjson::Value{state, allocator}, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
