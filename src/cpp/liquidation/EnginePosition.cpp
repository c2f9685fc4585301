/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/liquidation/EnginePosition.hpp"

//-------------------------------------------------------------------------

namespace derivsim::liquidation
{

//-------------------------------------------------------------------------

void EnginePosition::jsonSerialize(
    rapidjson::Document& json, decimal_t markPrice, const std::string& key) const
{
    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{id}, allocator);
        json.AddMember(
            "originalUserId", rapidjson::Value{originalUserId.c_str(), allocator}, allocator);
        json.AddMember(
            "side", rapidjson::Value{PositionSide2StrView(side).data(), allocator}, allocator);
        json.AddMember("size", json::decimalValue(size), allocator);
        json.AddMember("originalSize", json::decimalValue(originalSize), allocator);
        json.AddMember("entryPrice", json::decimalValue(entryPrice), allocator);
        json.AddMember("bankruptcyPrice", json::decimalValue(bankruptcyPrice), allocator);
        json.AddMember("leverage", json::decimalValue(leverage), allocator);
        json.AddMember("transferMarkPrice", json::decimalValue(transferMarkPrice), allocator);
        json.AddMember("transferredAt", rapidjson::Value{transferredAt}, allocator);
        json.AddMember(
            "status",
            rapidjson::Value{EnginePositionStatus2StrView(status).data(), allocator},
            allocator);
        json.AddMember("unrealizedPnL", json::decimalValue(unrealizedPnL(markPrice)), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace derivsim::liquidation

//-------------------------------------------------------------------------
