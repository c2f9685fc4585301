/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/matching/Trade.hpp"

//-------------------------------------------------------------------------

namespace derivsim::matching
{

//-------------------------------------------------------------------------

void Trade::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("tradeId", rapidjson::Value{id}, allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
        json.AddMember(
            "aggressorSide",
            rapidjson::Value{OrderSide2StrView(aggressorSide).data(), allocator},
            allocator);
        json.AddMember("buyOrderId", rapidjson::Value{buyOrderId}, allocator);
        json.AddMember("sellOrderId", rapidjson::Value{sellOrderId}, allocator);
        json.AddMember("buyUserId", rapidjson::Value{buyUserId.c_str(), allocator}, allocator);
        json.AddMember("sellUserId", rapidjson::Value{sellUserId.c_str(), allocator}, allocator);
        json.AddMember("price", json::decimalValue(price), allocator);
        json.AddMember("size", json::decimalValue(size), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace derivsim::matching

//-------------------------------------------------------------------------
