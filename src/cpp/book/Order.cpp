/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/book/Order.hpp"

//-------------------------------------------------------------------------

namespace derivsim::book
{

//-------------------------------------------------------------------------

Order::Order(
    OrderId id,
    Timestamp timestamp,
    UserId userId,
    OrderSide side,
    OrderType type,
    decimal_t size,
    decimal_t price,
    decimal_t leverage) noexcept
    : m_id{id},
      m_timestamp{timestamp},
      m_userId{std::move(userId)},
      m_side{side},
      m_type{type},
      m_size{size},
      m_originalSize{size},
      m_price{price},
      m_leverage{leverage}
{}

//-------------------------------------------------------------------------

void Order::removeSize(decimal_t decrease)
{
    if (decrease > m_size) {
        throw std::runtime_error(fmt::format(
            "{}: Size to be removed ({}) is greater than remaining size ({}) of order #{}",
            std::source_location::current().function_name(),
            decrease,
            m_size,
            m_id));
    }
    m_size -= decrease;
}

//-------------------------------------------------------------------------

void Order::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("orderId", rapidjson::Value{m_id}, allocator);
        json.AddMember("timestamp", rapidjson::Value{m_timestamp}, allocator);
        json.AddMember("userId", rapidjson::Value{m_userId.c_str(), allocator}, allocator);
        json.AddMember(
            "side", rapidjson::Value{OrderSide2StrView(m_side).data(), allocator}, allocator);
        json.AddMember(
            "type", rapidjson::Value{OrderType2StrView(m_type).data(), allocator}, allocator);
        json.AddMember("size", json::decimalValue(m_size), allocator);
        json.AddMember("filled", json::decimalValue(filledSize()), allocator);
        if (m_type == OrderType::LIMIT) {
            json.AddMember("price", json::decimalValue(m_price), allocator);
        } else {
            json.AddMember("price", rapidjson::Value{}, allocator);
        }
        json.AddMember("leverage", json::decimalValue(m_leverage), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace derivsim::book

//-------------------------------------------------------------------------
