/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/position/Position.hpp"

#include "derivsim/margin/MarginCalculator.hpp"

//-------------------------------------------------------------------------

namespace derivsim::position
{

//-------------------------------------------------------------------------

Position::Position(
    UserId userId,
    PositionSide side,
    decimal_t size,
    decimal_t entryPrice,
    decimal_t leverage,
    decimal_t margin,
    Timestamp openedAt)
    : m_userId{std::move(userId)},
      m_side{side},
      m_size{size},
      m_avgEntryPrice{entryPrice},
      m_leverage{leverage},
      m_margin{margin},
      m_openedAt{openedAt}
{
    static constexpr auto ctx = std::source_location::current().function_name();
    if (!(size > 0_dec)) {
        throw std::invalid_argument{fmt::format(
            "{}: Position of '{}' must have positive size, was {}", ctx, m_userId, size)};
    }
    if (!(entryPrice > 0_dec)) {
        throw std::invalid_argument{fmt::format(
            "{}: Position of '{}' must have positive entry price, was {}",
            ctx, m_userId, entryPrice)};
    }
    if (!(leverage > 0_dec)) {
        throw std::invalid_argument{fmt::format(
            "{}: Position of '{}' must have positive leverage, was {}", ctx, m_userId, leverage)};
    }
}

//-------------------------------------------------------------------------

decimal_t Position::liquidationPrice() const
{
    return margin::liquidationPrice(m_side, m_avgEntryPrice, m_leverage);
}

//-------------------------------------------------------------------------

decimal_t Position::bankruptcyPrice() const
{
    return margin::bankruptcyPrice(m_side, m_avgEntryPrice, m_leverage);
}

//-------------------------------------------------------------------------

decimal_t Position::unrealizedPnL(decimal_t markPrice) const noexcept
{
    return margin::unrealizedPnL(m_side, m_size, m_avgEntryPrice, markPrice);
}

//-------------------------------------------------------------------------

decimal_t Position::positionValue(decimal_t markPrice) const noexcept
{
    return margin::positionValue(m_size, markPrice);
}

//-------------------------------------------------------------------------

decimal_t Position::maintenanceMargin(decimal_t markPrice) const noexcept
{
    return margin::maintenanceMargin(m_size, markPrice);
}

//-------------------------------------------------------------------------

bool Position::shouldLiquidate(decimal_t markPrice) const
{
    return margin::shouldLiquidate(m_side, liquidationPrice(), markPrice);
}

//-------------------------------------------------------------------------

void Position::increase(decimal_t size, decimal_t price, decimal_t margin)
{
    if (!(size > 0_dec) || !(price > 0_dec)) {
        throw std::invalid_argument{fmt::format(
            "{}: Invalid increase {}@{} of position of '{}'",
            std::source_location::current().function_name(),
            size,
            price,
            m_userId)};
    }
    const decimal_t newSize = m_size + size;
    m_avgEntryPrice = (m_size * m_avgEntryPrice + size * price) / newSize;
    m_size = newSize;
    m_margin += margin;
    ++m_fillCount;
}

//-------------------------------------------------------------------------

decimal_t Position::reduce(decimal_t size)
{
    if (!(size > 0_dec) || size > m_size) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot reduce position of '{}' of size {} by {}",
            std::source_location::current().function_name(),
            m_userId,
            m_size,
            size)};
    }
    const decimal_t released = size == m_size ? m_margin : m_margin * size / m_size;
    m_size -= size;
    m_margin -= released;
    ++m_fillCount;
    return released;
}

//-------------------------------------------------------------------------

void Position::jsonSerialize(
    rapidjson::Document& json, decimal_t markPrice, const std::string& key) const
{
    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("userId", rapidjson::Value{m_userId.c_str(), allocator}, allocator);
        json.AddMember(
            "side", rapidjson::Value{PositionSide2StrView(m_side).data(), allocator}, allocator);
        json.AddMember("size", json::decimalValue(m_size), allocator);
        json.AddMember("entryPrice", json::decimalValue(m_avgEntryPrice), allocator);
        json.AddMember("leverage", json::decimalValue(m_leverage), allocator);
        json.AddMember("margin", json::decimalValue(m_margin), allocator);
        json.AddMember("liquidationPrice", json::decimalValue(liquidationPrice()), allocator);
        json.AddMember("bankruptcyPrice", json::decimalValue(bankruptcyPrice()), allocator);
        json.AddMember("unrealizedPnL", json::decimalValue(unrealizedPnL(markPrice)), allocator);
        json.AddMember("positionValue", json::decimalValue(positionValue(markPrice)), allocator);
        json.AddMember(
            "maintenanceMargin", json::decimalValue(maintenanceMargin(markPrice)), allocator);
        json.AddMember("openedAt", rapidjson::Value{m_openedAt}, allocator);
        json.AddMember("fills", rapidjson::Value{m_fillCount}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace derivsim::position

//-------------------------------------------------------------------------
