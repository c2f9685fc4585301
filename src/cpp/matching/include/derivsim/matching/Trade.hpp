/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/serialization/JsonSerializable.hpp"
#include "derivsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace derivsim::matching
{

//-------------------------------------------------------------------------

struct Trade : public JsonSerializable
{
    TradeId id;
    Timestamp timestamp;
    OrderSide aggressorSide;
    OrderId buyOrderId;
    OrderId sellOrderId;
    UserId buyUserId;
    UserId sellUserId;
    decimal_t buyLeverage;
    decimal_t sellLeverage;
    decimal_t price;
    decimal_t size;

    Trade() noexcept = default;

    Trade(
        TradeId id,
        Timestamp timestamp,
        OrderSide aggressorSide,
        OrderId buyOrderId,
        OrderId sellOrderId,
        UserId buyUserId,
        UserId sellUserId,
        decimal_t buyLeverage,
        decimal_t sellLeverage,
        decimal_t price,
        decimal_t size) noexcept
        : id{id},
          timestamp{timestamp},
          aggressorSide{aggressorSide},
          buyOrderId{buyOrderId},
          sellOrderId{sellOrderId},
          buyUserId{std::move(buyUserId)},
          sellUserId{std::move(sellUserId)},
          buyLeverage{buyLeverage},
          sellLeverage{sellLeverage},
          price{price},
          size{size}
    {}

    [[nodiscard]] decimal_t value() const noexcept { return price * size; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

class TradeFactory
{
public:
    TradeFactory() noexcept = default;

    template<typename... Args>
    requires std::constructible_from<Trade, TradeId, Args...>
    [[nodiscard]] Trade makeRecord(Args&&... args) const noexcept
    {
        return Trade{m_idCounter++, std::forward<Args>(args)...};
    }

    [[nodiscard]] TradeId getCounterState() const noexcept { return m_idCounter; }

private:
    mutable TradeId m_idCounter{1};
};

//-------------------------------------------------------------------------

}  // namespace derivsim::matching

//-------------------------------------------------------------------------
