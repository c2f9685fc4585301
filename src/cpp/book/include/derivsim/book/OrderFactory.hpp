/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/book/Order.hpp"

//-------------------------------------------------------------------------

namespace derivsim::book
{

class OrderFactory
{
public:
    OrderFactory() noexcept = default;

    [[nodiscard]] OrderId getCounterState() const noexcept { return m_idCounter; }

    [[nodiscard]] Order::Ptr makeMarketOrder(
        Timestamp timestamp,
        const UserId& userId,
        OrderSide side,
        decimal_t size,
        decimal_t leverage) const
    {
        return std::make_shared<Order>(
            m_idCounter++, timestamp, userId, side, OrderType::MARKET, size, decimal_t{}, leverage);
    }

    [[nodiscard]] Order::Ptr makeLimitOrder(
        Timestamp timestamp,
        const UserId& userId,
        OrderSide side,
        decimal_t size,
        decimal_t price,
        decimal_t leverage) const
    {
        return std::make_shared<Order>(
            m_idCounter++, timestamp, userId, side, OrderType::LIMIT, size, price, leverage);
    }

private:
    mutable OrderId m_idCounter{1};
};

}  // namespace derivsim::book

//-------------------------------------------------------------------------
