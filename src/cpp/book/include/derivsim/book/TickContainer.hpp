/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/book/Order.hpp"

#include <list>

//-------------------------------------------------------------------------

namespace derivsim::book
{

//-------------------------------------------------------------------------

class OrderContainer;

//-------------------------------------------------------------------------

// A single price level, orders in arrival order.
class TickContainer
    : public std::list<Order::Ptr>,
      public JsonSerializable
{
public:
    using ContainerType = std::list<value_type>;

    TickContainer(OrderContainer* orderContainer, decimal_t price) noexcept;

    [[nodiscard]] decimal_t price() const noexcept { return m_price; }
    [[nodiscard]] decimal_t volume() const noexcept { return m_volume; }

    void updateVolume(decimal_t deltaVolume) noexcept;

    bool operator<(const TickContainer& rhs) const noexcept { return m_price < rhs.price(); }
    bool operator<(decimal_t price) const noexcept { return m_price < price; }

    void push_back(const value_type& order);
    void pop_front();

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    OrderContainer* m_orderContainer;
    decimal_t m_price;
    decimal_t m_volume{};
};

//-------------------------------------------------------------------------

}  // namespace derivsim::book

//-------------------------------------------------------------------------
