/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/book/OrderContainer.hpp"
#include "derivsim/book/OrderFactory.hpp"

#include <map>

//-------------------------------------------------------------------------

namespace derivsim::matching
{
class MatchingEngine;
}  // namespace derivsim::matching

//-------------------------------------------------------------------------

namespace derivsim::book
{

//-------------------------------------------------------------------------

struct Level
{
    decimal_t price;
    decimal_t size;
    size_t orderCount;
};

struct BookSnapshot : public JsonSerializable
{
    std::optional<decimal_t> bestBid;
    std::optional<decimal_t> bestAsk;
    // Bids best-first (descending), asks best-first (ascending).
    std::vector<Level> bids;
    std::vector<Level> asks;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

class OrderBook
{
public:
    OrderBook() noexcept = default;

    OrderBook(const OrderBook&) = delete;
    OrderBook& operator=(const OrderBook&) = delete;

    [[nodiscard]] const OrderContainer& bids() const noexcept { return m_bids; }
    [[nodiscard]] const OrderContainer& asks() const noexcept { return m_asks; }
    [[nodiscard]] const OrderFactory& orderFactory() const noexcept { return m_orderFactory; }
    [[nodiscard]] size_t orderCount() const noexcept { return m_orderIdMap.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_orderIdMap.empty(); }

    [[nodiscard]] decimal_t bestBid() const noexcept;
    [[nodiscard]] decimal_t bestAsk() const noexcept;
    [[nodiscard]] decimal_t midPrice() const noexcept;

    void add(Order::Ptr order);
    bool remove(OrderId orderId);
    void clear() noexcept;

    [[nodiscard]] std::optional<Order::Ptr> getOrder(OrderId orderId) const;
    [[nodiscard]] std::vector<Order::Ptr> ordersOf(const UserId& userId) const;
    [[nodiscard]] std::map<UserId, std::vector<Order::Ptr>> ordersByUser() const;
    [[nodiscard]] BookSnapshot snapshot(size_t depth) const;

private:
    [[nodiscard]] OrderContainer& sideOf(OrderSide side) noexcept
    {
        return side == OrderSide::BUY ? m_bids : m_asks;
    }

    void registerOrder(Order::Ptr order);
    void unregisterOrder(OrderId orderId);

    OrderFactory m_orderFactory;
    OrderContainer m_bids;
    OrderContainer m_asks;
    std::map<OrderId, Order::Ptr> m_orderIdMap;

    friend class derivsim::matching::MatchingEngine;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::book

//-------------------------------------------------------------------------
