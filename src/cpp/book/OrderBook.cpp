/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/book/OrderBook.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace derivsim::book
{

//-------------------------------------------------------------------------

void BookSnapshot::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json::setOptionalMember(json, "bestBid", bestBid);
        json::setOptionalMember(json, "bestAsk", bestAsk);
        auto levelsJson = [&](const std::vector<Level>& levels) {
            rapidjson::Value levelsJson{rapidjson::kArrayType};
            for (const auto& level : levels) {
                rapidjson::Value levelJson{rapidjson::kObjectType};
                levelJson.AddMember("price", json::decimalValue(level.price), allocator);
                levelJson.AddMember("size", json::decimalValue(level.size), allocator);
                levelJson.AddMember(
                    "orders", rapidjson::Value{static_cast<uint64_t>(level.orderCount)}, allocator);
                levelsJson.PushBack(levelJson, allocator);
            }
            return levelsJson;
        };
        json.AddMember("bids", levelsJson(bids), allocator);
        json.AddMember("asks", levelsJson(asks), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

decimal_t OrderBook::bestBid() const noexcept
{
    if (m_bids.empty()) [[unlikely]] {
        return {};
    }
    return m_bids.back().price();
}

//-------------------------------------------------------------------------

decimal_t OrderBook::bestAsk() const noexcept
{
    if (m_asks.empty()) [[unlikely]] {
        return {};
    }
    return m_asks.front().price();
}

//-------------------------------------------------------------------------

decimal_t OrderBook::midPrice() const noexcept
{
    if (m_bids.empty() || m_asks.empty()) [[unlikely]] {
        return {};
    }
    return DEC(0.5) * (m_bids.back().price() + m_asks.front().price());
}

//-------------------------------------------------------------------------

void OrderBook::add(Order::Ptr order)
{
    if (order->type() != OrderType::LIMIT) {
        throw std::invalid_argument{fmt::format(
            "{}: Only limit orders can rest on the book, got order #{} of type {}",
            std::source_location::current().function_name(),
            order->id(),
            order->type())};
    }
    if (order->size() <= 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Order #{} has non-positive size {}",
            std::source_location::current().function_name(),
            order->id(),
            order->size())};
    }
    if (m_orderIdMap.contains(order->id())) {
        throw std::invalid_argument{fmt::format(
            "{}: Order #{} is already on the book",
            std::source_location::current().function_name(),
            order->id())};
    }

    auto& levels = sideOf(order->side());
    auto levelIt = std::lower_bound(levels.begin(), levels.end(), order->price());
    if (levelIt == levels.end() || levelIt->price() != order->price()) {
        levelIt = levels.insert(levelIt, TickContainer{&levels, order->price()});
    }
    registerOrder(order);
    levelIt->push_back(order);
}

//-------------------------------------------------------------------------

bool OrderBook::remove(OrderId orderId)
{
    auto it = m_orderIdMap.find(orderId);
    if (it == m_orderIdMap.end()) return false;

    auto order = it->second;
    auto& levels = sideOf(order->side());
    auto levelIt = std::lower_bound(levels.begin(), levels.end(), order->price());
    if (levelIt == levels.end() || levelIt->price() != order->price()) {
        throw std::logic_error{fmt::format(
            "{}: Order #{} is indexed but its level {} is missing",
            std::source_location::current().function_name(),
            orderId,
            order->price())};
    }

    std::erase_if(
        *levelIt, [orderId](const auto& orderOnLevel) { return orderOnLevel->id() == orderId; });
    levelIt->updateVolume(-order->size());
    if (levelIt->empty()) {
        levels.erase(levelIt);
    }
    unregisterOrder(orderId);

    return true;
}

//-------------------------------------------------------------------------

void OrderBook::clear() noexcept
{
    m_bids.reset();
    m_asks.reset();
    m_orderIdMap.clear();
}

//-------------------------------------------------------------------------

std::optional<Order::Ptr> OrderBook::getOrder(OrderId orderId) const
{
    auto it = m_orderIdMap.find(orderId);
    return it != m_orderIdMap.end() ? std::make_optional(it->second) : std::nullopt;
}

//-------------------------------------------------------------------------

std::vector<Order::Ptr> OrderBook::ordersOf(const UserId& userId) const
{
    return m_orderIdMap
        | views::values
        | views::filter([&](const auto& order) { return order->userId() == userId; })
        | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

std::map<UserId, std::vector<Order::Ptr>> OrderBook::ordersByUser() const
{
    std::map<UserId, std::vector<Order::Ptr>> orders;
    for (const auto& order : m_orderIdMap | views::values) {
        orders[order->userId()].push_back(order);
    }
    return orders;
}

//-------------------------------------------------------------------------

BookSnapshot OrderBook::snapshot(size_t depth) const
{
    BookSnapshot snapshot;
    if (!m_bids.empty()) snapshot.bestBid = bestBid();
    if (!m_asks.empty()) snapshot.bestAsk = bestAsk();

    auto toLevel = [](const TickContainer& level) {
        return Level{
            .price = level.price(),
            .size = level.volume(),
            .orderCount = level.size()
        };
    };
    for (const auto& level : m_bids | views::reverse | views::take(depth)) {
        snapshot.bids.push_back(toLevel(level));
    }
    for (const auto& level : m_asks | views::take(depth)) {
        snapshot.asks.push_back(toLevel(level));
    }

    return snapshot;
}

//-------------------------------------------------------------------------

void OrderBook::registerOrder(Order::Ptr order)
{
    m_orderIdMap[order->id()] = order;
}

//-------------------------------------------------------------------------

void OrderBook::unregisterOrder(OrderId orderId)
{
    m_orderIdMap.erase(orderId);
}

//-------------------------------------------------------------------------

}  // namespace derivsim::book

//-------------------------------------------------------------------------
