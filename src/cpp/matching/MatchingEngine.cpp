/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/matching/MatchingEngine.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace derivsim::matching
{

//-------------------------------------------------------------------------

MatchResult MatchingEngine::match(
    book::Order::Ptr order, book::OrderBook& book, Timestamp timestamp)
{
    if (order->size() <= 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Order #{} has non-positive size {}",
            std::source_location::current().function_name(),
            order->id(),
            order->size())};
    }

    MatchResult result;

    if (order->side() == OrderSide::BUY) {
        processAgainstTheAsks(order, book, timestamp, result);
    } else {
        processAgainstTheBids(order, book, timestamp, result);
    }

    if (order->size() > 0_dec) {
        if (order->isMarket()) {
            result.discardedSize = order->size();
            logDebug(
                "{} | USER {} : DISCARDED {} UNFILLED OF MARKET ORDER #{}",
                timestamp, order->userId(), order->size(), order->id());
        } else {
            order->setTimestamp(timestamp);
            book.add(order);
            result.restingOrder = order;
            logDebug(
                "{} | USER {} : RESTING {} ORDER #{} FOR {}@{}",
                timestamp, order->userId(), order->side(), order->id(), order->size(), order->price());
        }
    }

    return result;
}

//-------------------------------------------------------------------------

void MatchingEngine::processAgainstTheAsks(
    book::Order::Ptr order, book::OrderBook& book, Timestamp timestamp, MatchResult& result)
{
    auto& asks = book.m_asks;

    while (order->size() > 0_dec && !asks.empty()) {
        auto& bestAskLevel = asks.front();
        if (!order->isMarket() && bestAskLevel.price() > order->price()) break;
        processLevel(order, book, bestAskLevel, timestamp, result);
        if (bestAskLevel.empty()) {
            asks.pop_front();
        }
    }
}

//-------------------------------------------------------------------------

void MatchingEngine::processAgainstTheBids(
    book::Order::Ptr order, book::OrderBook& book, Timestamp timestamp, MatchResult& result)
{
    auto& bids = book.m_bids;

    while (order->size() > 0_dec && !bids.empty()) {
        auto& bestBidLevel = bids.back();
        if (!order->isMarket() && bestBidLevel.price() < order->price()) break;
        processLevel(order, book, bestBidLevel, timestamp, result);
        if (bestBidLevel.empty()) {
            bids.pop_back();
        }
    }
}

//-------------------------------------------------------------------------

void MatchingEngine::processLevel(
    book::Order::Ptr order,
    book::OrderBook& book,
    book::TickContainer& level,
    Timestamp timestamp,
    MatchResult& result)
{
    while (order->size() > 0_dec && !level.empty()) {
        book::Order::Ptr iop = level.front();

        if (iop->userId() == order->userId()) {
            level.pop_front();
            level.updateVolume(-iop->size());
            book.unregisterOrder(iop->id());
            result.selfTradeCancellations.push_back(iop);
            logDebug(
                "{} | USER {} : SELF TRADE PREVENTION CANCELED ORDER #{} ({}@{})",
                timestamp, iop->userId(), iop->id(), iop->size(), iop->price());
            continue;
        }

        const decimal_t matchSize = std::min(order->size(), iop->size());
        const bool isBuy = order->side() == OrderSide::BUY;
        const auto& buyOrder = isBuy ? order : iop;
        const auto& sellOrder = isBuy ? iop : order;

        result.trades.push_back(m_tradeFactory.makeRecord(
            timestamp,
            order->side(),
            buyOrder->id(),
            sellOrder->id(),
            buyOrder->userId(),
            sellOrder->userId(),
            buyOrder->leverage(),
            sellOrder->leverage(),
            level.price(),
            matchSize));

        order->removeSize(matchSize);
        iop->removeSize(matchSize);
        level.updateVolume(-matchSize);

        logDebug(
            "{} | TRADE #{} : {} BUYS {} FROM {} @ {}",
            timestamp, result.trades.back().id, buyOrder->userId(), matchSize,
            sellOrder->userId(), level.price());

        if (iop->size() == 0_dec) {
            level.pop_front();
            book.unregisterOrder(iop->id());
        }
    }
}

//-------------------------------------------------------------------------

}  // namespace derivsim::matching

//-------------------------------------------------------------------------
