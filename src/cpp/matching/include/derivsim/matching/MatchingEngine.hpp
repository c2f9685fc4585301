/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/book/OrderBook.hpp"
#include "derivsim/matching/Trade.hpp"
#include "derivsim/util/DebugLogger.hpp"

//-------------------------------------------------------------------------

namespace derivsim::matching
{

//-------------------------------------------------------------------------

struct MatchResult
{
    std::vector<Trade> trades;
    // Resting orders removed by self-trade prevention, in the order encountered.
    std::vector<book::Order::Ptr> selfTradeCancellations;
    // Set when the remainder of a limit order was added to the book.
    book::Order::Ptr restingOrder;
    // Unfilled remainder of a market order, dropped.
    decimal_t discardedSize{};

    [[nodiscard]] decimal_t filledSize() const noexcept
    {
        decimal_t filled{};
        for (const auto& trade : trades) {
            filled += trade.size;
        }
        return filled;
    }
};

//-------------------------------------------------------------------------

class MatchingEngine : public util::DebugLogger
{
public:
    MatchingEngine() noexcept = default;

    [[nodiscard]] const TradeFactory& tradeFactory() const noexcept { return m_tradeFactory; }

    /**
     * Matches an incoming order against the opposite side of the book with
     * price-time priority. Resting orders owned by the incoming order's user
     * are cancelled instead of matched. Limit remainders rest on the book
     * with the given timestamp, market remainders are discarded.
     */
    [[nodiscard]] MatchResult match(
        book::Order::Ptr order, book::OrderBook& book, Timestamp timestamp);

    void reset() noexcept { m_tradeFactory = TradeFactory{}; }

private:
    void processAgainstTheAsks(
        book::Order::Ptr order, book::OrderBook& book, Timestamp timestamp, MatchResult& result);
    void processAgainstTheBids(
        book::Order::Ptr order, book::OrderBook& book, Timestamp timestamp, MatchResult& result);
    void processLevel(
        book::Order::Ptr order,
        book::OrderBook& book,
        book::TickContainer& level,
        Timestamp timestamp,
        MatchResult& result);

    TradeFactory m_tradeFactory;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::matching

//-------------------------------------------------------------------------
