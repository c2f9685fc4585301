/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/book/OrderBook.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace derivsim;
using namespace derivsim::book;
using namespace derivsim::literals;
using namespace testing;

//-------------------------------------------------------------------------

struct OrderBookTest : Test
{
    Order::Ptr place(const UserId& userId, OrderSide side, decimal_t size, decimal_t price)
    {
        auto order = book.orderFactory().makeLimitOrder(++timestamp, userId, side, size, price, 10_dec);
        book.add(order);
        return order;
    }

    OrderBook book;
    Timestamp timestamp{};
};

//-------------------------------------------------------------------------

TEST_F(OrderBookTest, EmptyBook)
{
    EXPECT_TRUE(book.empty());
    EXPECT_EQ(book.bestBid(), 0_dec);
    EXPECT_EQ(book.bestAsk(), 0_dec);

    const auto snapshot = book.snapshot(10);
    EXPECT_FALSE(snapshot.bestBid.has_value());
    EXPECT_FALSE(snapshot.bestAsk.has_value());
    EXPECT_THAT(snapshot.bids, IsEmpty());
    EXPECT_THAT(snapshot.asks, IsEmpty());
}

//-------------------------------------------------------------------------

TEST_F(OrderBookTest, BestPricesAndLevels)
{
    place("bob", OrderSide::BUY, 1_dec, 49'900_dec);
    place("bob", OrderSide::BUY, 2_dec, 49'950_dec);
    place("eve", OrderSide::BUY, DEC(0.5), 49'950_dec);
    place("alice", OrderSide::SELL, 1_dec, 50'100_dec);
    place("alice", OrderSide::SELL, 3_dec, 50'050_dec);

    EXPECT_EQ(book.bestBid(), 49'950_dec);
    EXPECT_EQ(book.bestAsk(), 50'050_dec);
    EXPECT_EQ(book.midPrice(), 50'000_dec);
    EXPECT_EQ(book.orderCount(), 5);

    const auto snapshot = book.snapshot(10);
    ASSERT_EQ(snapshot.bids.size(), 2);
    EXPECT_EQ(snapshot.bids[0].price, 49'950_dec);
    EXPECT_EQ(snapshot.bids[0].size, DEC(2.5));
    EXPECT_EQ(snapshot.bids[0].orderCount, 2);
    EXPECT_EQ(snapshot.bids[1].price, 49'900_dec);
    ASSERT_EQ(snapshot.asks.size(), 2);
    EXPECT_EQ(snapshot.asks[0].price, 50'050_dec);
    EXPECT_EQ(snapshot.asks[1].price, 50'100_dec);
}

//-------------------------------------------------------------------------

TEST_F(OrderBookTest, SnapshotDepthLimited)
{
    for (uint32_t i = 0; i < 5; ++i) {
        place("bob", OrderSide::BUY, 1_dec, decimal_t{49'000 + i * 10});
    }

    const auto snapshot = book.snapshot(3);
    ASSERT_EQ(snapshot.bids.size(), 3);
    EXPECT_EQ(snapshot.bids.front().price, 49'040_dec);
    EXPECT_EQ(snapshot.bids.back().price, 49'020_dec);
}

//-------------------------------------------------------------------------

TEST_F(OrderBookTest, RemoveOrder)
{
    const auto first = place("bob", OrderSide::SELL, 1_dec, 50'000_dec);
    const auto second = place("eve", OrderSide::SELL, 2_dec, 50'000_dec);

    EXPECT_TRUE(book.remove(first->id()));
    EXPECT_FALSE(book.remove(first->id()));
    EXPECT_FALSE(book.getOrder(first->id()).has_value());
    ASSERT_TRUE(book.getOrder(second->id()).has_value());

    const auto snapshot = book.snapshot(10);
    ASSERT_EQ(snapshot.asks.size(), 1);
    EXPECT_EQ(snapshot.asks[0].size, 2_dec);

    EXPECT_TRUE(book.remove(second->id()));
    EXPECT_TRUE(book.empty());
    EXPECT_THAT(book.snapshot(10).asks, IsEmpty());
}

//-------------------------------------------------------------------------

TEST_F(OrderBookTest, OrdersByUser)
{
    place("bob", OrderSide::BUY, 1_dec, 49'900_dec);
    place("eve", OrderSide::SELL, 1_dec, 50'100_dec);
    place("bob", OrderSide::SELL, 1_dec, 50'200_dec);

    EXPECT_EQ(book.ordersOf("bob").size(), 2);
    EXPECT_EQ(book.ordersOf("eve").size(), 1);
    EXPECT_THAT(book.ordersOf("alice"), IsEmpty());

    const auto byUser = book.ordersByUser();
    EXPECT_EQ(byUser.size(), 2);
    EXPECT_EQ(byUser.at("bob").size(), 2);
}

//-------------------------------------------------------------------------

TEST_F(OrderBookTest, RejectsInvalidOrders)
{
    auto market = book.orderFactory().makeMarketOrder(1, "bob", OrderSide::BUY, 1_dec, 10_dec);
    EXPECT_THROW(book.add(market), std::invalid_argument);

    const auto order = place("bob", OrderSide::BUY, 1_dec, 49'900_dec);
    EXPECT_THROW(book.add(order), std::invalid_argument);
}

//-------------------------------------------------------------------------
