/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/exchange/OrderPlacementValidator.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace derivsim;
using namespace derivsim::exchange;
using namespace derivsim::literals;
using namespace testing;

//-------------------------------------------------------------------------

struct OrderPlacementValidatorTest : Test
{
    void SetUp() override
    {
        users.emplace("bob", position::User{"bob", "Bob", 100'000_dec, 10_dec});
        users.emplace("eve", position::User{"eve", "Eve", 10'000_dec, 10_dec});
    }

    OrderPlacementValidator::ExpectedResult validate(const PlaceOrder& order) const
    {
        return validator.validate(order, users, ledger, book);
    }

    static PlaceOrder limit(const UserId& userId, OrderSide side, decimal_t size, decimal_t price)
    {
        return PlaceOrder{.userId = userId, .side = side, .size = size, .price = price};
    }

    void rest(const UserId& userId, OrderSide side, decimal_t size, decimal_t price)
    {
        book.add(book.orderFactory().makeLimitOrder(1, userId, side, size, price, 10_dec));
    }

    position::UserMap users;
    position::PositionLedger ledger;
    book::OrderBook book;
    OrderPlacementValidator validator{RiskLimits{}};
};

//-------------------------------------------------------------------------

TEST_F(OrderPlacementValidatorTest, AcceptsLimitOrder)
{
    const auto result = validate(limit("bob", OrderSide::BUY, 1_dec, 50'000_dec));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->leverage, 10_dec);
    EXPECT_EQ(result->referencePrice, 50'000_dec);
    EXPECT_EQ(result->openingSize, 1_dec);
    EXPECT_EQ(result->requiredMargin, 5'000_dec);
}

//-------------------------------------------------------------------------

struct RejectionParams
{
    PlaceOrder order;
    OrderErrorCode expected;
};

void PrintTo(const RejectionParams& params, std::ostream* os)
{
    *os << fmt::format("{{.userId = {}, .expected = {}}}", params.order.userId, params.expected);
}

struct OrderRejectionTest
    : OrderPlacementValidatorTest, WithParamInterface<RejectionParams>
{};

INSTANTIATE_TEST_SUITE_P(
    OrderPlacementValidatorTest,
    OrderRejectionTest,
    Values(
        RejectionParams{
            PlaceOrder{.userId = "mallory", .side = OrderSide::BUY, .size = 1_dec, .price = 50'000_dec},
            OrderErrorCode::UNKNOWN_USER},
        RejectionParams{
            PlaceOrder{.userId = "bob", .side = OrderSide::BUY, .size = 0_dec, .price = 50'000_dec},
            OrderErrorCode::INVALID_SIZE},
        RejectionParams{
            PlaceOrder{.userId = "bob", .side = OrderSide::BUY, .size = DEC(0.0001), .price = 50'000_dec},
            OrderErrorCode::MIN_ORDER_SIZE},
        RejectionParams{
            PlaceOrder{.userId = "bob", .side = OrderSide::BUY, .size = 1_dec},
            OrderErrorCode::INVALID_PRICE},
        RejectionParams{
            PlaceOrder{.userId = "bob", .side = OrderSide::BUY, .size = 1_dec, .price = -1_dec},
            OrderErrorCode::INVALID_PRICE},
        RejectionParams{
            PlaceOrder{
                .userId = "bob", .side = OrderSide::BUY, .size = 1_dec, .price = 50'000_dec,
                .leverage = 101_dec},
            OrderErrorCode::INVALID_LEVERAGE},
        RejectionParams{
            PlaceOrder{
                .userId = "bob", .side = OrderSide::BUY, .size = 1_dec, .price = 50'000_dec,
                .leverage = DEC(0.5)},
            OrderErrorCode::INVALID_LEVERAGE},
        RejectionParams{
            PlaceOrder{.userId = "bob", .side = OrderSide::BUY, .size = 11_dec, .price = 1'000_dec},
            OrderErrorCode::MAX_POSITION_SIZE},
        RejectionParams{
            PlaceOrder{.userId = "bob", .side = OrderSide::BUY, .size = 10_dec, .price = 200'000_dec},
            OrderErrorCode::MAX_POSITION_VALUE},
        RejectionParams{
            PlaceOrder{.userId = "eve", .side = OrderSide::SELL, .size = 3_dec, .price = 50'000_dec},
            OrderErrorCode::INSUFFICIENT_MARGIN},
        RejectionParams{
            PlaceOrder{
                .userId = "bob", .side = OrderSide::BUY, .size = 1_dec,
                .orderType = book::OrderType::MARKET},
            OrderErrorCode::EMPTY_BOOK}));

TEST_P(OrderRejectionTest, ErrorCode)
{
    const auto result = validate(GetParam().order);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), GetParam().expected);
}

//-------------------------------------------------------------------------

TEST_F(OrderPlacementValidatorTest, MarketOrderUsesBestOppositePrice)
{
    rest("eve", OrderSide::SELL, 1_dec, 50'100_dec);
    rest("eve", OrderSide::SELL, 1_dec, 50'200_dec);

    const auto result = validate(PlaceOrder{
        .userId = "bob", .side = OrderSide::BUY, .size = 1_dec, .orderType = book::OrderType::MARKET});

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->referencePrice, 50'100_dec);
    EXPECT_EQ(result->requiredMargin, 5'010_dec);
}

//-------------------------------------------------------------------------

TEST_F(OrderPlacementValidatorTest, RestingOrdersCommitMargin)
{
    // eve: 10000 available, 5000 committed by the resting order
    rest("eve", OrderSide::SELL, 1_dec, 50'000_dec);
    EXPECT_EQ(OrderPlacementValidator::committedMargin("eve", book), 5'000_dec);

    EXPECT_TRUE(validate(limit("eve", OrderSide::SELL, 1_dec, 50'000_dec)).has_value());
    const auto result = validate(limit("eve", OrderSide::SELL, DEC(1.1), 50'000_dec));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), OrderErrorCode::INSUFFICIENT_MARGIN);
}

//-------------------------------------------------------------------------

TEST_F(OrderPlacementValidatorTest, ClosingOrderNeedsNoMargin)
{
    auto& eve = users.at("eve");
    ledger.applyFill(eve, OrderSide::SELL, 2_dec, 50'000_dec, 10_dec, 1);
    ASSERT_EQ(eve.availableBalance(), 0_dec);

    const auto closing = validate(limit("eve", OrderSide::BUY, 2_dec, 50'000_dec));
    ASSERT_TRUE(closing.has_value());
    EXPECT_EQ(closing->openingSize, 0_dec);
    EXPECT_EQ(closing->requiredMargin, 0_dec);

    const auto flipping = validate(limit("eve", OrderSide::BUY, 3_dec, 50'000_dec));
    ASSERT_FALSE(flipping.has_value());
    EXPECT_EQ(flipping.error(), OrderErrorCode::INSUFFICIENT_MARGIN);
}

//-------------------------------------------------------------------------
