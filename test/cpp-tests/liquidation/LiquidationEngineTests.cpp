/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/liquidation/LiquidationEngine.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace derivsim;
using namespace derivsim::liquidation;
using namespace derivsim::literals;
using namespace testing;

//-------------------------------------------------------------------------

struct LiquidationEngineTest : Test
{
    void SetUp() override
    {
        users.emplace("bob", position::User{"bob", "Bob", 100'000_dec, 10_dec});
        users.emplace("eve", position::User{"eve", "Eve", 100'000_dec, 10_dec});
        ledger.applyFill(users.at("bob"), OrderSide::BUY, 1_dec, 50'000_dec, 10_dec, 1);
        ledger.applyFill(users.at("eve"), OrderSide::SELL, 1_dec, 50'000_dec, 10_dec, 1);
    }

    position::UserMap users;
    position::PositionLedger ledger;
    book::OrderBook book;
    PositionLiquidationEngine inventory;
    InsuranceFund fund{1'000'000_dec, 100'000_dec};
    LiquidationEngine engine;
};

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, DetectAtLiquidationPrice)
{
    EXPECT_THAT(engine.detect(ledger, 54'700_dec), IsEmpty());

    const auto candidates = engine.detect(ledger, 54'750_dec);
    ASSERT_EQ(candidates.size(), 1);
    EXPECT_EQ(candidates.front().userId, "eve");
    EXPECT_EQ(candidates.front().liquidationPrice, 54'750_dec);

    const auto longCandidates = engine.detect(ledger, 45'000_dec);
    ASSERT_EQ(longCandidates.size(), 1);
    EXPECT_EQ(longCandidates.front().userId, "bob");
}

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, TransferPreservesExposure)
{
    auto& eve = users.at("eve");
    auto order = book.orderFactory().makeLimitOrder(2, "eve", OrderSide::SELL, 1_dec, 60'000_dec, 10_dec);
    book.add(order);

    const decimal_t pnlBefore = ledger.find("eve")->unrealizedPnL(54'800_dec);
    const auto result = engine.liquidate(eve, ledger, book, inventory, fund, 54'800_dec, 3);

    EXPECT_FALSE(ledger.contains("eve"));
    EXPECT_TRUE(book.empty());
    EXPECT_THAT(result.cancelledOrders, ElementsAre(order->id()));

    ASSERT_EQ(inventory.positions().size(), 1);
    const auto& enginePosition = inventory.positions().front();
    EXPECT_EQ(enginePosition.size, 1_dec);
    EXPECT_EQ(enginePosition.side, PositionSide::SHORT);
    EXPECT_EQ(enginePosition.unrealizedPnL(54'800_dec), pnlBefore);

    EXPECT_EQ(result.forfeitedMargin, 5'000_dec);
    EXPECT_EQ(result.lossAtMark, 4'800_dec);
    EXPECT_EQ(result.coveredByMargin, 4'800_dec);
    EXPECT_EQ(result.insuranceFundSurplus, 200_dec);
    EXPECT_EQ(result.insuranceFundShortfall, 0_dec);
    EXPECT_EQ(result.insuranceFundBefore, 1'000'000_dec);
    EXPECT_EQ(result.insuranceFundAfter, 1'005'000_dec);
    EXPECT_EQ(result.bankruptcyPrice, 55'000_dec);
    EXPECT_FALSE(result.manual);

    EXPECT_EQ(eve.usedMargin(), 0_dec);
    EXPECT_EQ(eve.totalBalance(), 95'000_dec);
    EXPECT_EQ(fund.balance(), 1'005'000_dec);
    EXPECT_EQ(engine.history().size(), 1);
}

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, OpenInterestConserved)
{
    static_cast<void>(engine.liquidate(users.at("eve"), ledger, book, inventory, fund, 54'800_dec, 3));

    EXPECT_EQ(
        ledger.totalSize(PositionSide::LONG) + inventory.totalSize(PositionSide::LONG),
        ledger.totalSize(PositionSide::SHORT) + inventory.totalSize(PositionSide::SHORT));
    EXPECT_EQ(
        ledger.totalUnrealizedPnL(54'800_dec) + inventory.totalUnrealizedPnL(54'800_dec), 0_dec);
}

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, LiquidateWithoutPositionThrows)
{
    users.emplace("alice", position::User{"alice", "Alice", 100'000_dec, 10_dec});
    EXPECT_THROW(
        static_cast<void>(
            engine.liquidate(users.at("alice"), ledger, book, inventory, fund, 54'800_dec, 3)),
        std::invalid_argument);
    EXPECT_EQ(fund.balance(), 1'000'000_dec);
}

//-------------------------------------------------------------------------
