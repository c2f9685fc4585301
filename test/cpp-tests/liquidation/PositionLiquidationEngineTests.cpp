/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/liquidation/PositionLiquidationEngine.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace derivsim;
using namespace derivsim::liquidation;
using namespace derivsim::literals;
using namespace testing;

//-------------------------------------------------------------------------

struct PositionLiquidationEngineTest : Test
{
    const EnginePosition& receiveShort(decimal_t size, decimal_t entryPrice)
    {
        const position::Position position{
            "eve", PositionSide::SHORT, size, entryPrice, 10_dec, size * entryPrice / 10_dec, 1};
        return inventory.receivePosition(position, position.bankruptcyPrice(), 54'800_dec, 2);
    }

    PositionLiquidationEngine inventory;
};

//-------------------------------------------------------------------------

TEST_F(PositionLiquidationEngineTest, ReceiveKeepsOriginalEntry)
{
    const auto& enginePosition = receiveShort(1_dec, 50'000_dec);

    EXPECT_EQ(enginePosition.id, 1);
    EXPECT_EQ(enginePosition.originalUserId, "eve");
    EXPECT_EQ(enginePosition.side, PositionSide::SHORT);
    EXPECT_EQ(enginePosition.entryPrice, 50'000_dec);
    EXPECT_EQ(enginePosition.bankruptcyPrice, 55'000_dec);
    EXPECT_EQ(enginePosition.transferMarkPrice, 54'800_dec);
    EXPECT_EQ(enginePosition.status, EnginePositionStatus::PENDING);
    EXPECT_EQ(inventory.positionPnL(1, 54'800_dec), -4'800_dec);

    ASSERT_EQ(inventory.history().size(), 1);
    EXPECT_EQ(inventory.history().front().action, InventoryAction::POSITION_RECEIVED);
}

//-------------------------------------------------------------------------

TEST_F(PositionLiquidationEngineTest, ReduceToZeroCompletes)
{
    receiveShort(2_dec, 50'000_dec);

    auto effect = inventory.reduce(1, 1_dec, 54'800_dec, 3);
    EXPECT_EQ(effect.realizedPnL, -4'800_dec);
    EXPECT_EQ(effect.remainingSize, 1_dec);
    ASSERT_NE(inventory.find(1), nullptr);

    effect = inventory.reduce(1, 1_dec, 49'000_dec, 4);
    EXPECT_EQ(effect.realizedPnL, 1'000_dec);
    EXPECT_EQ(effect.remainingSize, 0_dec);
    EXPECT_EQ(effect.status, EnginePositionStatus::COMPLETED);

    EXPECT_TRUE(inventory.empty());
    EXPECT_EQ(inventory.find(1), nullptr);
    ASSERT_EQ(inventory.closedPositions().size(), 1);
    EXPECT_EQ(inventory.closedPositions().front().originalSize, 2_dec);
    EXPECT_EQ(inventory.realizedPnL(), -3'800_dec);
    EXPECT_EQ(inventory.history().back().action, InventoryAction::POSITION_CLOSED);
}

//-------------------------------------------------------------------------

TEST_F(PositionLiquidationEngineTest, RejectsInvalidReduce)
{
    receiveShort(1_dec, 50'000_dec);
    EXPECT_THROW(inventory.reduce(1, 2_dec, 54'800_dec, 3), std::invalid_argument);
    EXPECT_THROW(inventory.reduce(1, 0_dec, 54'800_dec, 3), std::invalid_argument);
    EXPECT_THROW(inventory.reduce(7, 1_dec, 54'800_dec, 3), std::out_of_range);
    EXPECT_THROW(static_cast<void>(inventory.positionPnL(7, 54'800_dec)), std::out_of_range);
}

//-------------------------------------------------------------------------

TEST_F(PositionLiquidationEngineTest, StatusChangesRecorded)
{
    receiveShort(1_dec, 50'000_dec);
    inventory.setStatus(1, EnginePositionStatus::PROCESSING, 3);
    inventory.setStatus(1, EnginePositionStatus::PROCESSING, 4);

    EXPECT_EQ(inventory.find(1)->status, EnginePositionStatus::PROCESSING);
    EXPECT_EQ(inventory.history().size(), 2);
    EXPECT_EQ(inventory.history().back().action, InventoryAction::STATUS_CHANGE);
}

//-------------------------------------------------------------------------

TEST_F(PositionLiquidationEngineTest, HistoriesKeepMostRecent)
{
    inventory = PositionLiquidationEngine{2};
    for (int i = 0; i < 3; ++i) {
        const auto id = receiveShort(1_dec, 50'000_dec).id;
        static_cast<void>(inventory.reduce(id, 1_dec, 49'000_dec, 3));
    }

    EXPECT_TRUE(inventory.empty());
    EXPECT_EQ(inventory.realizedPnL(), 3'000_dec);
    ASSERT_EQ(inventory.closedPositions().size(), 2);
    EXPECT_EQ(inventory.closedPositions().front().id, 2);
    EXPECT_EQ(inventory.closedPositions().back().id, 3);
    ASSERT_EQ(inventory.history().size(), 2);
    EXPECT_EQ(inventory.history().back().action, InventoryAction::POSITION_CLOSED);
}

//-------------------------------------------------------------------------

TEST_F(PositionLiquidationEngineTest, SummaryAndSufficiency)
{
    receiveShort(1_dec, 50'000_dec);
    receiveShort(2_dec, 52'000_dec);

    const auto summary = inventory.summary(54'000_dec);
    EXPECT_EQ(summary.totalPositions, 2);
    EXPECT_EQ(summary.shortSize, 3_dec);
    EXPECT_EQ(summary.longSize, 0_dec);
    EXPECT_EQ(summary.totalUnrealizedPnL, -8'000_dec);
    EXPECT_EQ(summary.statusCounts.at(EnginePositionStatus::PENDING), 2);

    const auto sufficient = inventory.checkInsuranceFundSufficiency(54'000_dec, 10'000_dec);
    EXPECT_TRUE(sufficient.sufficient);
    EXPECT_EQ(sufficient.exposure, 8'000_dec);
    EXPECT_EQ(sufficient.shortfall, 0_dec);

    const auto insufficient = inventory.checkInsuranceFundSufficiency(54'000_dec, 5'000_dec);
    EXPECT_FALSE(insufficient.sufficient);
    EXPECT_EQ(insufficient.shortfall, 3'000_dec);

    const auto inProfit = inventory.checkInsuranceFundSufficiency(48'000_dec, 0_dec);
    EXPECT_TRUE(inProfit.sufficient);
    EXPECT_EQ(inProfit.exposure, 0_dec);
}

//-------------------------------------------------------------------------
