/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/exchange/Exchange.hpp"
#include "derivsim/exchange/errors.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace derivsim;
using namespace derivsim::exchange;
using namespace derivsim::literals;
using namespace testing;

//-------------------------------------------------------------------------

struct ExchangeTest : Test
{
    CommandResult limit(const UserId& userId, OrderSide side, decimal_t size, decimal_t price)
    {
        return exchange->process(
            PlaceOrder{.userId = userId, .side = side, .size = size, .price = price});
    }

    CommandResult market(const UserId& userId, OrderSide side, decimal_t size)
    {
        return exchange->process(PlaceOrder{
            .userId = userId, .side = side, .size = size, .orderType = book::OrderType::MARKET});
    }

    // eve short 1 @ 50000 against bob long 1 @ 50000, both at 10x.
    void openBobEve()
    {
        ASSERT_TRUE(limit("eve", OrderSide::SELL, 1_dec, 50'000_dec).success);
        ASSERT_TRUE(market("bob", OrderSide::BUY, 1_dec).success);
    }

    const position::User& user(const UserId& userId) const
    {
        return exchange->state().users.at(userId);
    }

    std::unique_ptr<Exchange> exchange = std::make_unique<Exchange>();
};

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, PlaceOrderOpensPositions)
{
    const auto resting = limit("eve", OrderSide::SELL, 1_dec, 50'000_dec);
    ASSERT_TRUE(resting.success);
    EXPECT_STREQ(resting.data["status"].GetString(), "OPEN");
    ASSERT_TRUE(resting.state.IsObject());

    const auto filled = market("bob", OrderSide::BUY, 1_dec);
    ASSERT_TRUE(filled.success);
    EXPECT_STREQ(filled.data["status"].GetString(), "FILLED");
    EXPECT_EQ(filled.data["trades"].Size(), 1);

    const auto& state = exchange->state();
    ASSERT_NE(state.ledger.find("bob"), nullptr);
    ASSERT_NE(state.ledger.find("eve"), nullptr);
    EXPECT_EQ(state.ledger.find("bob")->side(), PositionSide::LONG);
    EXPECT_EQ(state.ledger.find("eve")->side(), PositionSide::SHORT);
    EXPECT_EQ(user("bob").usedMargin(), 5'000_dec);
    EXPECT_EQ(user("eve").usedMargin(), 5'000_dec);
    EXPECT_EQ(state.tradeHistory.size(), 1);
    EXPECT_TRUE(exchange->zeroSumReport().ok());
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, RejectedOrderReportsErrorCode)
{
    const auto result = limit("bob", OrderSide::BUY, 3_dec, 50'000_dec);
    ASSERT_TRUE(result.success);

    const auto rejected = exchange->process(PlaceOrder{
        .userId = "bob", .side = OrderSide::BUY, .size = 10_dec, .price = 50'000_dec,
        .leverage = 1_dec});
    EXPECT_FALSE(rejected.success);
    ASSERT_TRUE(rejected.error.has_value());
    EXPECT_STREQ(rejected.data["errorCode"].GetString(), "INSUFFICIENT_MARGIN");

    const auto empty = market("eve", OrderSide::BUY, 1_dec);
    EXPECT_FALSE(empty.success);
    EXPECT_STREQ(empty.data["errorCode"].GetString(), "EMPTY_BOOK");
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, MarketRemainderDiscarded)
{
    ASSERT_TRUE(limit("eve", OrderSide::SELL, DEC(0.4), 50'000_dec).success);
    const auto result = market("bob", OrderSide::BUY, 1_dec);

    ASSERT_TRUE(result.success);
    EXPECT_STREQ(result.data["status"].GetString(), "PARTIALLY_FILLED");
    EXPECT_EQ(exchange->state().ledger.find("bob")->size(), DEC(0.4));
    EXPECT_TRUE(exchange->state().book.empty());
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, SelfTradeCancelsRestingOrder)
{
    ASSERT_TRUE(limit("bob", OrderSide::SELL, 1_dec, 50'000_dec).success);
    const auto result = limit("bob", OrderSide::BUY, 1_dec, 50'000_dec);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.data["selfTradeCancellations"].Size(), 1);
    EXPECT_EQ(result.data["trades"].Size(), 0);
    EXPECT_STREQ(result.data["status"].GetString(), "OPEN");
    EXPECT_FALSE(exchange->state().ledger.contains("bob"));
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, CancelOrder)
{
    const auto placed = limit("eve", OrderSide::SELL, 1_dec, 50'000_dec);
    const auto orderId = static_cast<OrderId>(placed.data["orderId"].GetUint());

    const auto wrongUser = exchange->process(CancelOrder{.orderId = orderId, .userId = "bob"});
    EXPECT_FALSE(wrongUser.success);
    EXPECT_FALSE(exchange->state().book.empty());

    const auto cancelled = exchange->process(CancelOrder{.orderId = orderId, .userId = "eve"});
    EXPECT_TRUE(cancelled.success);
    EXPECT_TRUE(exchange->state().book.empty());

    const auto missing = exchange->process(CancelOrder{.orderId = orderId});
    EXPECT_FALSE(missing.success);
    ASSERT_TRUE(missing.error.has_value());
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, BobEveLiquidationAndDeleveraging)
{
    openBobEve();
    const decimal_t initialSystemValue = exchange->zeroSumReport().systemValue;

    ASSERT_TRUE(exchange->process(SetLiquidationEnabled{.enabled = false}).success);
    ASSERT_TRUE(exchange->process(UpdateMarkPrice{.price = 54'800_dec}).success);
    EXPECT_TRUE(exchange->state().ledger.contains("eve"));

    const auto detected = exchange->process(DetectLiquidations{});
    ASSERT_TRUE(detected.success);
    ASSERT_EQ(detected.data["candidates"].Size(), 1);
    EXPECT_STREQ(detected.data["candidates"][0]["userId"].GetString(), "eve");

    const auto liquidated = exchange->process(ManualLiquidate{.userId = "eve"});
    ASSERT_TRUE(liquidated.success);
    EXPECT_TRUE(liquidated.data["liquidation"]["manual"].GetBool());

    const auto& state = exchange->state();
    EXPECT_FALSE(state.ledger.contains("eve"));
    EXPECT_EQ(state.insuranceFund.balance(), 1'005'000_dec);
    ASSERT_EQ(state.inventory.positions().size(), 1);
    EXPECT_EQ(state.inventory.positions().front().unrealizedPnL(54'800_dec), -4'800_dec);
    EXPECT_EQ(user("eve").totalBalance(), 95'000_dec);
    EXPECT_TRUE(exchange->zeroSumReport().ok());

    const auto step = exchange->process(LiquidationStep{});
    ASSERT_TRUE(step.success);
    EXPECT_TRUE(state.inventory.empty());
    EXPECT_FALSE(state.ledger.contains("bob"));
    EXPECT_EQ(user("bob").realizedPnL(), 4'800_dec);
    EXPECT_EQ(user("bob").totalBalance(), 104'800_dec);
    EXPECT_EQ(state.insuranceFund.balance(), 1'000'200_dec);

    const auto& report = exchange->zeroSumReport();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.longSize, 0_dec);
    EXPECT_EQ(report.shortSize, 0_dec);
    EXPECT_EQ(report.systemValue, initialSystemValue);
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, MarkUpdateLiquidatesAutomatically)
{
    openBobEve();

    const auto result = exchange->process(UpdateMarkPrice{.price = 54'800_dec});

    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.data["liquidations"].Size(), 1);
    EXPECT_STREQ(result.data["liquidations"][0]["userId"].GetString(), "eve");
    EXPECT_EQ(result.data["adl"].Size(), 0);
    EXPECT_FALSE(exchange->state().ledger.contains("eve"));
    EXPECT_EQ(exchange->state().inventory.positions().size(), 1);
    EXPECT_TRUE(exchange->zeroSumReport().ok());
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, InsufficientFundTriggersDeleveraging)
{
    auto config = ExchangeConfig::defaults();
    config.insuranceFund = 1'000_dec;
    config.insuranceFundRiskThreshold = 0_dec;
    exchange = std::make_unique<Exchange>(config);
    openBobEve();

    // Fund 6000 after the liquidation covers the 4800 engine loss.
    const auto liquidation = exchange->process(UpdateMarkPrice{.price = 54'800_dec});
    ASSERT_EQ(liquidation.data["liquidations"].Size(), 1);
    EXPECT_EQ(liquidation.data["adl"].Size(), 0);
    EXPECT_EQ(exchange->state().insuranceFund.balance(), 6'000_dec);

    const auto deleveraging = exchange->process(UpdateMarkPrice{.price = 57'000_dec});
    ASSERT_TRUE(deleveraging.success);
    ASSERT_EQ(deleveraging.data["adl"].Size(), 1);
    EXPECT_TRUE(deleveraging.data["adl"][0]["success"].GetBool());

    const auto& state = exchange->state();
    EXPECT_TRUE(state.inventory.empty());
    EXPECT_EQ(user("bob").realizedPnL(), 7'000_dec);
    EXPECT_EQ(state.insuranceFund.balance(), -1'000_dec);
    EXPECT_TRUE(exchange->zeroSumReport().ok());
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, AdlDisabledKeepsInventory)
{
    auto config = ExchangeConfig::defaults();
    config.insuranceFund = 1'000_dec;
    config.adlEnabled = false;
    exchange = std::make_unique<Exchange>(config);
    openBobEve();

    ASSERT_TRUE(exchange->process(UpdateMarkPrice{.price = 57'000_dec}).success);
    EXPECT_EQ(exchange->state().inventory.positions().size(), 1);
    EXPECT_TRUE(exchange->state().ledger.contains("bob"));
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, LiquidationStepReportsShortfall)
{
    openBobEve();
    // bob hands his long to alice at the later mark, leaving no profitable long.
    ASSERT_TRUE(limit("alice", OrderSide::BUY, 1_dec, 54'800_dec).success);
    ASSERT_TRUE(market("bob", OrderSide::SELL, 1_dec).success);
    EXPECT_EQ(user("bob").realizedPnL(), 4'800_dec);

    ASSERT_TRUE(exchange->process(UpdateMarkPrice{.price = 54'800_dec}).success);
    ASSERT_EQ(exchange->state().inventory.positions().size(), 1);

    const auto step = exchange->process(LiquidationStep{});
    EXPECT_FALSE(step.success);
    ASSERT_TRUE(step.error.has_value());
    EXPECT_EQ(json::getDecimal(step.data["shortfall"]), 1_dec);

    const auto& enginePosition = exchange->state().inventory.positions().front();
    EXPECT_EQ(enginePosition.size, 1_dec);
    EXPECT_EQ(enginePosition.status, liquidation::EnginePositionStatus::PROCESSING);
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, LiquidationStepWithoutInventoryFails)
{
    const auto step = exchange->process(LiquidationStep{});
    EXPECT_FALSE(step.success);
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, ManualLiquidateUnknownUser)
{
    EXPECT_FALSE(exchange->process(ManualLiquidate{.userId = "mallory"}).success);
    EXPECT_FALSE(exchange->process(ManualLiquidate{.userId = "bob"}).success);
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, ManualAdjustmentMovesExpectedEquity)
{
    const auto result = exchange->process(ManualAdjustment{.amount = -950'000_dec, .description = "sweep"});

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.data["isAtRisk"].GetBool());
    EXPECT_EQ(exchange->state().insuranceFund.balance(), 50'000_dec);
    EXPECT_TRUE(exchange->zeroSumReport().ok());

    EXPECT_FALSE(exchange->process(ManualAdjustment{.amount = 0_dec}).success);
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, InvalidMarkPriceRejected)
{
    EXPECT_FALSE(exchange->process(UpdateMarkPrice{.price = 0_dec}).success);
    EXPECT_EQ(exchange->state().markPrice, 50'000_dec);
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, ResetRestoresConfiguration)
{
    openBobEve();
    ASSERT_TRUE(exchange->process(UpdateMarkPrice{.price = 54'800_dec}).success);

    ASSERT_TRUE(exchange->process(ResetState{}).success);

    const auto& state = exchange->state();
    EXPECT_EQ(state.ledger.size(), 0);
    EXPECT_TRUE(state.inventory.empty());
    EXPECT_TRUE(state.book.empty());
    EXPECT_EQ(state.markPrice, 50'000_dec);
    EXPECT_EQ(state.insuranceFund.balance(), 1'000'000_dec);
    EXPECT_EQ(user("eve").totalBalance(), 100'000_dec);
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, StateSnapshot)
{
    openBobEve();
    exchange->setAttachState(false);

    const auto placed = limit("alice", OrderSide::BUY, 1_dec, 49'000_dec);
    EXPECT_TRUE(placed.state.IsNull());

    const auto result = exchange->process(GetState{});
    ASSERT_TRUE(result.state.IsObject());
    const auto& snapshot = result.state;
    EXPECT_EQ(snapshot["users"].Size(), 3);
    EXPECT_EQ(snapshot["positions"].Size(), 2);
    EXPECT_EQ(snapshot["orderBook"]["bids"].Size(), 1);
    EXPECT_EQ(snapshot["trades"].Size(), 1);
    EXPECT_TRUE(snapshot["zeroSum"]["isValid"].GetBool());
    EXPECT_TRUE(snapshot.HasMember("insuranceFund"));
    EXPECT_TRUE(snapshot.HasMember("liquidationEngine"));
    EXPECT_TRUE(snapshot.HasMember("marginCalls"));
    EXPECT_TRUE(snapshot.HasMember("adlQueue"));
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, JsonMessages)
{
    const auto unknown = exchange->process(std::string{R"({"type": "teleport"})"});
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(unknown.type, "unknown");

    const auto malformed = exchange->process(std::string{"{not json"});
    EXPECT_FALSE(malformed.success);

    const auto placed = exchange->process(std::string{
        R"({"type": "place_order", "userId": "eve", "side": "sell", "size": "1", "price": "50000"})"});
    EXPECT_TRUE(placed.success);
    EXPECT_EQ(placed.type, "place_order");
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, SignalsFire)
{
    std::vector<std::string> events;
    auto& signals = exchange->signals();
    bs2::scoped_connection trade = signals.trade.connect(
        [&](const matching::Trade&) { events.emplace_back("trade"); });
    bs2::scoped_connection liquidation = signals.liquidation.connect(
        [&](const liquidation::LiquidationResult&) { events.emplace_back("liquidation"); });
    bs2::scoped_connection fund = signals.fundAdjustment.connect(
        [&](const liquidation::FundEntry&) { events.emplace_back("fund"); });

    openBobEve();
    ASSERT_TRUE(exchange->process(UpdateMarkPrice{.price = 54'800_dec}).success);

    EXPECT_THAT(events, ElementsAre("trade", "fund", "liquidation"));
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, TradeHistoryKeepsMostRecent)
{
    auto config = ExchangeConfig::defaults();
    config.tradeHistory = 2;
    exchange = std::make_unique<Exchange>(config);

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limit("eve", OrderSide::SELL, DEC(0.1), 50'000_dec).success);
        ASSERT_TRUE(market("bob", OrderSide::BUY, DEC(0.1)).success);
    }

    const auto& history = exchange->state().tradeHistory;
    ASSERT_EQ(history.size(), 2);
    EXPECT_EQ(history.front().id + 1, history.back().id);
    EXPECT_EQ(exchange->state().ledger.find("bob")->size(), DEC(0.3));
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, DeepLossCloseChargesInsuranceFund)
{
    ASSERT_TRUE(limit("eve", OrderSide::SELL, 10_dec, 50'000_dec).success);
    ASSERT_TRUE(market("bob", OrderSide::BUY, 10_dec).success);
    ASSERT_TRUE(limit("alice", OrderSide::BUY, 10_dec, 39'000_dec).success);

    std::vector<liquidation::FundEntry> entries;
    bs2::scoped_connection fund = exchange->signals().fundAdjustment.connect(
        [&](const liquidation::FundEntry& entry) { entries.push_back(entry); });

    // A loss of 110000 against 50000 released margin and 50000 available.
    ASSERT_TRUE(market("bob", OrderSide::SELL, 10_dec).success);

    const auto& state = exchange->state();
    EXPECT_FALSE(state.ledger.contains("bob"));
    EXPECT_GE(user("bob").availableBalance(), 0_dec);
    EXPECT_EQ(user("bob").availableBalance(), 0_dec);
    EXPECT_EQ(user("bob").realizedPnL(), -100'000_dec);
    EXPECT_EQ(state.insuranceFund.balance(), 990'000_dec);
    EXPECT_EQ(state.insuranceFund.absorbedLosses(), 10'000_dec);

    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries.front().kind, liquidation::FundEntryKind::UNCOVERED_LOSS);
    EXPECT_EQ(entries.front().amount, -10'000_dec);

    const auto& report = exchange->zeroSumReport();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.absorbedLosses, 10'000_dec);
    EXPECT_EQ(report.netPnL, 0_dec);
    EXPECT_EQ(report.equityDrift, 0_dec);
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, FundSignalsSurviveFullHistory)
{
    auto config = ExchangeConfig::defaults();
    config.historyCapacity = 2;
    exchange = std::make_unique<Exchange>(config);

    size_t signalled = 0;
    bs2::scoped_connection fund = exchange->signals().fundAdjustment.connect(
        [&](const liquidation::FundEntry&) { ++signalled; });

    for (int i = 1; i <= 4; ++i) {
        ASSERT_TRUE(exchange->process(ManualAdjustment{.amount = decimal_t{i}}).success);
    }

    const auto& fundState = exchange->state().insuranceFund;
    EXPECT_EQ(signalled, 4);
    EXPECT_EQ(fundState.entryCount(), 4);
    ASSERT_EQ(fundState.history().size(), 2);
    EXPECT_EQ(fundState.history().front().amount, 3_dec);
    EXPECT_EQ(fundState.history().back().amount, 4_dec);
    EXPECT_EQ(fundState.balance(), 1'000'010_dec);
}

//-------------------------------------------------------------------------

TEST_F(ExchangeTest, TimestampAdvancesPerCommand)
{
    exchange->process(GetState{});
    exchange->process(DetectLiquidations{});
    EXPECT_EQ(exchange->state().timestamp, 2);
}

//-------------------------------------------------------------------------
