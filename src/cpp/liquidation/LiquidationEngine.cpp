/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/liquidation/LiquidationEngine.hpp"

#include "derivsim/margin/MarginCalculator.hpp"

//-------------------------------------------------------------------------

namespace derivsim::liquidation
{

//-------------------------------------------------------------------------

void LiquidationCandidate::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("userId", rapidjson::Value{userId.c_str(), allocator}, allocator);
        json.AddMember(
            "side", rapidjson::Value{PositionSide2StrView(side).data(), allocator}, allocator);
        json.AddMember("size", json::decimalValue(size), allocator);
        json.AddMember("entryPrice", json::decimalValue(entryPrice), allocator);
        json.AddMember("liquidationPrice", json::decimalValue(liquidationPrice), allocator);
        json.AddMember("markPrice", json::decimalValue(markPrice), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void LiquidationResult::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("userId", rapidjson::Value{userId.c_str(), allocator}, allocator);
        json.AddMember("enginePositionId", rapidjson::Value{enginePositionId}, allocator);
        json.AddMember(
            "side", rapidjson::Value{PositionSide2StrView(side).data(), allocator}, allocator);
        json.AddMember("size", json::decimalValue(size), allocator);
        json.AddMember("entryPrice", json::decimalValue(entryPrice), allocator);
        json.AddMember("liquidationPrice", json::decimalValue(liquidationPrice), allocator);
        json.AddMember("bankruptcyPrice", json::decimalValue(bankruptcyPrice), allocator);
        json.AddMember("markPrice", json::decimalValue(markPrice), allocator);
        json.AddMember("forfeitedMargin", json::decimalValue(forfeitedMargin), allocator);
        json.AddMember("lossAtMark", json::decimalValue(lossAtMark), allocator);
        json.AddMember("coveredByMargin", json::decimalValue(coveredByMargin), allocator);
        json.AddMember(
            "insuranceFundShortfall", json::decimalValue(insuranceFundShortfall), allocator);
        json.AddMember("insuranceFundSurplus", json::decimalValue(insuranceFundSurplus), allocator);
        json.AddMember("insuranceFundBefore", json::decimalValue(insuranceFundBefore), allocator);
        json.AddMember("insuranceFundAfter", json::decimalValue(insuranceFundAfter), allocator);
        rapidjson::Value cancelledJson{rapidjson::kArrayType};
        for (OrderId id : cancelledOrders) {
            cancelledJson.PushBack(rapidjson::Value{id}, allocator);
        }
        json.AddMember("cancelledOrders", cancelledJson, allocator);
        json.AddMember("manual", rapidjson::Value{manual}, allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::vector<LiquidationCandidate> LiquidationEngine::detect(
    const position::PositionLedger& ledger, decimal_t markPrice) const
{
    std::vector<LiquidationCandidate> candidates;
    for (const auto& position : ledger.positions() | views::values) {
        if (!position.shouldLiquidate(markPrice)) continue;
        auto& candidate = candidates.emplace_back();
        candidate.userId = position.userId();
        candidate.side = position.side();
        candidate.size = position.size();
        candidate.entryPrice = position.avgEntryPrice();
        candidate.liquidationPrice = position.liquidationPrice();
        candidate.markPrice = markPrice;
    }
    return candidates;
}

//-------------------------------------------------------------------------

LiquidationResult LiquidationEngine::liquidate(
    position::User& user,
    position::PositionLedger& ledger,
    book::OrderBook& book,
    PositionLiquidationEngine& inventory,
    InsuranceFund& fund,
    decimal_t markPrice,
    Timestamp timestamp,
    bool manual)
{
    const position::Position position = ledger.extract(user.id());
    const decimal_t bankruptcyPrice = position.bankruptcyPrice();

    std::vector<OrderId> cancelledOrders;
    for (const auto& order : book.ordersOf(user.id())) {
        if (book.remove(order->id())) {
            cancelledOrders.push_back(order->id());
        }
    }

    const auto& enginePosition =
        inventory.receivePosition(position, bankruptcyPrice, markPrice, timestamp);

    const decimal_t fundBefore = fund.balance();
    const decimal_t forfeitedMargin = user.forfeitMargin();
    const decimal_t pnl = position.unrealizedPnL(markPrice);
    const decimal_t lossAtMark = pnl < 0_dec ? -pnl : 0_dec;
    const decimal_t coveredByMargin = std::min(forfeitedMargin, lossAtMark);

    fund.apply(
        forfeitedMargin,
        FundEntryKind::LIQUIDATION_MARGIN,
        fmt::format(
            "Forfeited margin of '{}' for {} {}@{}",
            user.id(), position.side(), position.size(), position.avgEntryPrice()),
        timestamp);

    LiquidationResult result;
    result.userId = user.id();
    result.enginePositionId = enginePosition.id;
    result.side = position.side();
    result.size = position.size();
    result.entryPrice = position.avgEntryPrice();
    result.liquidationPrice = position.liquidationPrice();
    result.bankruptcyPrice = bankruptcyPrice;
    result.markPrice = markPrice;
    result.forfeitedMargin = forfeitedMargin;
    result.lossAtMark = lossAtMark;
    result.coveredByMargin = coveredByMargin;
    result.insuranceFundShortfall = lossAtMark - coveredByMargin;
    result.insuranceFundSurplus = forfeitedMargin - coveredByMargin;
    result.insuranceFundBefore = fundBefore;
    result.insuranceFundAfter = fund.balance();
    result.cancelledOrders = std::move(cancelledOrders);
    result.manual = manual;
    result.timestamp = timestamp;

    logDebug(
        "{} | LIQUIDATED {} {} {}@{} AT MARK {} -> ENGINE POSITION #{}, MARGIN {} TO FUND ({} -> {})",
        timestamp, result.userId, result.side, result.size, result.entryPrice, markPrice,
        result.enginePositionId, forfeitedMargin, fundBefore, result.insuranceFundAfter);

    m_history.push_back(result);
    return result;
}

//-------------------------------------------------------------------------

}  // namespace derivsim::liquidation

//-------------------------------------------------------------------------
