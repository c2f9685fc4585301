/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/exchange/ZeroSum.hpp"

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

void ZeroSumReport::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("userLongSize", json::decimalValue(userLongSize), allocator);
        json.AddMember("userShortSize", json::decimalValue(userShortSize), allocator);
        json.AddMember("engineLongSize", json::decimalValue(engineLongSize), allocator);
        json.AddMember("engineShortSize", json::decimalValue(engineShortSize), allocator);
        json.AddMember("totalLong", json::decimalValue(longSize), allocator);
        json.AddMember("totalShort", json::decimalValue(shortSize), allocator);
        json.AddMember("sizeImbalance", json::decimalValue(sizeImbalance), allocator);
        json.AddMember("userUnrealizedPnL", json::decimalValue(userUnrealizedPnL), allocator);
        json.AddMember("engineUnrealizedPnL", json::decimalValue(engineUnrealizedPnL), allocator);
        json.AddMember("totalUnrealizedPnL", json::decimalValue(unrealizedPnL), allocator);
        json.AddMember("totalRealizedPnL", json::decimalValue(realizedPnL), allocator);
        json.AddMember("absorbedLosses", json::decimalValue(absorbedLosses), allocator);
        json.AddMember("netPnL", json::decimalValue(netPnL), allocator);
        json.AddMember("totalUserBalance", json::decimalValue(totalUserBalance), allocator);
        json.AddMember("insuranceFund", json::decimalValue(insuranceFund), allocator);
        json.AddMember("systemValue", json::decimalValue(systemValue), allocator);
        json.AddMember("systemEquity", json::decimalValue(systemEquity), allocator);
        json.AddMember("expectedSystemEquity", json::decimalValue(expectedSystemEquity), allocator);
        json.AddMember("equityDrift", json::decimalValue(equityDrift), allocator);
        json.AddMember("sizeBalanced", rapidjson::Value{sizeBalanced}, allocator);
        json.AddMember("pnlBalanced", rapidjson::Value{pnlBalanced}, allocator);
        json.AddMember("equityConserved", rapidjson::Value{equityConserved}, allocator);
        json.AddMember("isValid", rapidjson::Value{ok()}, allocator);
        json.AddMember("markPrice", json::decimalValue(markPrice), allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

ZeroSumReport checkZeroSum(const ExchangeState& state)
{
    ZeroSumReport report;
    report.markPrice = state.markPrice;
    report.timestamp = state.timestamp;

    report.userLongSize = state.ledger.totalSize(PositionSide::LONG);
    report.userShortSize = state.ledger.totalSize(PositionSide::SHORT);
    report.engineLongSize = state.inventory.totalSize(PositionSide::LONG);
    report.engineShortSize = state.inventory.totalSize(PositionSide::SHORT);
    report.longSize = report.userLongSize + report.engineLongSize;
    report.shortSize = report.userShortSize + report.engineShortSize;
    report.sizeImbalance = report.longSize - report.shortSize;

    report.userUnrealizedPnL = state.ledger.totalUnrealizedPnL(state.markPrice);
    report.engineUnrealizedPnL = state.inventory.totalUnrealizedPnL(state.markPrice);
    report.unrealizedPnL = report.userUnrealizedPnL + report.engineUnrealizedPnL;

    report.realizedPnL = state.inventory.realizedPnL();
    for (const auto& user : state.users | views::values) {
        report.realizedPnL += user.realizedPnL();
        report.totalUserBalance += user.totalBalance();
    }
    report.absorbedLosses = state.insuranceFund.absorbedLosses();
    report.realizedPnL -= report.absorbedLosses;
    report.netPnL = report.unrealizedPnL + report.realizedPnL;

    report.insuranceFund = state.insuranceFund.balance();
    report.systemValue = report.totalUserBalance + report.insuranceFund;
    report.systemEquity = report.systemValue + report.unrealizedPnL;
    report.expectedSystemEquity =
        state.initialSystemValue + state.insuranceFund.manualAdjustmentsTotal();
    report.equityDrift = report.systemEquity - report.expectedSystemEquity;

    report.sizeBalanced = util::abs(report.sizeImbalance) < kSizeTolerance;
    report.pnlBalanced = util::abs(report.netPnL) < kPnLTolerance;
    report.equityConserved = util::abs(report.equityDrift) < kPnLTolerance;

    return report;
}

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
