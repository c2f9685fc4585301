/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/adl/ADLEngine.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace derivsim::adl
{

//-------------------------------------------------------------------------

namespace
{

void serializeCandidates(
    rapidjson::Value& array,
    const std::vector<ADLCandidate>& candidates,
    rapidjson::Document::AllocatorType& allocator)
{
    for (const auto& candidate : candidates) {
        rapidjson::Value candidateJson{rapidjson::kObjectType};
        candidateJson.AddMember(
            "userId", rapidjson::Value{candidate.userId.c_str(), allocator}, allocator);
        candidateJson.AddMember(
            "side",
            rapidjson::Value{PositionSide2StrView(candidate.side).data(), allocator},
            allocator);
        candidateJson.AddMember("size", json::decimalValue(candidate.size), allocator);
        candidateJson.AddMember("entryPrice", json::decimalValue(candidate.entryPrice), allocator);
        candidateJson.AddMember(
            "unrealizedPnL", json::decimalValue(candidate.unrealizedPnL), allocator);
        candidateJson.AddMember(
            "positionValue", json::decimalValue(candidate.positionValue), allocator);
        candidateJson.AddMember("score", json::decimalValue(candidate.score), allocator);
        candidateJson.AddMember("rank", rapidjson::Value{candidate.rank}, allocator);
        candidateJson.AddMember("indicator", rapidjson::Value{candidate.indicator}, allocator);
        array.PushBack(candidateJson, allocator);
    }
}

}  // namespace

//-------------------------------------------------------------------------

void ADLResult::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("success", rapidjson::Value{success}, allocator);
        json.AddMember("enginePositionId", rapidjson::Value{enginePositionId}, allocator);
        json.AddMember(
            "originalUserId", rapidjson::Value{originalUserId.c_str(), allocator}, allocator);
        json.AddMember(
            "side", rapidjson::Value{PositionSide2StrView(side).data(), allocator}, allocator);
        json.AddMember("markPrice", json::decimalValue(markPrice), allocator);
        rapidjson::Value planJson{rapidjson::kArrayType};
        for (const auto& entry : plan.entries) {
            rapidjson::Value entryJson{rapidjson::kObjectType};
            entryJson.AddMember("userId", rapidjson::Value{entry.userId.c_str(), allocator}, allocator);
            entryJson.AddMember("size", json::decimalValue(entry.size), allocator);
            entryJson.AddMember("price", json::decimalValue(entry.price), allocator);
            planJson.PushBack(entryJson, allocator);
        }
        json.AddMember("plan", planJson, allocator);
        json.AddMember("totalPlanned", json::decimalValue(plan.totalPlanned), allocator);
        json.AddMember("executedSize", json::decimalValue(executedSize), allocator);
        json.AddMember("shortfall", json::decimalValue(shortfall), allocator);
        json.AddMember("remainingSize", json::decimalValue(remainingSize), allocator);
        json.AddMember(
            "status",
            rapidjson::Value{liquidation::EnginePositionStatus2StrView(status).data(), allocator},
            allocator);
        json.AddMember("engineRealizedPnL", json::decimalValue(engineRealizedPnL), allocator);
        json.AddMember("insuranceFundBefore", json::decimalValue(insuranceFundBefore), allocator);
        json.AddMember("insuranceFundAfter", json::decimalValue(insuranceFundAfter), allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void ADLQueue::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        rapidjson::Value longsJson{rapidjson::kArrayType};
        serializeCandidates(longsJson, longs, allocator);
        json.AddMember("long", longsJson, allocator);
        rapidjson::Value shortsJson{rapidjson::kArrayType};
        serializeCandidates(shortsJson, shorts, allocator);
        json.AddMember("short", shortsJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::vector<ADLCandidate> ADLEngine::rank(
    PositionSide side,
    const position::PositionLedger& ledger,
    const position::UserMap& users,
    decimal_t markPrice) const
{
    std::vector<ADLCandidate> ranked;

    for (const auto& [userId, position] : ledger.positions()) {
        if (position.side() != side) continue;
        const decimal_t pnl = position.unrealizedPnL(markPrice);
        if (!(pnl > 0_dec)) continue;
        auto userIt = users.find(userId);
        if (userIt == users.end()) continue;

        const decimal_t value = position.positionValue(markPrice);
        const decimal_t equity = userIt->second.availableBalance() + pnl;
        const decimal_t profitRatio = pnl / value;
        const decimal_t effectiveLeverage = equity > 0_dec ? value / equity : kInfinity;

        ranked.push_back(ADLCandidate{
            .userId = userId,
            .side = side,
            .size = position.size(),
            .entryPrice = position.avgEntryPrice(),
            .unrealizedPnL = pnl,
            .positionValue = value,
            .score = profitRatio * effectiveLeverage
        });
    }

    std::ranges::sort(ranked, [](const ADLCandidate& lhs, const ADLCandidate& rhs) {
        if (lhs.score != rhs.score) return lhs.score > rhs.score;
        return lhs.userId < rhs.userId;
    });

    const auto count = static_cast<uint32_t>(ranked.size());
    for (uint32_t i = 0; i < count; ++i) {
        ranked[i].rank = i + 1;
        ranked[i].indicator = kIndicatorLevels - i * kIndicatorLevels / count;
    }

    return ranked;
}

//-------------------------------------------------------------------------

ADLPlan ADLEngine::plan(
    const liquidation::EnginePosition& enginePosition,
    const std::vector<ADLCandidate>& ranked,
    decimal_t markPrice) const
{
    ADLPlan plan;
    decimal_t remaining = enginePosition.size;

    for (const auto& candidate : ranked) {
        if (remaining == 0_dec) break;
        if (candidate.side == enginePosition.side) {
            throw std::invalid_argument{fmt::format(
                "{}: Candidate '{}' is on the same side ({}) as engine position #{}",
                std::source_location::current().function_name(),
                candidate.userId,
                candidate.side,
                enginePosition.id)};
        }
        const decimal_t size = std::min(candidate.size, remaining);
        plan.entries.push_back(ADLPlanEntry{
            .userId = candidate.userId,
            .size = size,
            .price = markPrice
        });
        plan.totalPlanned += size;
        remaining -= size;
    }

    plan.shortfall = remaining;
    return plan;
}

//-------------------------------------------------------------------------

ADLResult ADLEngine::execute(
    EnginePositionId enginePositionId,
    liquidation::PositionLiquidationEngine& inventory,
    position::PositionLedger& ledger,
    position::UserMap& users,
    liquidation::InsuranceFund& fund,
    decimal_t markPrice,
    Timestamp timestamp)
{
    const auto enginePosition = inventory.find(enginePositionId);
    if (enginePosition == nullptr) {
        throw std::out_of_range{fmt::format(
            "{}: No engine position #{}",
            std::source_location::current().function_name(),
            enginePositionId)};
    }

    ADLResult result;
    result.enginePositionId = enginePositionId;
    result.originalUserId = enginePosition->originalUserId;
    result.side = enginePosition->side;
    result.markPrice = markPrice;
    result.insuranceFundBefore = fund.balance();
    result.timestamp = timestamp;

    const auto ranked = rank(opposite(enginePosition->side), ledger, users, markPrice);
    result.plan = plan(*enginePosition, ranked, markPrice);

    inventory.setStatus(
        enginePositionId, liquidation::EnginePositionStatus::PROCESSING, timestamp);

    liquidation::ReduceEffect reduceEffect{
        .realizedPnL = {},
        .remainingSize = enginePosition->size,
        .status = liquidation::EnginePositionStatus::PROCESSING
    };

    for (const auto& entry : result.plan.entries) {
        auto& user = users.at(entry.userId);
        const auto fillEffect = ledger.closeAt(user, entry.size, entry.price, timestamp);
        reduceEffect = inventory.reduce(enginePositionId, entry.size, entry.price, timestamp);
        result.engineRealizedPnL += reduceEffect.realizedPnL;
        result.executedSize += entry.size;
        logDebug(
            "{} | ADL CLOSED {} OF {} AT {} (USER REALIZED {}, ENGINE REALIZED {})",
            timestamp, entry.size, entry.userId, entry.price, fillEffect.realizedPnL,
            reduceEffect.realizedPnL);
    }

    if (result.engineRealizedPnL != 0_dec) {
        fund.apply(
            result.engineRealizedPnL,
            liquidation::FundEntryKind::ADL_SETTLEMENT,
            fmt::format(
                "ADL settlement of engine position #{} ({} closed at {})",
                enginePositionId, result.executedSize, markPrice),
            timestamp);
    }

    result.shortfall = result.plan.shortfall;
    result.remainingSize = reduceEffect.remainingSize;
    result.status = reduceEffect.status;
    result.success = result.shortfall == 0_dec;
    result.insuranceFundAfter = fund.balance();

    if (!result.success) {
        logDebug(
            "{} | ADL OF ENGINE POSITION #{} SHORT BY {}, {} REMAINING",
            timestamp, enginePositionId, result.shortfall, result.remainingSize);
    }

    m_history.push_back(result);
    return result;
}

//-------------------------------------------------------------------------

ADLQueue ADLEngine::adlQueue(
    const position::PositionLedger& ledger,
    const position::UserMap& users,
    decimal_t markPrice) const
{
    ADLQueue queue;
    queue.longs = rank(PositionSide::LONG, ledger, users, markPrice);
    queue.shorts = rank(PositionSide::SHORT, ledger, users, markPrice);
    return queue;
}

//-------------------------------------------------------------------------

}  // namespace derivsim::adl

//-------------------------------------------------------------------------
