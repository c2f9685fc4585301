/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/liquidation/PositionLiquidationEngine.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace derivsim::liquidation
{

//-------------------------------------------------------------------------

void InventorySummary::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember(
            "totalPositions", rapidjson::Value{static_cast<uint64_t>(totalPositions)}, allocator);
        json.AddMember("longSize", json::decimalValue(longSize), allocator);
        json.AddMember("shortSize", json::decimalValue(shortSize), allocator);
        json.AddMember("totalUnrealizedPnL", json::decimalValue(totalUnrealizedPnL), allocator);
        rapidjson::Value countsJson{rapidjson::kObjectType};
        for (const auto& [status, count] : statusCounts) {
            countsJson.AddMember(
                rapidjson::Value{EnginePositionStatus2StrView(status).data(), allocator},
                rapidjson::Value{static_cast<uint64_t>(count)},
                allocator);
        }
        json.AddMember("statusCounts", countsJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void FundSufficiency::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("isSufficient", rapidjson::Value{sufficient}, allocator);
        json.AddMember("exposure", json::decimalValue(exposure), allocator);
        json.AddMember("available", json::decimalValue(fundBalance), allocator);
        json.AddMember("shortfall", json::decimalValue(shortfall), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

const EnginePosition& PositionLiquidationEngine::receivePosition(
    const position::Position& position,
    decimal_t bankruptcyPrice,
    decimal_t markPrice,
    Timestamp timestamp)
{
    auto& enginePosition = m_positions.emplace_back(EnginePosition{
        .id = m_nextId++,
        .originalUserId = position.userId(),
        .side = position.side(),
        .size = position.size(),
        .originalSize = position.size(),
        .entryPrice = position.avgEntryPrice(),
        .bankruptcyPrice = bankruptcyPrice,
        .leverage = position.leverage(),
        .transferMarkPrice = markPrice,
        .transferredAt = timestamp,
        .status = EnginePositionStatus::PENDING
    });

    m_history.push_back(InventoryHistoryEntry{
        .action = InventoryAction::POSITION_RECEIVED,
        .positionId = enginePosition.id,
        .timestamp = timestamp,
        .status = enginePosition.status,
        .size = enginePosition.size,
        .price = bankruptcyPrice
    });

    logDebug(
        "{} | ENGINE POSITION #{} : RECEIVED {} {}@{} FROM {} (BANKRUPTCY {})",
        timestamp, enginePosition.id, enginePosition.side, enginePosition.size,
        enginePosition.entryPrice, enginePosition.originalUserId, bankruptcyPrice);

    return enginePosition;
}

//-------------------------------------------------------------------------

const EnginePosition* PositionLiquidationEngine::find(EnginePositionId id) const noexcept
{
    auto it = std::ranges::find(m_positions, id, &EnginePosition::id);
    return it != m_positions.end() ? &*it : nullptr;
}

//-------------------------------------------------------------------------

decimal_t PositionLiquidationEngine::positionPnL(EnginePositionId id, decimal_t markPrice) const
{
    const auto enginePosition = find(id);
    if (enginePosition == nullptr) {
        throw std::out_of_range{fmt::format(
            "{}: No engine position #{}", std::source_location::current().function_name(), id)};
    }
    return enginePosition->unrealizedPnL(markPrice);
}

//-------------------------------------------------------------------------

void PositionLiquidationEngine::setStatus(
    EnginePositionId id, EnginePositionStatus status, Timestamp timestamp)
{
    auto it = findIt(id);
    if (it->status == status) return;
    logDebug("{} | ENGINE POSITION #{} : {} -> {}", timestamp, id, it->status, status);
    it->status = status;
    m_history.push_back(InventoryHistoryEntry{
        .action = InventoryAction::STATUS_CHANGE,
        .positionId = id,
        .timestamp = timestamp,
        .status = status
    });
}

//-------------------------------------------------------------------------

ReduceEffect PositionLiquidationEngine::reduce(
    EnginePositionId id, decimal_t size, decimal_t price, Timestamp timestamp)
{
    auto it = findIt(id);
    if (!(size > 0_dec) || size > it->size) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot reduce engine position #{} of size {} by {}",
            std::source_location::current().function_name(),
            id,
            it->size,
            size)};
    }

    const decimal_t realizedPnL = (price - it->entryPrice) * size * sign(it->side);
    it->size -= size;
    m_realizedPnL += realizedPnL;

    m_history.push_back(InventoryHistoryEntry{
        .action = InventoryAction::SIZE_REDUCED,
        .positionId = id,
        .timestamp = timestamp,
        .status = it->status,
        .size = size,
        .price = price,
        .realizedPnL = realizedPnL
    });

    if (it->size == 0_dec) {
        it->status = EnginePositionStatus::COMPLETED;
        m_history.push_back(InventoryHistoryEntry{
            .action = InventoryAction::POSITION_CLOSED,
            .positionId = id,
            .timestamp = timestamp,
            .status = it->status,
            .size = it->originalSize,
            .price = price
        });
        logDebug("{} | ENGINE POSITION #{} : CLOSED", timestamp, id);
        m_closed.push_back(*it);
        m_positions.erase(it);
        return ReduceEffect{
            .realizedPnL = realizedPnL,
            .remainingSize = {},
            .status = EnginePositionStatus::COMPLETED
        };
    }

    return ReduceEffect{
        .realizedPnL = realizedPnL,
        .remainingSize = it->size,
        .status = it->status
    };
}

//-------------------------------------------------------------------------

decimal_t PositionLiquidationEngine::totalSize(PositionSide side) const noexcept
{
    decimal_t total{};
    for (const auto& enginePosition : m_positions) {
        if (enginePosition.side == side) {
            total += enginePosition.size;
        }
    }
    return total;
}

//-------------------------------------------------------------------------

decimal_t PositionLiquidationEngine::totalUnrealizedPnL(decimal_t markPrice) const noexcept
{
    decimal_t total{};
    for (const auto& enginePosition : m_positions) {
        total += enginePosition.unrealizedPnL(markPrice);
    }
    return total;
}

//-------------------------------------------------------------------------

InventorySummary PositionLiquidationEngine::summary(decimal_t markPrice) const
{
    InventorySummary summary;
    summary.totalPositions = m_positions.size();
    summary.longSize = totalSize(PositionSide::LONG);
    summary.shortSize = totalSize(PositionSide::SHORT);
    summary.totalUnrealizedPnL = totalUnrealizedPnL(markPrice);
    for (const auto& enginePosition : m_positions) {
        ++summary.statusCounts[enginePosition.status];
    }
    return summary;
}

//-------------------------------------------------------------------------

FundSufficiency PositionLiquidationEngine::checkInsuranceFundSufficiency(
    decimal_t markPrice, decimal_t fundBalance) const
{
    const decimal_t pnl = totalUnrealizedPnL(markPrice);
    const decimal_t exposure = pnl < 0_dec ? -pnl : 0_dec;
    FundSufficiency sufficiency;
    sufficiency.fundBalance = fundBalance;
    sufficiency.exposure = exposure;
    sufficiency.shortfall = exposure > fundBalance ? exposure - fundBalance : 0_dec;
    sufficiency.sufficient = fundBalance >= exposure;
    return sufficiency;
}

//-------------------------------------------------------------------------

void PositionLiquidationEngine::clear() noexcept
{
    m_positions.clear();
    m_closed.clear();
    m_history.clear();
    m_realizedPnL = {};
    m_nextId = 1;
}

//-------------------------------------------------------------------------

std::vector<EnginePosition>::iterator PositionLiquidationEngine::findIt(EnginePositionId id)
{
    auto it = std::ranges::find(m_positions, id, &EnginePosition::id);
    if (it == m_positions.end()) {
        throw std::out_of_range{fmt::format(
            "{}: No engine position #{}", std::source_location::current().function_name(), id)};
    }
    return it;
}

//-------------------------------------------------------------------------

}  // namespace derivsim::liquidation

//-------------------------------------------------------------------------
