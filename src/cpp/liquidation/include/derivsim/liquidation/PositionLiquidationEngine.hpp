/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/liquidation/EnginePosition.hpp"
#include "derivsim/position/Position.hpp"
#include "derivsim/util/DebugLogger.hpp"

#include <boost/circular_buffer.hpp>

//-------------------------------------------------------------------------

namespace derivsim::liquidation
{

//-------------------------------------------------------------------------

enum class InventoryAction : uint32_t
{
    POSITION_RECEIVED,
    STATUS_CHANGE,
    SIZE_REDUCED,
    POSITION_CLOSED
};

struct InventoryHistoryEntry
{
    InventoryAction action;
    EnginePositionId positionId;
    Timestamp timestamp;
    EnginePositionStatus status;
    decimal_t size{};
    decimal_t price{};
    decimal_t realizedPnL{};
};

struct InventorySummary : public JsonSerializable
{
    size_t totalPositions{};
    decimal_t longSize{};
    decimal_t shortSize{};
    decimal_t totalUnrealizedPnL{};
    std::map<EnginePositionStatus, size_t> statusCounts;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

struct FundSufficiency : public JsonSerializable
{
    decimal_t fundBalance;
    // Loss of the inventory at the mark price, zero when in profit.
    decimal_t exposure;
    decimal_t shortfall;
    bool sufficient;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

struct ReduceEffect
{
    decimal_t realizedPnL;
    decimal_t remainingSize;
    EnginePositionStatus status;
};

//-------------------------------------------------------------------------

class PositionLiquidationEngine : public util::DebugLogger
{
public:
    explicit PositionLiquidationEngine(size_t historyCapacity = kDefaultHistoryCapacity)
        : m_closed(historyCapacity), m_history(historyCapacity)
    {}

    [[nodiscard]] const std::vector<EnginePosition>& positions() const noexcept { return m_positions; }
    // Most recent history entries and completed positions, oldest first.
    [[nodiscard]] const boost::circular_buffer<InventoryHistoryEntry>& history() const noexcept
    {
        return m_history;
    }
    [[nodiscard]] const boost::circular_buffer<EnginePosition>& closedPositions() const noexcept
    {
        return m_closed;
    }
    [[nodiscard]] bool empty() const noexcept { return m_positions.empty(); }
    // Cumulative PnL realized by reducing engine positions.
    [[nodiscard]] decimal_t realizedPnL() const noexcept { return m_realizedPnL; }

    const EnginePosition& receivePosition(
        const position::Position& position,
        decimal_t bankruptcyPrice,
        decimal_t markPrice,
        Timestamp timestamp);

    [[nodiscard]] const EnginePosition* find(EnginePositionId id) const noexcept;
    [[nodiscard]] decimal_t positionPnL(EnginePositionId id, decimal_t markPrice) const;

    void setStatus(EnginePositionId id, EnginePositionStatus status, Timestamp timestamp);

    /**
     * Closes size of the engine position at price. The position is completed
     * and moved out of the active inventory once its size reaches zero.
     */
    ReduceEffect reduce(EnginePositionId id, decimal_t size, decimal_t price, Timestamp timestamp);

    [[nodiscard]] decimal_t totalSize(PositionSide side) const noexcept;
    [[nodiscard]] decimal_t totalUnrealizedPnL(decimal_t markPrice) const noexcept;
    [[nodiscard]] InventorySummary summary(decimal_t markPrice) const;
    [[nodiscard]] FundSufficiency checkInsuranceFundSufficiency(
        decimal_t markPrice, decimal_t fundBalance) const;

    void clear() noexcept;

private:
    [[nodiscard]] std::vector<EnginePosition>::iterator findIt(EnginePositionId id);

    std::vector<EnginePosition> m_positions;
    boost::circular_buffer<EnginePosition> m_closed;
    boost::circular_buffer<InventoryHistoryEntry> m_history;
    decimal_t m_realizedPnL{};
    EnginePositionId m_nextId{1};
};

//-------------------------------------------------------------------------

}  // namespace derivsim::liquidation

//-------------------------------------------------------------------------
