/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/liquidation/InsuranceFund.hpp"
#include "derivsim/liquidation/PositionLiquidationEngine.hpp"
#include "derivsim/position/PositionLedger.hpp"

#include <boost/circular_buffer.hpp>

//-------------------------------------------------------------------------

namespace derivsim::adl
{

//-------------------------------------------------------------------------

inline constexpr uint32_t kIndicatorLevels = 5;

struct ADLCandidate
{
    UserId userId;
    PositionSide side;
    decimal_t size;
    decimal_t entryPrice;
    decimal_t unrealizedPnL;
    decimal_t positionValue;
    decimal_t score;
    // 1-based position in the ranking.
    uint32_t rank;
    // 5 for the top quintile of the ranking down to 1 for the bottom one.
    uint32_t indicator;
};

struct ADLPlanEntry
{
    UserId userId;
    decimal_t size;
    decimal_t price;
};

struct ADLPlan
{
    std::vector<ADLPlanEntry> entries;
    decimal_t totalPlanned{};
    decimal_t shortfall{};
};

struct ADLResult : public JsonSerializable
{
    bool success;
    EnginePositionId enginePositionId;
    UserId originalUserId;
    PositionSide side;
    decimal_t markPrice;
    ADLPlan plan;
    decimal_t executedSize;
    decimal_t shortfall;
    decimal_t remainingSize;
    liquidation::EnginePositionStatus status;
    // Realized PnL of the engine position, settled against the insurance fund.
    decimal_t engineRealizedPnL;
    decimal_t insuranceFundBefore;
    decimal_t insuranceFundAfter;
    Timestamp timestamp;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

struct ADLQueue : public JsonSerializable
{
    std::vector<ADLCandidate> longs;
    std::vector<ADLCandidate> shorts;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

/**
 * Auto-deleveraging: flattens exchange-held positions by force-closing the
 * most profitable and most leveraged opposite-side positions at the mark
 * price.
 */
class ADLEngine : public util::DebugLogger
{
public:
    explicit ADLEngine(size_t historyCapacity = kDefaultHistoryCapacity)
        : m_history(historyCapacity)
    {}

    // Most recent executions, oldest first.
    [[nodiscard]] const boost::circular_buffer<ADLResult>& history() const noexcept
    {
        return m_history;
    }

    /**
     * Ranks profitable user positions of the given side by
     *   score = (uPnL / value) * (value / (availableBalance + uPnL)),
     * descending, ties broken by user id. Margin locked in the position
     * does not count as equity behind it.
     */
    [[nodiscard]] std::vector<ADLCandidate> rank(
        PositionSide side,
        const position::PositionLedger& ledger,
        const position::UserMap& users,
        decimal_t markPrice) const;

    // Greedy allocation of the engine position's size over the ranking.
    [[nodiscard]] ADLPlan plan(
        const liquidation::EnginePosition& enginePosition,
        const std::vector<ADLCandidate>& ranked,
        decimal_t markPrice) const;

    ADLResult execute(
        EnginePositionId enginePositionId,
        liquidation::PositionLiquidationEngine& inventory,
        position::PositionLedger& ledger,
        position::UserMap& users,
        liquidation::InsuranceFund& fund,
        decimal_t markPrice,
        Timestamp timestamp);

    [[nodiscard]] ADLQueue adlQueue(
        const position::PositionLedger& ledger,
        const position::UserMap& users,
        decimal_t markPrice) const;

    void clear() noexcept { m_history.clear(); }

private:
    boost::circular_buffer<ADLResult> m_history;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::adl

//-------------------------------------------------------------------------
