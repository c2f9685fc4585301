/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/book/OrderBook.hpp"
#include "derivsim/liquidation/InsuranceFund.hpp"
#include "derivsim/liquidation/PositionLiquidationEngine.hpp"
#include "derivsim/position/PositionLedger.hpp"

#include <boost/circular_buffer.hpp>

//-------------------------------------------------------------------------

namespace derivsim::liquidation
{

//-------------------------------------------------------------------------

struct LiquidationCandidate : public JsonSerializable
{
    UserId userId;
    PositionSide side;
    decimal_t size;
    decimal_t entryPrice;
    decimal_t liquidationPrice;
    decimal_t markPrice;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

struct LiquidationResult : public JsonSerializable
{
    UserId userId;
    EnginePositionId enginePositionId;
    PositionSide side;
    decimal_t size;
    decimal_t entryPrice;
    decimal_t liquidationPrice;
    decimal_t bankruptcyPrice;
    decimal_t markPrice;
    decimal_t forfeitedMargin;
    // Loss of the position at the mark price, zero when in profit.
    decimal_t lossAtMark;
    decimal_t coveredByMargin;
    decimal_t insuranceFundShortfall;
    decimal_t insuranceFundSurplus;
    decimal_t insuranceFundBefore;
    decimal_t insuranceFundAfter;
    std::vector<OrderId> cancelledOrders;
    bool manual;
    Timestamp timestamp;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

/**
 * Detects positions past their liquidation price and transfers them into the
 * exchange inventory. The user's whole used margin is forfeited to the
 * insurance fund; the engine position carries the exposure from there on.
 */
class LiquidationEngine : public util::DebugLogger
{
public:
    explicit LiquidationEngine(size_t historyCapacity = kDefaultHistoryCapacity)
        : m_history(historyCapacity)
    {}

    // Most recent liquidations, oldest first.
    [[nodiscard]] const boost::circular_buffer<LiquidationResult>& history() const noexcept
    {
        return m_history;
    }

    // Candidates in user id order.
    [[nodiscard]] std::vector<LiquidationCandidate> detect(
        const position::PositionLedger& ledger, decimal_t markPrice) const;

    LiquidationResult liquidate(
        position::User& user,
        position::PositionLedger& ledger,
        book::OrderBook& book,
        PositionLiquidationEngine& inventory,
        InsuranceFund& fund,
        decimal_t markPrice,
        Timestamp timestamp,
        bool manual = false);

    void clear() noexcept { m_history.clear(); }

private:
    boost::circular_buffer<LiquidationResult> m_history;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::liquidation

//-------------------------------------------------------------------------
