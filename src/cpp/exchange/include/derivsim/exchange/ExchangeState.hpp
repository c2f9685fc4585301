/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/adl/ADLEngine.hpp"
#include "derivsim/exchange/ExchangeConfig.hpp"
#include "derivsim/liquidation/LiquidationEngine.hpp"
#include "derivsim/margin/MarginMonitor.hpp"
#include "derivsim/matching/MatchingEngine.hpp"

#include <boost/circular_buffer.hpp>

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

/**
 * The whole mutable state of the exchange. Owned by a single Exchange and
 * rebuilt from its configuration on reset.
 */
struct ExchangeState
{
    position::UserMap users;
    position::PositionLedger ledger;
    book::OrderBook book;
    matching::MatchingEngine matchingEngine;
    liquidation::InsuranceFund insuranceFund;
    liquidation::PositionLiquidationEngine inventory;
    liquidation::LiquidationEngine liquidationEngine;
    adl::ADLEngine adlEngine;
    margin::MarginMonitor marginMonitor;
    // Most recent trades, oldest first.
    boost::circular_buffer<matching::Trade> tradeHistory;
    decimal_t markPrice;
    decimal_t indexPrice;
    decimal_t fundingRate;
    bool liquidationEnabled;
    bool adlEnabled;
    // Sum of balances and insurance fund at construction.
    decimal_t initialSystemValue;
    Timestamp timestamp{};

    explicit ExchangeState(const ExchangeConfig& config);

    ExchangeState(const ExchangeState&) = delete;
    ExchangeState& operator=(const ExchangeState&) = delete;

    [[nodiscard]] position::User* findUser(const UserId& userId) noexcept;
    [[nodiscard]] const position::User* findUser(const UserId& userId) const noexcept;

    void setDebug(bool flag) noexcept;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
