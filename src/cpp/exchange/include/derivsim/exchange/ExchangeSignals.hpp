/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/adl/ADLEngine.hpp"
#include "derivsim/book/Order.hpp"
#include "derivsim/exchange/ZeroSum.hpp"
#include "derivsim/liquidation/LiquidationEngine.hpp"
#include "derivsim/margin/MarginMonitor.hpp"
#include "derivsim/matching/Trade.hpp"

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

struct ExchangeSignals
{
    UnsyncSignal<void(const book::Order&)> orderPlaced;
    UnsyncSignal<void(const book::Order&, Timestamp)> orderCancelled;
    UnsyncSignal<void(const matching::Trade&)> trade;
    UnsyncSignal<void(decimal_t, Timestamp)> markPrice;
    UnsyncSignal<void(const margin::MarginCall&)> marginCall;
    UnsyncSignal<void(const liquidation::LiquidationResult&)> liquidation;
    UnsyncSignal<void(const adl::ADLResult&)> adl;
    UnsyncSignal<void(const liquidation::FundEntry&)> fundAdjustment;
    UnsyncSignal<void(const ZeroSumReport&)> invariantViolation;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
