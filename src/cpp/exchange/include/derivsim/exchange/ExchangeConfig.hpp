/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/margin/MarginMonitor.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

struct RiskLimits
{
    decimal_t maxPositionSize = 10_dec;
    decimal_t maxLeverage = 100_dec;
    decimal_t maxPositionValue = 1'000'000_dec;
    uint32_t maxUserPositions = 1;
    decimal_t minOrderSize = DEC(0.001);
};

struct UserConfig
{
    UserId id;
    std::string name;
    decimal_t balance;
};

struct ExchangeConfig
{
    decimal_t markPrice = 50'000_dec;
    decimal_t indexPrice = 50'000_dec;
    // Displayed only, never settled.
    decimal_t fundingRate = DEC(0.0001);
    decimal_t insuranceFund = 1'000'000_dec;
    decimal_t insuranceFundRiskThreshold = 100'000_dec;
    decimal_t defaultLeverage = 10_dec;
    bool liquidationEnabled = true;
    bool adlEnabled = true;
    bool strictInvariants = false;
    size_t tradeHistory = 100;
    size_t bookDepth = 20;
    // Capacity of the fund, liquidation, ADL and inventory histories.
    size_t historyCapacity = kDefaultHistoryCapacity;
    RiskLimits riskLimits;
    margin::MarginCallThresholds marginCalls;
    std::vector<UserConfig> users;

    [[nodiscard]] static ExchangeConfig defaults();
};

[[nodiscard]] ExchangeConfig makeExchangeConfig(pugi::xml_node node);

[[nodiscard]] ExchangeConfig loadExchangeConfig(const fs::path& path);

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
