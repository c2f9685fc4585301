/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/exchange/ExchangeState.hpp"

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

ExchangeState::ExchangeState(const ExchangeConfig& config)
    : insuranceFund{
          config.insuranceFund, config.insuranceFundRiskThreshold, config.historyCapacity},
      inventory{config.historyCapacity},
      liquidationEngine{config.historyCapacity},
      adlEngine{config.historyCapacity},
      marginMonitor{config.marginCalls},
      tradeHistory(config.tradeHistory),
      markPrice{config.markPrice},
      indexPrice{config.indexPrice},
      fundingRate{config.fundingRate},
      liquidationEnabled{config.liquidationEnabled},
      adlEnabled{config.adlEnabled},
      initialSystemValue{config.insuranceFund}
{
    for (const auto& user : config.users) {
        users.emplace(user.id, position::User{user.id, user.name, user.balance, config.defaultLeverage});
        initialSystemValue += user.balance;
    }
}

//-------------------------------------------------------------------------

position::User* ExchangeState::findUser(const UserId& userId) noexcept
{
    auto it = users.find(userId);
    return it != users.end() ? &it->second : nullptr;
}

//-------------------------------------------------------------------------

const position::User* ExchangeState::findUser(const UserId& userId) const noexcept
{
    auto it = users.find(userId);
    return it != users.end() ? &it->second : nullptr;
}

//-------------------------------------------------------------------------

void ExchangeState::setDebug(bool flag) noexcept
{
    ledger.setDebug(flag);
    matchingEngine.setDebug(flag);
    inventory.setDebug(flag);
    liquidationEngine.setDebug(flag);
    adlEngine.setDebug(flag);
    marginMonitor.setDebug(flag);
}

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
