/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/exchange/ExchangeState.hpp"

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

inline const decimal_t kSizeTolerance = DEC(0.001);
inline const decimal_t kPnLTolerance = 10_dec;

/**
 * System-wide balance figures across user and engine positions:
 *   - long and short open interest must match,
 *   - unrealized plus realized PnL of all participants nets to zero, the
 *     insurance fund counting as a participant for the user losses it
 *     absorbed,
 *   - systemEquity = sum of balances + insurance fund + unrealized PnL only
 *     changes through manual insurance fund adjustments.
 */
struct ZeroSumReport : public JsonSerializable
{
    decimal_t userLongSize{};
    decimal_t userShortSize{};
    decimal_t engineLongSize{};
    decimal_t engineShortSize{};
    decimal_t longSize{};
    decimal_t shortSize{};
    decimal_t sizeImbalance{};
    decimal_t userUnrealizedPnL{};
    decimal_t engineUnrealizedPnL{};
    decimal_t unrealizedPnL{};
    decimal_t realizedPnL{};
    decimal_t absorbedLosses{};
    decimal_t netPnL{};
    decimal_t totalUserBalance{};
    decimal_t insuranceFund{};
    decimal_t systemValue{};
    decimal_t systemEquity{};
    decimal_t expectedSystemEquity{};
    decimal_t equityDrift{};
    bool sizeBalanced = true;
    bool pnlBalanced = true;
    bool equityConserved = true;
    decimal_t markPrice{};
    Timestamp timestamp{};

    [[nodiscard]] bool ok() const noexcept { return sizeBalanced && pnlBalanced && equityConserved; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

[[nodiscard]] ZeroSumReport checkZeroSum(const ExchangeState& state);

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
