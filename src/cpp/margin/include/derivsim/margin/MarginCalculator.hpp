/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace derivsim::margin
{

//-------------------------------------------------------------------------

inline const decimal_t kMaintenanceMarginRate = DEC(0.005);

//-------------------------------------------------------------------------

[[nodiscard]] decimal_t positionValue(decimal_t size, decimal_t price) noexcept;

// size * price / leverage
[[nodiscard]] decimal_t initialMargin(decimal_t size, decimal_t price, decimal_t leverage);

// size * price * mmr
[[nodiscard]] decimal_t maintenanceMargin(decimal_t size, decimal_t price) noexcept;

// long:  entry * (1 - 1/leverage + mmr)
// short: entry * (1 + 1/leverage - mmr)
[[nodiscard]] decimal_t liquidationPrice(
    PositionSide side, decimal_t entryPrice, decimal_t leverage);

// long:  entry * (1 - 1/leverage)
// short: entry * (1 + 1/leverage)
[[nodiscard]] decimal_t bankruptcyPrice(
    PositionSide side, decimal_t entryPrice, decimal_t leverage);

// long:  mark <= liquidation price
// short: mark >= liquidation price
[[nodiscard]] bool shouldLiquidate(
    PositionSide side, decimal_t liquidationPrice, decimal_t markPrice) noexcept;

[[nodiscard]] decimal_t unrealizedPnL(
    PositionSide side, decimal_t size, decimal_t entryPrice, decimal_t markPrice) noexcept;

// (available + uPnL) / usedMargin * 100, kInfinity for zero used margin.
[[nodiscard]] decimal_t marginRatio(
    decimal_t availableBalance, decimal_t unrealizedPnL, decimal_t usedMargin) noexcept;

//-------------------------------------------------------------------------

}  // namespace derivsim::margin

//-------------------------------------------------------------------------
