/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/margin/MarginCalculator.hpp"

//-------------------------------------------------------------------------

namespace derivsim::margin
{

//-------------------------------------------------------------------------

namespace
{

void validateLeverage(decimal_t leverage, std::source_location sl)
{
    if (!(leverage > 0_dec)) {
        throw std::invalid_argument{fmt::format(
            "{}: leverage should be > 0, was {}", sl.function_name(), leverage)};
    }
}

}  // namespace

//-------------------------------------------------------------------------

decimal_t positionValue(decimal_t size, decimal_t price) noexcept
{
    return size * price;
}

//-------------------------------------------------------------------------

decimal_t initialMargin(decimal_t size, decimal_t price, decimal_t leverage)
{
    validateLeverage(leverage, std::source_location::current());
    return size * price / leverage;
}

//-------------------------------------------------------------------------

decimal_t maintenanceMargin(decimal_t size, decimal_t price) noexcept
{
    return size * price * kMaintenanceMarginRate;
}

//-------------------------------------------------------------------------

decimal_t liquidationPrice(PositionSide side, decimal_t entryPrice, decimal_t leverage)
{
    validateLeverage(leverage, std::source_location::current());
    const decimal_t invLeverage = 1_dec / leverage;
    return side == PositionSide::LONG
        ? entryPrice * (1_dec - invLeverage + kMaintenanceMarginRate)
        : entryPrice * (1_dec + invLeverage - kMaintenanceMarginRate);
}

//-------------------------------------------------------------------------

decimal_t bankruptcyPrice(PositionSide side, decimal_t entryPrice, decimal_t leverage)
{
    validateLeverage(leverage, std::source_location::current());
    const decimal_t invLeverage = 1_dec / leverage;
    return side == PositionSide::LONG
        ? entryPrice * util::dec1m(invLeverage)
        : entryPrice * util::dec1p(invLeverage);
}

//-------------------------------------------------------------------------

bool shouldLiquidate(PositionSide side, decimal_t liquidationPrice, decimal_t markPrice) noexcept
{
    return side == PositionSide::LONG
        ? markPrice <= liquidationPrice
        : markPrice >= liquidationPrice;
}

//-------------------------------------------------------------------------

decimal_t unrealizedPnL(
    PositionSide side, decimal_t size, decimal_t entryPrice, decimal_t markPrice) noexcept
{
    return (markPrice - entryPrice) * size * sign(side);
}

//-------------------------------------------------------------------------

decimal_t marginRatio(
    decimal_t availableBalance, decimal_t unrealizedPnL, decimal_t usedMargin) noexcept
{
    if (usedMargin == 0_dec) {
        return kInfinity;
    }
    return (availableBalance + unrealizedPnL) / usedMargin * 100_dec;
}

//-------------------------------------------------------------------------

}  // namespace derivsim::margin

//-------------------------------------------------------------------------
