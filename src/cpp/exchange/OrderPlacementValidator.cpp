/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/exchange/OrderPlacementValidator.hpp"

#include "derivsim/margin/MarginCalculator.hpp"

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

OrderPlacementValidator::OrderPlacementValidator(const RiskLimits& limits) noexcept
    : m_limits{limits}
{}

//-------------------------------------------------------------------------

OrderPlacementValidator::ExpectedResult OrderPlacementValidator::validate(
    const PlaceOrder& order,
    const position::UserMap& users,
    const position::PositionLedger& ledger,
    const book::OrderBook& book) const
{
    auto userIt = users.find(order.userId);
    if (userIt == users.end())
        return std::unexpected{OrderErrorCode::UNKNOWN_USER};
    const auto& user = userIt->second;

    if (!util::isFinite(order.size) || order.size <= 0_dec)
        return std::unexpected{OrderErrorCode::INVALID_SIZE};
    if (order.size < m_limits.minOrderSize)
        return std::unexpected{OrderErrorCode::MIN_ORDER_SIZE};

    const decimal_t leverage = order.leverage.value_or(user.leverage());
    if (!util::isFinite(leverage) || leverage < 1_dec || leverage > m_limits.maxLeverage)
        return std::unexpected{OrderErrorCode::INVALID_LEVERAGE};

    decimal_t referencePrice;
    if (order.orderType == book::OrderType::LIMIT) {
        if (!order.price || !util::isFinite(*order.price) || *order.price <= 0_dec)
            return std::unexpected{OrderErrorCode::INVALID_PRICE};
        referencePrice = *order.price;
    } else {
        const auto& oppositeSide = order.side == OrderSide::BUY ? book.asks() : book.bids();
        if (oppositeSide.empty())
            return std::unexpected{OrderErrorCode::EMPTY_BOOK};
        referencePrice = order.side == OrderSide::BUY ? book.bestAsk() : book.bestBid();
    }

    // Size of the position the fill would leave, and the part of the order
    // that opens exposure rather than closing it.
    const PositionSide orderSide = toPositionSide(order.side);
    decimal_t resultingSize = order.size;
    decimal_t openingSize = order.size;
    if (const auto position = ledger.find(order.userId)) {
        if (position->side() == orderSide) {
            resultingSize = position->size() + order.size;
        } else if (order.size <= position->size()) {
            resultingSize = position->size() - order.size;
            openingSize = {};
        } else {
            resultingSize = order.size - position->size();
            openingSize = resultingSize;
        }
    } else if (m_limits.maxUserPositions == 0) {
        return std::unexpected{OrderErrorCode::MAX_USER_POSITIONS};
    }

    if (openingSize > 0_dec) {
        if (resultingSize > m_limits.maxPositionSize)
            return std::unexpected{OrderErrorCode::MAX_POSITION_SIZE};
        if (margin::positionValue(resultingSize, referencePrice) > m_limits.maxPositionValue)
            return std::unexpected{OrderErrorCode::MAX_POSITION_VALUE};
    }

    const decimal_t requiredMargin = openingSize > 0_dec
        ? margin::initialMargin(openingSize, referencePrice, leverage)
        : 0_dec;
    if (requiredMargin > user.availableBalance() - committedMargin(order.userId, book))
        return std::unexpected{OrderErrorCode::INSUFFICIENT_MARGIN};

    return Result{
        .leverage = leverage,
        .referencePrice = referencePrice,
        .openingSize = openingSize,
        .requiredMargin = requiredMargin
    };
}

//-------------------------------------------------------------------------

decimal_t OrderPlacementValidator::committedMargin(
    const UserId& userId, const book::OrderBook& book)
{
    decimal_t committed{};
    for (const auto& order : book.ordersOf(userId)) {
        committed += margin::initialMargin(order->size(), order->price(), order->leverage());
    }
    return committed;
}

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
