/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/position/PositionLedger.hpp"

#include "derivsim/margin/MarginCalculator.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace derivsim::position
{

//-------------------------------------------------------------------------

const Position* PositionLedger::find(const UserId& userId) const noexcept
{
    auto it = m_positions.find(userId);
    return it != m_positions.end() ? &it->second : nullptr;
}

//-------------------------------------------------------------------------

bool PositionLedger::contains(const UserId& userId) const noexcept
{
    return m_positions.contains(userId);
}

//-------------------------------------------------------------------------

FillEffect PositionLedger::applyFill(
    User& user,
    OrderSide side,
    decimal_t size,
    decimal_t price,
    decimal_t leverage,
    Timestamp timestamp)
{
    if (!(size > 0_dec) || !(price > 0_dec)) {
        throw std::invalid_argument{fmt::format(
            "{}: Invalid fill {}@{} for user '{}'",
            std::source_location::current().function_name(),
            size,
            price,
            user.id())};
    }

    FillEffect effect;
    const PositionSide fillSide = toPositionSide(side);
    auto it = m_positions.find(user.id());

    if (it == m_positions.end()) {
        effect.openedSize = size;
        effect.lockedMargin = lockOpeningMargin(user, size, price, leverage);
        m_positions.emplace(
            user.id(),
            Position{user.id(), fillSide, size, price, leverage, effect.lockedMargin, timestamp});
        logDebug(
            "{} | USER {} : OPENED {} {}@{} x{}", timestamp, user.id(), fillSide, size, price, leverage);
        return effect;
    }

    auto& position = it->second;

    if (position.side() == fillSide) {
        effect.openedSize = size;
        effect.lockedMargin = lockOpeningMargin(user, size, price, leverage);
        position.increase(size, price, effect.lockedMargin);
        logDebug(
            "{} | USER {} : INCREASED {} BY {}@{} -> {}@{}",
            timestamp, user.id(), fillSide, size, price, position.size(), position.avgEntryPrice());
        return effect;
    }

    const decimal_t closedSize = std::min(size, position.size());
    const PositionSide closedSide = position.side();
    effect.closedSize = closedSize;
    effect.realizedPnL = margin::unrealizedPnL(
        closedSide, closedSize, position.avgEntryPrice(), price);
    effect.releasedMargin = position.reduce(closedSize);
    user.releaseMargin(effect.releasedMargin);
    if (-effect.realizedPnL > user.availableBalance()) {
        effect.uncoveredLoss = -effect.realizedPnL - user.availableBalance();
        effect.realizedPnL = -user.availableBalance();
        spdlog::warn(
            "User '{}' cannot cover loss closing {}@{}: uncovered {}",
            user.id(), closedSize, price, effect.uncoveredLoss);
    }
    user.realizePnL(effect.realizedPnL);
    logDebug(
        "{} | USER {} : CLOSED {} {}@{} REALIZING {}",
        timestamp, user.id(), closedSide, closedSize, price, effect.realizedPnL);

    if (position.size() == 0_dec) {
        m_positions.erase(it);
    }

    const decimal_t remainder = size - closedSize;
    if (remainder > 0_dec) {
        effect.flipped = true;
        effect.openedSize = remainder;
        effect.lockedMargin = lockOpeningMargin(user, remainder, price, leverage);
        m_positions.emplace(
            user.id(),
            Position{user.id(), fillSide, remainder, price, leverage, effect.lockedMargin, timestamp});
        logDebug(
            "{} | USER {} : FLIPPED TO {} {}@{}", timestamp, user.id(), fillSide, remainder, price);
    }

    return effect;
}

//-------------------------------------------------------------------------

FillEffect PositionLedger::closeAt(User& user, decimal_t size, decimal_t price, Timestamp timestamp)
{
    const auto position = find(user.id());
    if (position == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: User '{}' has no position to close",
            std::source_location::current().function_name(),
            user.id())};
    }
    if (size > position->size()) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot close {} of position of '{}' with size {}",
            std::source_location::current().function_name(),
            size,
            user.id(),
            position->size())};
    }
    return applyFill(
        user, closingSide(position->side()), size, price, position->leverage(), timestamp);
}

//-------------------------------------------------------------------------

Position PositionLedger::extract(const UserId& userId)
{
    auto node = m_positions.extract(userId);
    if (node.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: User '{}' has no position",
            std::source_location::current().function_name(),
            userId)};
    }
    return std::move(node.mapped());
}

//-------------------------------------------------------------------------

decimal_t PositionLedger::totalSize(PositionSide side) const noexcept
{
    decimal_t total{};
    for (const auto& position : m_positions | views::values) {
        if (position.side() == side) {
            total += position.size();
        }
    }
    return total;
}

//-------------------------------------------------------------------------

decimal_t PositionLedger::totalUnrealizedPnL(decimal_t markPrice) const noexcept
{
    decimal_t total{};
    for (const auto& position : m_positions | views::values) {
        total += position.unrealizedPnL(markPrice);
    }
    return total;
}

//-------------------------------------------------------------------------

decimal_t PositionLedger::lockOpeningMargin(
    User& user, decimal_t size, decimal_t price, decimal_t leverage)
{
    const decimal_t required = margin::initialMargin(size, price, leverage);
    const decimal_t locked = std::max(std::min(required, user.availableBalance()), 0_dec);
    if (locked < required) {
        spdlog::warn(
            "User '{}' lacks margin for {}@{} x{}: required {}, locked {}",
            user.id(), size, price, leverage, required, locked);
    }
    user.lockMargin(locked);
    return locked;
}

//-------------------------------------------------------------------------

}  // namespace derivsim::position

//-------------------------------------------------------------------------
