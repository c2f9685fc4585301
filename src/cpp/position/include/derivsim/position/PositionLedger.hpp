/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/position/Position.hpp"
#include "derivsim/position/User.hpp"
#include "derivsim/util/DebugLogger.hpp"

#include <map>

//-------------------------------------------------------------------------

namespace derivsim::position
{

//-------------------------------------------------------------------------

// What a single fill did to one user's position and account.
struct FillEffect
{
    decimal_t closedSize{};
    decimal_t openedSize{};
    decimal_t realizedPnL{};
    decimal_t releasedMargin{};
    decimal_t lockedMargin{};
    // Loss beyond the released margin and available balance, not charged to the user.
    decimal_t uncoveredLoss{};
    bool flipped = false;
};

//-------------------------------------------------------------------------

/**
 * One-way mode position book: at most one position per user, keyed (and
 * iterated) by user id.
 */
class PositionLedger : public util::DebugLogger
{
public:
    using PositionMap = std::map<UserId, Position>;

    PositionLedger() noexcept = default;

    [[nodiscard]] const PositionMap& positions() const noexcept { return m_positions; }
    [[nodiscard]] const Position* find(const UserId& userId) const noexcept;
    [[nodiscard]] bool contains(const UserId& userId) const noexcept;
    [[nodiscard]] size_t size() const noexcept { return m_positions.size(); }

    /**
     * Applies one side of a trade to the user's position and account:
     *   - opens a position when there is none,
     *   - averages the entry price when the fill is on the same side,
     *   - closes (part of) the position otherwise, realizing PnL into the
     *     available balance and releasing margin pro rata; a loss larger
     *     than the released margin plus the available balance is capped at
     *     that amount and the rest reported as uncoveredLoss; any excess over
     *     the current size opens a position on the other side at the fill
     *     price.
     * The opening portion locks initialMargin(size, price, leverage).
     */
    FillEffect applyFill(
        User& user,
        OrderSide side,
        decimal_t size,
        decimal_t price,
        decimal_t leverage,
        Timestamp timestamp);

    // Closes the given size of the user's position at price (ADL).
    FillEffect closeAt(User& user, decimal_t size, decimal_t price, Timestamp timestamp);

    // Removes the user's position without settling it (liquidation transfer).
    [[nodiscard]] Position extract(const UserId& userId);

    [[nodiscard]] decimal_t totalSize(PositionSide side) const noexcept;
    [[nodiscard]] decimal_t totalUnrealizedPnL(decimal_t markPrice) const noexcept;

    void clear() noexcept { m_positions.clear(); }

private:
    [[nodiscard]] decimal_t lockOpeningMargin(
        User& user, decimal_t size, decimal_t price, decimal_t leverage);

    PositionMap m_positions;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::position

//-------------------------------------------------------------------------
