/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/serialization/JsonSerializable.hpp"
#include "derivsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace derivsim::position
{

//-------------------------------------------------------------------------

class Position
{
public:
    Position(
        UserId userId,
        PositionSide side,
        decimal_t size,
        decimal_t entryPrice,
        decimal_t leverage,
        decimal_t margin,
        Timestamp openedAt);

    [[nodiscard]] const UserId& userId() const noexcept { return m_userId; }
    [[nodiscard]] PositionSide side() const noexcept { return m_side; }
    [[nodiscard]] decimal_t size() const noexcept { return m_size; }
    [[nodiscard]] decimal_t avgEntryPrice() const noexcept { return m_avgEntryPrice; }
    [[nodiscard]] decimal_t leverage() const noexcept { return m_leverage; }
    [[nodiscard]] decimal_t margin() const noexcept { return m_margin; }
    [[nodiscard]] Timestamp openedAt() const noexcept { return m_openedAt; }
    [[nodiscard]] uint32_t fillCount() const noexcept { return m_fillCount; }

    [[nodiscard]] decimal_t liquidationPrice() const;
    [[nodiscard]] decimal_t bankruptcyPrice() const;
    [[nodiscard]] decimal_t unrealizedPnL(decimal_t markPrice) const noexcept;
    [[nodiscard]] decimal_t positionValue(decimal_t markPrice) const noexcept;
    [[nodiscard]] decimal_t maintenanceMargin(decimal_t markPrice) const noexcept;
    [[nodiscard]] bool shouldLiquidate(decimal_t markPrice) const;

    // Adds to the position at the given price, averaging the entry.
    void increase(decimal_t size, decimal_t price, decimal_t margin);
    // Removes size at the entry price, returns the margin released pro rata.
    [[nodiscard]] decimal_t reduce(decimal_t size);

    void jsonSerialize(
        rapidjson::Document& json, decimal_t markPrice, const std::string& key = {}) const;

private:
    UserId m_userId;
    PositionSide m_side;
    decimal_t m_size;
    decimal_t m_avgEntryPrice;
    decimal_t m_leverage;
    decimal_t m_margin;
    Timestamp m_openedAt;
    uint32_t m_fillCount{1};
};

//-------------------------------------------------------------------------

}  // namespace derivsim::position

//-------------------------------------------------------------------------
