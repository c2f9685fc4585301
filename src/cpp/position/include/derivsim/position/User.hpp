/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace derivsim::position
{

//-------------------------------------------------------------------------

/**
 * Cash account of a trader. Collateral is split into a free part
 * (availableBalance) and a part locked as position margin (usedMargin).
 * Unrealized PnL is not part of the account; it is derived from the
 * user's position and the mark price.
 */
class User
{
public:
    User(UserId id, std::string name, decimal_t balance, decimal_t leverage);

    [[nodiscard]] const UserId& id() const noexcept { return m_id; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] decimal_t availableBalance() const noexcept { return m_availableBalance; }
    [[nodiscard]] decimal_t usedMargin() const noexcept { return m_usedMargin; }
    [[nodiscard]] decimal_t totalBalance() const noexcept { return m_availableBalance + m_usedMargin; }
    [[nodiscard]] decimal_t realizedPnL() const noexcept { return m_realizedPnL; }
    [[nodiscard]] decimal_t leverage() const noexcept { return m_leverage; }

    void lockMargin(decimal_t amount);
    void releaseMargin(decimal_t amount);
    void realizePnL(decimal_t pnl) noexcept;
    [[nodiscard]] decimal_t forfeitMargin() noexcept;
    void setLeverage(decimal_t leverage);

private:
    UserId m_id;
    std::string m_name;
    decimal_t m_availableBalance;
    decimal_t m_usedMargin{};
    decimal_t m_realizedPnL{};
    decimal_t m_leverage;
};

using UserMap = std::map<UserId, User>;

//-------------------------------------------------------------------------

}  // namespace derivsim::position

//-------------------------------------------------------------------------
