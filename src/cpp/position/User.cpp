/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/position/User.hpp"

//-------------------------------------------------------------------------

namespace derivsim::position
{

//-------------------------------------------------------------------------

User::User(UserId id, std::string name, decimal_t balance, decimal_t leverage)
    : m_id{std::move(id)}, m_name{std::move(name)}, m_availableBalance{balance}
{
    if (balance < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Initial balance of user '{}' cannot be negative, was {}",
            std::source_location::current().function_name(),
            m_id,
            balance)};
    }
    setLeverage(leverage);
}

//-------------------------------------------------------------------------

void User::lockMargin(decimal_t amount)
{
    if (amount < 0_dec || amount > m_availableBalance) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot lock {} of user '{}' with available balance {}",
            std::source_location::current().function_name(),
            amount,
            m_id,
            m_availableBalance)};
    }
    m_availableBalance -= amount;
    m_usedMargin += amount;
}

//-------------------------------------------------------------------------

void User::releaseMargin(decimal_t amount)
{
    if (amount < 0_dec || amount > m_usedMargin) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot release {} of user '{}' with used margin {}",
            std::source_location::current().function_name(),
            amount,
            m_id,
            m_usedMargin)};
    }
    m_usedMargin -= amount;
    m_availableBalance += amount;
}

//-------------------------------------------------------------------------

void User::realizePnL(decimal_t pnl) noexcept
{
    m_availableBalance += pnl;
    m_realizedPnL += pnl;
}

//-------------------------------------------------------------------------

decimal_t User::forfeitMargin() noexcept
{
    return std::exchange(m_usedMargin, decimal_t{});
}

//-------------------------------------------------------------------------

void User::setLeverage(decimal_t leverage)
{
    if (!(leverage > 0_dec)) {
        throw std::invalid_argument{fmt::format(
            "{}: Leverage of user '{}' should be > 0, was {}",
            std::source_location::current().function_name(),
            m_id,
            leverage)};
    }
    m_leverage = leverage;
}

//-------------------------------------------------------------------------

}  // namespace derivsim::position

//-------------------------------------------------------------------------
