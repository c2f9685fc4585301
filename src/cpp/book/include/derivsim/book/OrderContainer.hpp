/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/book/TickContainer.hpp"

#include <deque>

//-------------------------------------------------------------------------

namespace derivsim::book
{

//-------------------------------------------------------------------------

// Price levels of one side, ascending by price.
class OrderContainer : public std::deque<TickContainer>
{
public:
    [[nodiscard]] decimal_t volume() const noexcept { return m_volume; }

    void updateVolume(decimal_t deltaVolume) noexcept { m_volume += deltaVolume; }

    void reset() noexcept
    {
        clear();
        m_volume = {};
    }

private:
    decimal_t m_volume{};
};

//-------------------------------------------------------------------------

}  // namespace derivsim::book

//-------------------------------------------------------------------------
