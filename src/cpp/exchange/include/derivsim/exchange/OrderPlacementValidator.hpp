/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/book/OrderBook.hpp"
#include "derivsim/exchange/Command.hpp"
#include "derivsim/exchange/ExchangeConfig.hpp"
#include "derivsim/position/PositionLedger.hpp"

#include <expected>

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

enum class OrderErrorCode : uint32_t
{
    UNKNOWN_USER,
    INVALID_SIZE,
    MIN_ORDER_SIZE,
    INVALID_PRICE,
    INVALID_LEVERAGE,
    MAX_POSITION_SIZE,
    MAX_POSITION_VALUE,
    MAX_USER_POSITIONS,
    INSUFFICIENT_MARGIN,
    EMPTY_BOOK
};

[[nodiscard]] constexpr std::string_view OrderErrorCode2StrView(OrderErrorCode ec) noexcept
{
    return magic_enum::enum_name(ec);
}

//-------------------------------------------------------------------------

class OrderPlacementValidator
{
public:
    struct Result
    {
        decimal_t leverage;
        // Limit price, or the best opposite price for market orders.
        decimal_t referencePrice;
        // Part of the order that would open (or extend) a position.
        decimal_t openingSize;
        decimal_t requiredMargin;
    };

    using ExpectedResult = std::expected<Result, OrderErrorCode>;

    explicit OrderPlacementValidator(const RiskLimits& limits) noexcept;

    [[nodiscard]] auto& limits(this auto&& self) noexcept { return self.m_limits; }

    [[nodiscard]] ExpectedResult validate(
        const PlaceOrder& order,
        const position::UserMap& users,
        const position::PositionLedger& ledger,
        const book::OrderBook& book) const;

    // Initial margin of the user's resting orders.
    [[nodiscard]] static decimal_t committedMargin(
        const UserId& userId, const book::OrderBook& book);

private:
    RiskLimits m_limits;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<derivsim::exchange::OrderErrorCode>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(derivsim::exchange::OrderErrorCode ec, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", derivsim::exchange::OrderErrorCode2StrView(ec));
    }
};

//-------------------------------------------------------------------------
