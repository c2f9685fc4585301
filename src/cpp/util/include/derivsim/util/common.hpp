/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/decimal/decimal.hpp"

#include <boost/signals2.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <range/v3/all.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace bs2 = boost::signals2;
namespace views = ranges::views;

using namespace derivsim::literals;

//-------------------------------------------------------------------------

namespace derivsim
{

using Timestamp = uint64_t;
using OrderId = uint32_t;
using TradeId = uint32_t;
using EnginePositionId = uint32_t;
using UserId = std::string;

// Entries kept by the fund, liquidation, ADL and inventory histories.
inline constexpr size_t kDefaultHistoryCapacity = 1000;

template<typename SlotType>
requires requires { typename std::function<SlotType>; }
using UnsyncSignal = bs2::signal_type<SlotType, bs2::keywords::mutex_type<bs2::dummy_mutex>>::type;

//-------------------------------------------------------------------------

enum class OrderSide : uint32_t
{
    BUY,
    SELL
};

enum class PositionSide : uint32_t
{
    LONG,
    SHORT
};

[[nodiscard]] constexpr std::string_view OrderSide2StrView(OrderSide side) noexcept
{
    return magic_enum::enum_name(side);
}

[[nodiscard]] constexpr std::string_view PositionSide2StrView(PositionSide side) noexcept
{
    return magic_enum::enum_name(side);
}

[[nodiscard]] constexpr OrderSide opposite(OrderSide side) noexcept
{
    return side == OrderSide::BUY ? OrderSide::SELL : OrderSide::BUY;
}

[[nodiscard]] constexpr PositionSide opposite(PositionSide side) noexcept
{
    return side == PositionSide::LONG ? PositionSide::SHORT : PositionSide::LONG;
}

[[nodiscard]] constexpr PositionSide toPositionSide(OrderSide side) noexcept
{
    return side == OrderSide::BUY ? PositionSide::LONG : PositionSide::SHORT;
}

[[nodiscard]] constexpr OrderSide closingSide(PositionSide side) noexcept
{
    return side == PositionSide::LONG ? OrderSide::SELL : OrderSide::BUY;
}

// +1 for long, -1 for short.
[[nodiscard]] inline decimal_t sign(PositionSide side) noexcept
{
    return side == PositionSide::LONG ? 1_dec : -1_dec;
}

}  // namespace derivsim

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<derivsim::OrderSide>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(derivsim::OrderSide side, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", derivsim::OrderSide2StrView(side));
    }
};

template<>
struct fmt::formatter<derivsim::PositionSide>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(derivsim::PositionSide side, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", derivsim::PositionSide2StrView(side));
    }
};

//-------------------------------------------------------------------------
