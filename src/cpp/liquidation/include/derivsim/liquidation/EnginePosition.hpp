/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/serialization/JsonSerializable.hpp"
#include "derivsim/util/common.hpp"

//-------------------------------------------------------------------------

namespace derivsim::liquidation
{

//-------------------------------------------------------------------------

enum class EnginePositionStatus : uint32_t
{
    PENDING,
    PROCESSING,
    COMPLETED
};

[[nodiscard]] constexpr std::string_view EnginePositionStatus2StrView(
    EnginePositionStatus status) noexcept
{
    return magic_enum::enum_name(status);
}

//-------------------------------------------------------------------------

/**
 * Exposure taken over from a liquidated user. The entry price is the
 * user's original entry so PnL carries over unchanged across the transfer;
 * the bankruptcy price is kept alongside for reference.
 */
struct EnginePosition
{
    EnginePositionId id;
    UserId originalUserId;
    PositionSide side;
    decimal_t size;
    decimal_t originalSize;
    decimal_t entryPrice;
    decimal_t bankruptcyPrice;
    decimal_t leverage;
    decimal_t transferMarkPrice;
    Timestamp transferredAt;
    EnginePositionStatus status{EnginePositionStatus::PENDING};

    [[nodiscard]] decimal_t unrealizedPnL(decimal_t markPrice) const noexcept
    {
        return (markPrice - entryPrice) * size * sign(side);
    }

    void jsonSerialize(
        rapidjson::Document& json, decimal_t markPrice, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::liquidation

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<derivsim::liquidation::EnginePositionStatus>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(derivsim::liquidation::EnginePositionStatus status, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "{}", derivsim::liquidation::EnginePositionStatus2StrView(status));
    }
};

//-------------------------------------------------------------------------
