/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "derivsim/book/Order.hpp"
#include "derivsim/exchange/errors.hpp"

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

enum class LiquidationMethod : uint32_t
{
    ADL
};

//-------------------------------------------------------------------------

struct PlaceOrder
{
    static constexpr std::string_view kType = "place_order";

    UserId userId;
    OrderSide side;
    decimal_t size;
    // Required for limit orders, ignored for market orders.
    std::optional<decimal_t> price;
    book::OrderType orderType = book::OrderType::LIMIT;
    // Defaults to the user's leverage.
    std::optional<decimal_t> leverage;
};

struct CancelOrder
{
    static constexpr std::string_view kType = "cancel_order";

    OrderId orderId;
    // When given, the order must belong to this user.
    std::optional<UserId> userId;
};

struct UpdateMarkPrice
{
    static constexpr std::string_view kType = "update_mark_price";

    decimal_t price;
};

struct DetectLiquidations
{
    static constexpr std::string_view kType = "detect_liquidations";
};

struct ManualLiquidate
{
    static constexpr std::string_view kType = "manual_liquidate";

    UserId userId;
};

struct LiquidationStep
{
    static constexpr std::string_view kType = "liquidation_step";

    LiquidationMethod method = LiquidationMethod::ADL;
};

struct ManualAdjustment
{
    static constexpr std::string_view kType = "manual_adjustment";

    decimal_t amount;
    std::string description;
};

struct SetLiquidationEnabled
{
    static constexpr std::string_view kType = "set_liquidation_enabled";

    bool enabled;
};

struct SetAdlEnabled
{
    static constexpr std::string_view kType = "set_adl_enabled";

    bool enabled;
};

struct ResetState
{
    static constexpr std::string_view kType = "reset_state";
};

struct GetState
{
    static constexpr std::string_view kType = "get_state";
};

struct GetInsuranceFund
{
    static constexpr std::string_view kType = "get_insurance_fund";
};

using Command = std::variant<
    PlaceOrder,
    CancelOrder,
    UpdateMarkPrice,
    DetectLiquidations,
    ManualLiquidate,
    LiquidationStep,
    ManualAdjustment,
    SetLiquidationEnabled,
    SetAdlEnabled,
    ResetState,
    GetState,
    GetInsuranceFund>;

[[nodiscard]] std::string_view commandType(const Command& command) noexcept;

//-------------------------------------------------------------------------

class CommandFactory
{
public:
    /**
     * Builds a command from a Json object of the form {"type": "...", ...}.
     * Throws UnknownCommandError for an unrecognised type and
     * std::invalid_argument for missing or malformed fields.
     */
    [[nodiscard]] static Command fromJson(const rapidjson::Value& json);

private:
    CommandFactory() = default;
};

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
