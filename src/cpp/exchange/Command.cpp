/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/exchange/Command.hpp"

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

namespace
{

const rapidjson::Value& requireMember(const rapidjson::Value& json, const char* name)
{
    if (!json.HasMember(name) || json[name].IsNull()) {
        throw std::invalid_argument{fmt::format(
            "{}: Missing field '{}'",
            std::source_location::current().function_name(), name)};
    }
    return json[name];
}

std::string getString(const rapidjson::Value& json, const char* name)
{
    const auto& member = requireMember(json, name);
    if (!member.IsString()) {
        throw std::invalid_argument{fmt::format(
            "{}: Field '{}' must be a string, got {}",
            std::source_location::current().function_name(), name, json::json2str(member))};
    }
    return member.GetString();
}

bool getBool(const rapidjson::Value& json, const char* name)
{
    const auto& member = requireMember(json, name);
    if (!member.IsBool()) {
        throw std::invalid_argument{fmt::format(
            "{}: Field '{}' must be a boolean, got {}",
            std::source_location::current().function_name(), name, json::json2str(member))};
    }
    return member.GetBool();
}

decimal_t getDecimal(const rapidjson::Value& json, const char* name)
{
    return json::getDecimal(requireMember(json, name));
}

std::optional<decimal_t> getOptionalDecimal(const rapidjson::Value& json, const char* name)
{
    if (!json.HasMember(name) || json[name].IsNull()) return {};
    return json::getDecimal(json[name]);
}

template<typename E>
E getEnum(const rapidjson::Value& json, const char* name)
{
    const auto str = getString(json, name);
    const auto value = magic_enum::enum_cast<E>(str, magic_enum::case_insensitive);
    if (!value) {
        throw std::invalid_argument{fmt::format(
            "{}: Invalid value '{}' for field '{}'",
            std::source_location::current().function_name(), str, name)};
    }
    return *value;
}

}  // namespace

//-------------------------------------------------------------------------

std::string_view commandType(const Command& command) noexcept
{
    return std::visit(
        [](const auto& cmd) { return std::remove_cvref_t<decltype(cmd)>::kType; }, command);
}

//-------------------------------------------------------------------------

Command CommandFactory::fromJson(const rapidjson::Value& json)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!json.IsObject()) {
        throw std::invalid_argument{fmt::format(
            "{}: Command must be a Json object, got {}", ctx, json::json2str(json))};
    }

    const std::string type = getString(json, "type");

    if (type == PlaceOrder::kType) {
        PlaceOrder cmd{
            .userId = getString(json, "userId"),
            .side = getEnum<OrderSide>(json, "side"),
            .size = getDecimal(json, "size"),
            .price = getOptionalDecimal(json, "price"),
            .orderType = json.HasMember("orderType")
                ? getEnum<book::OrderType>(json, "orderType")
                : book::OrderType::LIMIT,
            .leverage = getOptionalDecimal(json, "leverage")
        };
        return cmd;
    }
    else if (type == CancelOrder::kType) {
        const auto orderId = json::getUint(requireMember(json, "orderId"));
        if (orderId > std::numeric_limits<OrderId>::max()) {
            throw std::invalid_argument{fmt::format("{}: Order id {} out of range", ctx, orderId)};
        }
        return CancelOrder{
            .orderId = static_cast<OrderId>(orderId),
            .userId = json.HasMember("userId") && json["userId"].IsString()
                ? std::make_optional<UserId>(json["userId"].GetString())
                : std::nullopt
        };
    }
    else if (type == UpdateMarkPrice::kType) {
        return UpdateMarkPrice{.price = getDecimal(json, "price")};
    }
    else if (type == DetectLiquidations::kType) {
        return DetectLiquidations{};
    }
    else if (type == ManualLiquidate::kType) {
        return ManualLiquidate{.userId = getString(json, "userId")};
    }
    else if (type == LiquidationStep::kType) {
        return LiquidationStep{
            .method = json.HasMember("method")
                ? getEnum<LiquidationMethod>(json, "method")
                : LiquidationMethod::ADL
        };
    }
    else if (type == ManualAdjustment::kType) {
        return ManualAdjustment{
            .amount = getDecimal(json, "amount"),
            .description = json.HasMember("description") && json["description"].IsString()
                ? json["description"].GetString()
                : ""
        };
    }
    else if (type == SetLiquidationEnabled::kType) {
        return SetLiquidationEnabled{.enabled = getBool(json, "enabled")};
    }
    else if (type == SetAdlEnabled::kType) {
        return SetAdlEnabled{.enabled = getBool(json, "enabled")};
    }
    else if (type == ResetState::kType) {
        return ResetState{};
    }
    else if (type == GetState::kType) {
        return GetState{};
    }
    else if (type == GetInsuranceFund::kType) {
        return GetInsuranceFund{};
    }

    throw UnknownCommandError{fmt::format("{}: Unknown command type '{}'", ctx, type)};
}

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
