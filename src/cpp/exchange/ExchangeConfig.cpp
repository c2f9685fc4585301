/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/exchange/ExchangeConfig.hpp"

#include <set>

//-------------------------------------------------------------------------

namespace derivsim::exchange
{

//-------------------------------------------------------------------------

namespace
{

decimal_t decimalAttribute(
    pugi::xml_node node, const char* name, decimal_t defaultValue, std::source_location sl)
{
    const auto attr = node.attribute(name);
    if (!attr) return defaultValue;
    try {
        return util::parseDecimal(attr.as_string());
    }
    catch (const std::invalid_argument&) {
        throw std::invalid_argument{fmt::format(
            "{}: Attribute '{}' of <{}> is not a decimal: '{}'",
            sl.function_name(),
            name,
            node.name(),
            attr.as_string())};
    }
}

decimal_t positiveAttribute(
    pugi::xml_node node, const char* name, decimal_t defaultValue, std::source_location sl)
{
    const decimal_t value = decimalAttribute(node, name, defaultValue, sl);
    if (!(value > 0_dec)) {
        throw std::invalid_argument{fmt::format(
            "{}: Attribute '{}' of <{}> must be positive, was {}",
            sl.function_name(),
            name,
            node.name(),
            value)};
    }
    return value;
}

}  // namespace

//-------------------------------------------------------------------------

ExchangeConfig ExchangeConfig::defaults()
{
    ExchangeConfig config;
    config.users = {
        {.id = "bob", .name = "Bob", .balance = 100'000_dec},
        {.id = "eve", .name = "Eve", .balance = 100'000_dec},
        {.id = "alice", .name = "Alice", .balance = 100'000_dec}
    };
    return config;
}

//-------------------------------------------------------------------------

ExchangeConfig makeExchangeConfig(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    ExchangeConfig config = ExchangeConfig::defaults();

    config.markPrice = positiveAttribute(node, "markPrice", config.markPrice, sl);
    config.indexPrice = positiveAttribute(node, "indexPrice", config.markPrice, sl);
    config.fundingRate = decimalAttribute(node, "fundingRate", config.fundingRate, sl);
    config.insuranceFund = decimalAttribute(node, "insuranceFund", config.insuranceFund, sl);
    config.insuranceFundRiskThreshold = decimalAttribute(
        node, "insuranceFundRiskThreshold", config.insuranceFundRiskThreshold, sl);
    config.liquidationEnabled =
        node.attribute("liquidationEnabled").as_bool(config.liquidationEnabled);
    config.adlEnabled = node.attribute("adlEnabled").as_bool(config.adlEnabled);
    config.strictInvariants = node.attribute("strictInvariants").as_bool(config.strictInvariants);
    config.tradeHistory = node.attribute("tradeHistory").as_ullong(config.tradeHistory);
    config.bookDepth = node.attribute("bookDepth").as_ullong(config.bookDepth);
    config.historyCapacity = node.attribute("historyCapacity").as_ullong(config.historyCapacity);

    if (config.tradeHistory == 0 || config.bookDepth == 0 || config.historyCapacity == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: 'tradeHistory', 'bookDepth' and 'historyCapacity' must be positive, "
            "were {}, {} and {}",
            sl.function_name(),
            config.tradeHistory,
            config.bookDepth,
            config.historyCapacity)};
    }

    if (pugi::xml_node riskNode = node.child("RiskLimits")) {
        auto& limits = config.riskLimits;
        limits.maxPositionSize =
            positiveAttribute(riskNode, "maxPositionSize", limits.maxPositionSize, sl);
        limits.maxLeverage = positiveAttribute(riskNode, "maxLeverage", limits.maxLeverage, sl);
        limits.maxPositionValue =
            positiveAttribute(riskNode, "maxPositionValue", limits.maxPositionValue, sl);
        limits.maxUserPositions =
            riskNode.attribute("maxUserPositions").as_uint(limits.maxUserPositions);
        limits.minOrderSize = positiveAttribute(riskNode, "minOrderSize", limits.minOrderSize, sl);
        if (limits.maxUserPositions != 1) {
            throw std::invalid_argument{fmt::format(
                "{}: Only one-way mode is supported, 'maxUserPositions' must be 1, was {}",
                sl.function_name(),
                limits.maxUserPositions)};
        }
        if (limits.maxLeverage < 1_dec) {
            throw std::invalid_argument{fmt::format(
                "{}: 'maxLeverage' must be at least 1, was {}",
                sl.function_name(),
                limits.maxLeverage)};
        }
    }

    config.defaultLeverage = positiveAttribute(node, "defaultLeverage", config.defaultLeverage, sl);
    if (config.defaultLeverage < 1_dec || config.defaultLeverage > config.riskLimits.maxLeverage) {
        throw std::invalid_argument{fmt::format(
            "{}: 'defaultLeverage' {} outside of [1, {}]",
            sl.function_name(),
            config.defaultLeverage,
            config.riskLimits.maxLeverage)};
    }

    if (pugi::xml_node callsNode = node.child("MarginCalls")) {
        auto& calls = config.marginCalls;
        calls.warning = positiveAttribute(callsNode, "warning", calls.warning, sl);
        calls.urgent = positiveAttribute(callsNode, "urgent", calls.urgent, sl);
        calls.critical = positiveAttribute(callsNode, "critical", calls.critical, sl);
    }

    if (pugi::xml_node usersNode = node.child("Users")) {
        config.users.clear();
        std::set<UserId> seen;
        for (pugi::xml_node userNode : usersNode.children("User")) {
            UserConfig user{
                .id = userNode.attribute("id").as_string(),
                .name = userNode.attribute("name").as_string(),
                .balance = decimalAttribute(userNode, "balance", 0_dec, sl)
            };
            if (user.id.empty()) {
                throw std::invalid_argument{fmt::format(
                    "{}: <User> is missing attribute 'id'", sl.function_name())};
            }
            if (!seen.insert(user.id).second) {
                throw std::invalid_argument{fmt::format(
                    "{}: Duplicate user id '{}'", sl.function_name(), user.id)};
            }
            if (user.balance < 0_dec) {
                throw std::invalid_argument{fmt::format(
                    "{}: Balance of user '{}' cannot be negative, was {}",
                    sl.function_name(),
                    user.id,
                    user.balance)};
            }
            if (user.name.empty()) {
                user.name = user.id;
            }
            config.users.push_back(std::move(user));
        }
    }

    return config;
}

//-------------------------------------------------------------------------

ExchangeConfig loadExchangeConfig(const fs::path& path)
{
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Error parsing config file '{}': {}",
            std::source_location::current().function_name(),
            path.c_str(),
            result.description())};
    }
    pugi::xml_node node = doc.child("Exchange");
    if (!node) {
        throw std::invalid_argument{fmt::format(
            "{}: Config file '{}' has no <Exchange> root node",
            std::source_location::current().function_name(),
            path.c_str())};
    }
    return makeExchangeConfig(node);
}

//-------------------------------------------------------------------------

}  // namespace derivsim::exchange

//-------------------------------------------------------------------------
