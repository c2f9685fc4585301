/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/margin/MarginMonitor.hpp"

#include "derivsim/margin/MarginCalculator.hpp"

//-------------------------------------------------------------------------

namespace derivsim::margin
{

//-------------------------------------------------------------------------

MarginMonitor::MarginMonitor(const MarginCallThresholds& thresholds)
    : m_thresholds{thresholds}
{
    if (!(m_thresholds.critical <= m_thresholds.urgent
            && m_thresholds.urgent <= m_thresholds.warning)) {
        throw std::invalid_argument{fmt::format(
            "{}: Margin call thresholds must satisfy critical <= urgent <= warning, got {}/{}/{}",
            std::source_location::current().function_name(),
            m_thresholds.critical,
            m_thresholds.urgent,
            m_thresholds.warning)};
    }
}

//-------------------------------------------------------------------------

std::optional<MarginCallLevel> MarginMonitor::classify(decimal_t marginRatio) const noexcept
{
    if (marginRatio <= m_thresholds.critical) return MarginCallLevel::CRITICAL;
    if (marginRatio <= m_thresholds.urgent) return MarginCallLevel::URGENT;
    if (marginRatio <= m_thresholds.warning) return MarginCallLevel::WARNING;
    return {};
}

//-------------------------------------------------------------------------

std::vector<MarginCall> MarginMonitor::update(
    const position::PositionLedger& ledger,
    const position::UserMap& users,
    decimal_t markPrice,
    Timestamp timestamp)
{
    std::vector<MarginCall> raised;
    std::map<UserId, MarginCall> activeCalls;

    for (const auto& [userId, position] : ledger.positions()) {
        auto userIt = users.find(userId);
        if (userIt == users.end()) continue;
        const auto& user = userIt->second;

        const decimal_t ratio = marginRatio(
            user.availableBalance(), position.unrealizedPnL(markPrice), user.usedMargin());
        const auto level = classify(ratio);
        if (!level) continue;

        MarginCall call{
            .userId = userId,
            .level = *level,
            .marginRatio = ratio,
            .markPrice = markPrice,
            .timestamp = timestamp
        };

        auto prevIt = m_activeCalls.find(userId);
        if (prevIt == m_activeCalls.end() || prevIt->second.level < call.level) {
            logDebug("{} | MARGIN CALL {} FOR {} AT RATIO {}%", timestamp, call.level, userId, ratio);
            raised.push_back(call);
        } else {
            call.timestamp = prevIt->second.timestamp;
        }
        activeCalls.emplace(userId, std::move(call));
    }

    m_activeCalls = std::move(activeCalls);
    return raised;
}

//-------------------------------------------------------------------------

void MarginMonitor::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetArray();
        auto& allocator = json.GetAllocator();
        for (const auto& call : m_activeCalls | views::values) {
            rapidjson::Value callJson{rapidjson::kObjectType};
            callJson.AddMember("userId", rapidjson::Value{call.userId.c_str(), allocator}, allocator);
            callJson.AddMember(
                "level",
                rapidjson::Value{MarginCallLevel2StrView(call.level).data(), allocator},
                allocator);
            callJson.AddMember("marginRatio", json::decimalValue(call.marginRatio), allocator);
            callJson.AddMember("markPrice", json::decimalValue(call.markPrice), allocator);
            callJson.AddMember("timestamp", rapidjson::Value{call.timestamp}, allocator);
            json.PushBack(callJson, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace derivsim::margin

//-------------------------------------------------------------------------
